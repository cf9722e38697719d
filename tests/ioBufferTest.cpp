// sandftpd is a server implementation based on the following:
// - RFC  959 (https://tools.ietf.org/html/rfc959)
// - RFC 3659 (https://tools.ietf.org/html/rfc3659)
// - suggested implementation details from https://cr.yp.to/ftp/filesystem.html
//
// Copyright (C) 2024 Michael Theall
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include "ioBuffer.h"

#include <gtest/gtest.h>

#include <cstring>

TEST (IOBufferTest, AppendAndConsume)
{
	IOBuffer buffer (8);
	EXPECT_TRUE (buffer.empty ());
	EXPECT_EQ (buffer.capacity (), 8u);

	EXPECT_TRUE (buffer.append ("hello"));
	EXPECT_EQ (buffer.usedView (), "hello");
	EXPECT_EQ (buffer.freeSize (), 3u);

	EXPECT_FALSE (buffer.append ("world"));
	EXPECT_EQ (buffer.usedView (), "hello");

	buffer.markFree (2);
	EXPECT_EQ (buffer.usedView (), "llo");
}

TEST (IOBufferTest, DrainingRewinds)
{
	IOBuffer buffer (4);
	ASSERT_TRUE (buffer.append ("abcd"));
	EXPECT_EQ (buffer.freeSize (), 0u);

	buffer.markFree (4);
	EXPECT_TRUE (buffer.empty ());
	EXPECT_EQ (buffer.freeSize (), 4u);
}

TEST (IOBufferTest, CoalesceMovesDataToFront)
{
	IOBuffer buffer (6);
	ASSERT_TRUE (buffer.append ("abcdef"));
	buffer.markFree (4);
	EXPECT_EQ (buffer.freeSize (), 0u);

	buffer.coalesce ();
	EXPECT_EQ (buffer.usedView (), "ef");
	EXPECT_EQ (buffer.freeSize (), 4u);

	std::memcpy (buffer.freeArea (), "gh", 2);
	buffer.markUsed (2);
	EXPECT_EQ (buffer.usedView (), "efgh");
}

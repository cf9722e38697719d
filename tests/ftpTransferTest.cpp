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

#include "ftpTransfer.h"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <ctime>
#include <string>
#include <string_view>

namespace
{
struct stat makeStat (mode_t const mode_, off_t const size_, std::time_t const mtime_)
{
	struct stat st = {};
	st.st_mode     = mode_;
	st.st_size     = size_;
	st.st_mtime    = mtime_;
	return st;
}

/// \brief 2023-11-14 22:13:20 UTC
constexpr std::time_t SAMPLE_TIME = 1700000000;

std::string encode (AsciiEncoder &encoder_, std::string_view const in_)
{
	IOBuffer out (2 * in_.size () + 1);
	EXPECT_TRUE (encoder_.convert (in_, out));
	return std::string (out.usedView ());
}

std::string decode (AsciiDecoder &decoder_, std::string_view const in_)
{
	IOBuffer out (in_.size () + 1);
	EXPECT_TRUE (decoder_.convert (in_, out));
	return std::string (out.usedView ());
}
}

TEST (ListFormatTest, LongDirectory)
{
	auto const st = makeStat (S_IFDIR | 0755, 4096, 0);
	EXPECT_EQ (formatListLine (st, "sub"), "drwxr-xr-x 1 ftp ftp 4096 01 Jan 1970 00:00 sub");
}

TEST (ListFormatTest, LongFile)
{
	auto const st = makeStat (S_IFREG | 0644, 12, SAMPLE_TIME);
	EXPECT_EQ (formatListLine (st, "a.txt"), "-rw-r--r-- 1 ftp ftp 12 14 Nov 2023 22:13 a.txt");
}

TEST (ListFormatTest, LongSymlink)
{
	auto const st   = makeStat (S_IFLNK | 0777, 3, SAMPLE_TIME);
	auto const line = formatListLine (st, "link");
	ASSERT_FALSE (line.empty ());
	EXPECT_EQ (line.front (), 'l');
}

TEST (ListFormatTest, FactsForFile)
{
	auto const st = makeStat (S_IFREG | 0644, 12, SAMPLE_TIME);
	EXPECT_EQ (formatFacts (st), "type=file;size=12;modify=20231114221320;perm=adfrw;");
}

TEST (ListFormatTest, FactsForDirectory)
{
	auto const st = makeStat (S_IFDIR | 0755, 4096, SAMPLE_TIME);
	EXPECT_EQ (formatFacts (st), "type=dir;size=4096;modify=20231114221320;perm=cdeflmp;");
}

TEST (ListFormatTest, FactsForReadOnlyFile)
{
	auto const st = makeStat (S_IFREG | 0444, 1, SAMPLE_TIME);
	EXPECT_EQ (formatFacts (st), "type=file;size=1;modify=20231114221320;perm=dfr;");
}

TEST (ListFormatTest, EntryFormats)
{
	auto const st = makeStat (S_IFREG | 0644, 12, SAMPLE_TIME);

	EXPECT_EQ (formatEntry (ListFormat::Names, st, "a.txt"), "a.txt");
	EXPECT_EQ (formatEntry (ListFormat::Facts, st, "a.txt"), formatFacts (st) + " a.txt");
	EXPECT_EQ (formatEntry (ListFormat::Long, st, "a.txt"), formatListLine (st, "a.txt"));
	EXPECT_EQ (formatEntry (ListFormat::Names, st, "odd\nname"), std::string ("odd\0name", 8));
}

TEST (AsciiTest, EncoderAddsCarriageReturns)
{
	AsciiEncoder encoder;
	EXPECT_EQ (encode (encoder, "a\nb\r\nc"), "a\r\nb\r\nc");
}

TEST (AsciiTest, EncoderCarriesStateAcrossChunks)
{
	AsciiEncoder encoder;
	EXPECT_EQ (encode (encoder, "a\r"), "a\r");
	EXPECT_EQ (encode (encoder, "\nb\n"), "\nb\r\n");
}

TEST (AsciiTest, EncoderRefusesSmallBuffer)
{
	AsciiEncoder encoder;
	IOBuffer out (3);
	EXPECT_FALSE (encoder.convert ("\n\n", out));
}

TEST (AsciiTest, DecoderStripsCarriageReturns)
{
	AsciiDecoder decoder;
	EXPECT_EQ (decode (decoder, "a\r\nb\r\n"), "a\nb\n");
}

TEST (AsciiTest, DecoderKeepsLoneCarriageReturn)
{
	AsciiDecoder decoder;
	EXPECT_EQ (decode (decoder, "a\rb"), "a\rb");
}

TEST (AsciiTest, DecoderCarriesStateAcrossChunks)
{
	AsciiDecoder decoder;
	EXPECT_EQ (decode (decoder, "a\r"), "a");
	EXPECT_EQ (decode (decoder, "\nb"), "\nb");
}

TEST (AsciiTest, DecoderFlushesTrailingCarriageReturn)
{
	AsciiDecoder decoder;
	EXPECT_EQ (decode (decoder, "end\r"), "end");

	IOBuffer out (4);
	ASSERT_TRUE (decoder.finish (out));
	EXPECT_EQ (out.usedView (), "\r");

	out.clear ();
	ASSERT_TRUE (decoder.finish (out));
	EXPECT_TRUE (out.empty ());
}

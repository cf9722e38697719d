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

#include "sessionRegistry.h"

#include "log.h"
#include "testUtil.h"

#include <gtest/gtest.h>

#include <memory>

namespace
{
/// \brief Connected pair of loopback sockets
struct SocketPair
{
	SharedSocket server;
	UniqueSocket client;
};

SocketPair connectPair ()
{
	SocketPair pair;

	auto listener = Socket::create ();
	if (!listener)
		return pair;

	SockAddr addr;
	if (!SockAddr::parse ("127.0.0.1", 0, addr) || !listener->bind (addr) || !listener->listen (1))
		return pair;

	pair.client = Socket::create ();
	if (!pair.client || !pair.client->connect (listener->sockName ()))
		return pair;

	pair.server = listener->accept ();
	return pair;
}
}

TEST (SessionRegistryTest, AddAndRemove)
{
	SessionRegistry registry;
	EXPECT_TRUE (registry.empty ());

	auto const first  = CancelToken::create ();
	auto const second = CancelToken::create ();
	registry.add (1, first, nullptr);
	registry.add (2, second, nullptr);
	EXPECT_EQ (registry.size (), 2u);

	registry.remove (1);
	EXPECT_EQ (registry.size (), 1u);

	registry.remove (1);
	EXPECT_EQ (registry.size (), 1u);

	registry.remove (2);
	EXPECT_TRUE (registry.empty ());
}

TEST (SessionRegistryTest, CancelAllReachesEverySession)
{
	SessionRegistry registry;

	auto const first  = CancelToken::create ();
	auto const second = CancelToken::create ();
	registry.add (1, first, nullptr);
	registry.add (2, second, nullptr);

	EXPECT_FALSE (first->cancelled ());
	registry.cancelAll ();
	EXPECT_TRUE (first->cancelled ());
	EXPECT_TRUE (second->cancelled ());
}

TEST (SessionRegistryTest, RegistryDoesNotOwnSockets)
{
	setLogEcho (false);

	auto pair = connectPair ();
	ASSERT_TRUE (pair.server);
	ASSERT_TRUE (pair.client);

	SessionRegistry registry;
	registry.add (1, CancelToken::create (), pair.server);

	std::weak_ptr<Socket> const weak = pair.server;
	pair.server.reset ();
	EXPECT_TRUE (weak.expired ());

	EXPECT_EQ (registry.forceClose (), 0u);
}

TEST (SessionRegistryTest, ForceCloseShutsDownSockets)
{
	setLogEcho (false);

	auto pair = connectPair ();
	ASSERT_TRUE (pair.server);
	ASSERT_TRUE (pair.client);

	auto const cancel = CancelToken::create ();

	SessionRegistry registry;
	registry.add (7, cancel, pair.server);
	EXPECT_EQ (registry.forceClose (), 1u);
	EXPECT_TRUE (cancel->cancelled ());

	// the peer sees an orderly end of stream
	EXPECT_EQ (recvAll (*pair.client), "");
}

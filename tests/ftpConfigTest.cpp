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

#include "ftpConfig.h"

#include "log.h"
#include "testUtil.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
using namespace std::chrono_literals;

class FtpConfigTest : public ::testing::Test
{
protected:
	void SetUp () override
	{
		setLogEcho (false);
		m_config = FtpConfig::create ();
		ASSERT_NE (m_config, nullptr);
	}

	UniqueFtpConfig m_config;
};

TEST_F (FtpConfigTest, Defaults)
{
	EXPECT_EQ (m_config->port (), 2121);
	EXPECT_TRUE (m_config->bindAddress ().isWildcard ());
	EXPECT_EQ (m_config->bindAddress ().port (), 2121);
	EXPECT_EQ (m_config->sandboxRoot (), ".");
	EXPECT_TRUE (m_config->user ().empty ());
	EXPECT_TRUE (m_config->pass ().empty ());
	EXPECT_TRUE (m_config->allowEmptyPassword ());
	EXPECT_EQ (m_config->shutdownGracePeriod (), 5s);
	EXPECT_EQ (m_config->dataTimeout (), 30s);
	EXPECT_NE (m_config->eventSink (), nullptr);
}

TEST_F (FtpConfigTest, ParsesKnownKeys)
{
	EXPECT_TRUE (m_config->parseLine ("bind_address = 127.0.0.1"));
	EXPECT_TRUE (m_config->parseLine ("port=2200"));
	EXPECT_TRUE (m_config->parseLine ("sandbox_root=/srv/ftp"));
	EXPECT_TRUE (m_config->parseLine ("user=alice"));
	EXPECT_TRUE (m_config->parseLine ("pass=secret"));
	EXPECT_TRUE (m_config->parseLine ("allow_empty_password=0"));
	EXPECT_TRUE (m_config->parseLine ("shutdown_grace_period=2"));
	EXPECT_TRUE (m_config->parseLine ("data_timeout=7"));

	EXPECT_STREQ (m_config->bindAddress ().name (), "127.0.0.1");
	EXPECT_EQ (m_config->bindAddress ().port (), 2200);
	EXPECT_EQ (m_config->sandboxRoot (), "/srv/ftp");
	EXPECT_EQ (m_config->user (), "alice");
	EXPECT_EQ (m_config->pass (), "secret");
	EXPECT_FALSE (m_config->allowEmptyPassword ());
	EXPECT_EQ (m_config->shutdownGracePeriod (), 2s);
	EXPECT_EQ (m_config->dataTimeout (), 7s);
}

TEST_F (FtpConfigTest, IgnoresBadLines)
{
	EXPECT_FALSE (m_config->parseLine (""));
	EXPECT_FALSE (m_config->parseLine ("# port=1"));
	EXPECT_FALSE (m_config->parseLine ("port"));
	EXPECT_FALSE (m_config->parseLine ("port=abc"));
	EXPECT_FALSE (m_config->parseLine ("port=70000"));
	EXPECT_FALSE (m_config->parseLine ("bind_address=ftp.example.com"));
	EXPECT_FALSE (m_config->parseLine ("allow_empty_password=yes"));
	EXPECT_FALSE (m_config->parseLine ("data_timeout=0"));
	EXPECT_FALSE (m_config->parseLine ("sandbox_root="));
	EXPECT_FALSE (m_config->parseLine ("colour=blue"));

	EXPECT_EQ (m_config->port (), 2121);
	EXPECT_TRUE (m_config->allowEmptyPassword ());
	EXPECT_EQ (m_config->sandboxRoot (), ".");
}

TEST_F (FtpConfigTest, AnyCredentialsByDefault)
{
	EXPECT_TRUE (m_config->acceptsCredentials ("anon", ""));
	EXPECT_TRUE (m_config->acceptsCredentials ("bob", "whatever"));
}

TEST_F (FtpConfigTest, ConfiguredCredentials)
{
	m_config->setUser ("alice");
	m_config->setPass ("secret");
	m_config->setAllowEmptyPassword (false);

	EXPECT_TRUE (m_config->acceptsCredentials ("alice", "secret"));
	EXPECT_FALSE (m_config->acceptsCredentials ("alice", "wrong"));
	EXPECT_FALSE (m_config->acceptsCredentials ("alice", ""));
	EXPECT_FALSE (m_config->acceptsCredentials ("bob", "secret"));
}

TEST_F (FtpConfigTest, ConfiguredPasswordOverridesEmptyOption)
{
	m_config->setUser ("alice");
	m_config->setPass ("secret");
	ASSERT_TRUE (m_config->allowEmptyPassword ());

	EXPECT_FALSE (m_config->acceptsCredentials ("alice", ""));
	EXPECT_TRUE (m_config->acceptsCredentials ("alice", "secret"));
}

TEST_F (FtpConfigTest, EmptyPasswordOption)
{
	m_config->setAllowEmptyPassword (false);
	EXPECT_FALSE (m_config->acceptsCredentials ("anon", ""));
	EXPECT_TRUE (m_config->acceptsCredentials ("anon", "x"));

	m_config->setAllowEmptyPassword (true);
	EXPECT_TRUE (m_config->acceptsCredentials ("anon", ""));
}

TEST_F (FtpConfigTest, SaveThenLoad)
{
	TempDir dir;
	auto const path = dir.entry ("nested/dir/sandftpd.cfg");

	ASSERT_TRUE (m_config->setBindAddress ("127.0.0.1"));
	m_config->setPort (std::uint16_t{2200});
	m_config->setSandboxRoot ("/srv/ftp");
	m_config->setUser ("alice");
	m_config->setPass ("secret");
	m_config->setAllowEmptyPassword (false);
	m_config->setShutdownGracePeriod (3s);
	m_config->setDataTimeout (9s);
	ASSERT_TRUE (m_config->save (path.c_str ()));

	auto const loaded = FtpConfig::load (path.c_str ());
	ASSERT_NE (loaded, nullptr);
	EXPECT_STREQ (loaded->bindAddress ().name (), "127.0.0.1");
	EXPECT_EQ (loaded->port (), 2200);
	EXPECT_EQ (loaded->sandboxRoot (), "/srv/ftp");
	EXPECT_EQ (loaded->user (), "alice");
	EXPECT_EQ (loaded->pass (), "secret");
	EXPECT_FALSE (loaded->allowEmptyPassword ());
	EXPECT_EQ (loaded->shutdownGracePeriod (), 3s);
	EXPECT_EQ (loaded->dataTimeout (), 9s);
}

TEST_F (FtpConfigTest, MissingFileGivesDefaults)
{
	TempDir dir;
	auto const loaded = FtpConfig::load (dir.entry ("absent.cfg").c_str ());
	ASSERT_NE (loaded, nullptr);
	EXPECT_EQ (loaded->port (), 2121);
}

TEST_F (FtpConfigTest, NullSinkFallsBack)
{
	m_config->setEventSink (nullptr);
	EXPECT_NE (m_config->eventSink (), nullptr);
}

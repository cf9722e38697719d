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

#include "fs.h"
#include "log.h"

#include <gsl/pointers>
#include <gsl/util>

#include <arpa/inet.h>
#include <sys/stat.h>
using stat_t = struct stat;

#include <cerrno>
#include <charconv>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace
{
constexpr std::uint16_t DEFAULT_PORT = 2121;

constexpr auto DEFAULT_SHUTDOWN_GRACE_PERIOD = std::chrono::seconds (5);
constexpr auto DEFAULT_DATA_TIMEOUT          = std::chrono::seconds (30);

bool mkdirParent (std::string_view const path_)
{
	auto pos = path_.find_first_of ('/');
	while (pos != std::string::npos)
	{
		// skip the root of an absolute path
		if (pos == 0)
		{
			pos = path_.find_first_of ('/', 1);
			continue;
		}

		auto const dir = std::string (path_.substr (0, pos));

		stat_t st{};
		auto const rc = ::stat (dir.c_str (), &st);
		if (rc < 0 && errno != ENOENT)
			return false;

		if (rc < 0 && errno == ENOENT)
		{
			auto const rc = ::mkdir (dir.c_str (), 0755);
			if (rc < 0)
				return false;
		}

		pos = path_.find_first_of ('/', pos + 1);
	}

	return true;
}

std::string_view strip (std::string_view const str_)
{
	auto const start = str_.find_first_not_of (" \t");
	if (start == std::string::npos)
		return {};

	auto const end = str_.find_last_not_of (" \t");
	if (end == std::string::npos)
		return str_.substr (start);

	return str_.substr (start, end + 1 - start);
}

template <typename T>
bool parseInt (T &out_, std::string_view const val_)
{
	auto const rc = std::from_chars (val_.data (), val_.data () + val_.size (), out_);
	if (rc.ec != std::errc{})
	{
		errno = static_cast<int> (rc.ec);
		return false;
	}

	if (rc.ptr != val_.data () + val_.size ())
	{
		errno = EINVAL;
		return false;
	}

	return true;
}

bool parseBool (bool &out_, std::string_view const val_)
{
	if (val_ == "0")
		out_ = false;
	else if (val_ == "1")
		out_ = true;
	else
	{
		errno = EINVAL;
		return false;
	}

	return true;
}

bool parseSeconds (std::chrono::milliseconds &out_, std::string_view const val_)
{
	unsigned seconds;
	if (!parseInt (seconds, val_))
		return false;

	out_ = std::chrono::seconds (seconds);
	return true;
}
}

///////////////////////////////////////////////////////////////////////////
FtpConfig::~FtpConfig () = default;

FtpConfig::FtpConfig ()
    : m_port (DEFAULT_PORT),
      m_shutdownGracePeriod (DEFAULT_SHUTDOWN_GRACE_PERIOD),
      m_dataTimeout (DEFAULT_DATA_TIMEOUT),
      m_eventSink (FtpEventSink::create ())
{
	struct sockaddr_in addr = {};
	addr.sin_family         = AF_INET;
	addr.sin_addr.s_addr    = htonl (INADDR_ANY);
	m_bindAddress           = addr;
}

UniqueFtpConfig FtpConfig::create ()
{
	return UniqueFtpConfig (new FtpConfig ());
}

UniqueFtpConfig FtpConfig::load (gsl::not_null<gsl::czstring> const path_)
{
	auto config = create ();

	auto fp = fs::File ();
	if (!fp.open (path_))
	{
		info ("No config at %s, using defaults\n", path_.get ());
		return config;
	}

	std::string_view line;
	while (!(line = fp.readLine ()).empty ())
		config->parseLine (line);

	return config;
}

bool FtpConfig::parseLine (std::string_view const line_)
{
	auto const ignore = [line_] () {
		error ("Ignoring '%.*s'\n", gsl::narrow_cast<int> (line_.size ()), line_.data ());
		return false;
	};

	auto const stripped = strip (line_);
	if (stripped.empty () || stripped.front () == '#')
		return false;

	auto const pos = stripped.find_first_of ('=');
	if (pos == std::string_view::npos)
		return ignore ();

	auto const key = strip (stripped.substr (0, pos));
	auto const val = strip (stripped.substr (pos + 1));
	if (key.empty ())
		return ignore ();

	bool ok = true;
	if (key == "bind_address")
		ok = setBindAddress (val);
	else if (key == "port")
		ok = setPort (val);
	else if (key == "sandbox_root")
	{
		if (val.empty ())
			ok = false;
		else
			setSandboxRoot (std::string (val));
	}
	else if (key == "user")
		setUser (std::string (val));
	else if (key == "pass")
		setPass (std::string (val));
	else if (key == "allow_empty_password")
		ok = parseBool (m_allowEmptyPassword, val);
	else if (key == "shutdown_grace_period")
		ok = parseSeconds (m_shutdownGracePeriod, val);
	else if (key == "data_timeout")
		ok = parseSeconds (m_dataTimeout, val) && m_dataTimeout.count () > 0;
	else
		ok = false;

	if (!ok)
		return ignore ();

	return true;
}

bool FtpConfig::save (gsl::not_null<gsl::czstring> const path_) const
{
	if (!mkdirParent (path_.get ()))
	{
		error ("mkdir: %s\n", std::strerror (errno));
		return false;
	}

	auto fp = fs::File ();
	if (!fp.open (path_, "wb"))
	{
		error ("fopen(%s): %s\n", path_.get (), std::strerror (errno));
		return false;
	}

	(void)std::fprintf (fp, "bind_address=%s\n", m_bindAddress.name ());
	(void)std::fprintf (fp, "port=%u\n", m_port);
	(void)std::fprintf (fp, "sandbox_root=%s\n", m_sandboxRoot.c_str ());
	if (!m_user.empty ())
		(void)std::fprintf (fp, "user=%s\n", m_user.c_str ());
	if (!m_pass.empty ())
		(void)std::fprintf (fp, "pass=%s\n", m_pass.c_str ());
	(void)std::fprintf (fp, "allow_empty_password=%u\n", m_allowEmptyPassword);
	(void)std::fprintf (fp,
	    "shutdown_grace_period=%" PRIdMAX "\n",
	    static_cast<std::intmax_t> (
	        std::chrono::duration_cast<std::chrono::seconds> (m_shutdownGracePeriod).count ()));
	(void)std::fprintf (fp,
	    "data_timeout=%" PRIdMAX "\n",
	    static_cast<std::intmax_t> (
	        std::chrono::duration_cast<std::chrono::seconds> (m_dataTimeout).count ()));

	if (std::fflush (fp) != 0)
	{
		error ("fflush: %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

bool FtpConfig::acceptsCredentials (std::string_view const user_,
    std::string_view const pass_) const
{
	if (!m_user.empty () && user_ != m_user)
		return false;

	// a configured password always has to match
	if (!m_pass.empty ())
		return pass_ == m_pass;

	return !pass_.empty () || m_allowEmptyPassword;
}

SockAddr FtpConfig::bindAddress () const
{
	auto addr = m_bindAddress;
	addr.setPort (m_port);
	return addr;
}

std::uint16_t FtpConfig::port () const
{
	return m_port;
}

std::string const &FtpConfig::sandboxRoot () const
{
	return m_sandboxRoot;
}

std::string const &FtpConfig::user () const
{
	return m_user;
}

std::string const &FtpConfig::pass () const
{
	return m_pass;
}

bool FtpConfig::allowEmptyPassword () const
{
	return m_allowEmptyPassword;
}

std::chrono::milliseconds FtpConfig::shutdownGracePeriod () const
{
	return m_shutdownGracePeriod;
}

std::chrono::milliseconds FtpConfig::dataTimeout () const
{
	return m_dataTimeout;
}

SharedFtpEventSink const &FtpConfig::eventSink () const
{
	return m_eventSink;
}

bool FtpConfig::setBindAddress (std::string_view const addr_)
{
	return SockAddr::parse (addr_, 0, m_bindAddress);
}

bool FtpConfig::setPort (std::string_view const port_)
{
	std::uint16_t parsed{};
	if (!parseInt (parsed, port_))
		return false;

	setPort (parsed);
	return true;
}

void FtpConfig::setPort (std::uint16_t const port_)
{
	m_port = port_;
}

void FtpConfig::setSandboxRoot (std::string root_)
{
	m_sandboxRoot = std::move (root_);
}

void FtpConfig::setUser (std::string user_)
{
	m_user = std::move (user_);
}

void FtpConfig::setPass (std::string pass_)
{
	m_pass = std::move (pass_);
}

void FtpConfig::setAllowEmptyPassword (bool const allow_)
{
	m_allowEmptyPassword = allow_;
}

void FtpConfig::setShutdownGracePeriod (std::chrono::milliseconds const period_)
{
	m_shutdownGracePeriod = period_;
}

void FtpConfig::setDataTimeout (std::chrono::milliseconds const timeout_)
{
	m_dataTimeout = timeout_;
}

void FtpConfig::setEventSink (SharedFtpEventSink sink_)
{
	// null falls back to the logging sink
	m_eventSink = sink_ ? std::move (sink_) : FtpEventSink::create ();
}

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

#pragma once

#include "ftpEvents.h"
#include "sockAddr.h"

#include <gsl/gsl>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

class FtpConfig;
using UniqueFtpConfig = std::unique_ptr<FtpConfig>;

/// \brief FTP config
/// \note Read-only once handed to FtpServer
class FtpConfig
{
public:
	~FtpConfig ();

	/// \brief Create config
	static UniqueFtpConfig create ();

	/// \brief Load config
	/// \param path_ Path to config file
	/// \note Missing file yields the defaults
	static UniqueFtpConfig load (gsl::not_null<gsl::czstring> path_);

	/// \brief Parse one "key=value" line
	/// \param line_ Line to parse
	/// \returns false if the line was ignored
	bool parseLine (std::string_view line_);

	/// \brief Save config
	/// \param path_ Path to config file
	bool save (gsl::not_null<gsl::czstring> path_) const;

	/// \brief Whether a user/password pair may log in
	/// \param user_ User name sent with USER
	/// \param pass_ Password sent with PASS
	bool acceptsCredentials (std::string_view user_, std::string_view pass_) const;

	/// \brief Listen address, including port
	SockAddr bindAddress () const;

	/// \brief Get port
	std::uint16_t port () const;

	/// \brief Served directory
	std::string const &sandboxRoot () const;

	/// \brief Get user
	std::string const &user () const;

	/// \brief Get password
	std::string const &pass () const;

	/// \brief Whether an empty password is accepted
	bool allowEmptyPassword () const;

	/// \brief How long shutdown waits for sessions before forcing them closed
	std::chrono::milliseconds shutdownGracePeriod () const;

	/// \brief How long to wait on a data connection
	std::chrono::milliseconds dataTimeout () const;

	/// \brief Event sink
	SharedFtpEventSink const &eventSink () const;

	/// \brief Set listen address
	/// \param addr_ Dotted-quad IPv4 address
	bool setBindAddress (std::string_view addr_);

	/// \brief Set listen port
	/// \param port_ Listen port
	bool setPort (std::string_view port_);

	/// \brief Set listen port
	/// \param port_ Listen port
	void setPort (std::uint16_t port_);

	/// \brief Set served directory
	/// \param root_ Directory path
	void setSandboxRoot (std::string root_);

	/// \brief Set user
	/// \param user_ User
	void setUser (std::string user_);

	/// \brief Set password
	/// \param pass_ Password
	void setPass (std::string pass_);

	/// \brief Set whether an empty password is accepted
	/// \param allow_ Whether to accept
	void setAllowEmptyPassword (bool allow_);

	/// \brief Set shutdown grace period
	/// \param period_ Grace period
	void setShutdownGracePeriod (std::chrono::milliseconds period_);

	/// \brief Set data connection timeout
	/// \param timeout_ Timeout
	void setDataTimeout (std::chrono::milliseconds timeout_);

	/// \brief Set event sink
	/// \param sink_ Event sink
	void setEventSink (SharedFtpEventSink sink_);

private:
	FtpConfig ();

	/// \brief Listen address
	SockAddr m_bindAddress;

	/// \brief Listen port
	std::uint16_t m_port;

	/// \brief Served directory
	std::string m_sandboxRoot = ".";

	/// \brief Username
	std::string m_user;

	/// \brief Password
	std::string m_pass;

	/// \brief Whether an empty password is accepted
	bool m_allowEmptyPassword = true;

	/// \brief Shutdown grace period
	std::chrono::milliseconds m_shutdownGracePeriod;

	/// \brief Data connection timeout
	std::chrono::milliseconds m_dataTimeout;

	/// \brief Event sink
	SharedFtpEventSink m_eventSink;
};

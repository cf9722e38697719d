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

#include "fs.h"
#include "ftpConfig.h"
#include "ftpEvents.h"
#include "ftpSession.h"
#include "platform.h"
#include "sessionRegistry.h"
#include "socket.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>

class FtpServer;
using UniqueFtpServer = std::unique_ptr<FtpServer>;

/// \brief FTP server
class FtpServer
{
public:
	~FtpServer ();

	/// \brief Create server and start accepting
	/// \param config_ FTP config
	/// \returns nullptr if the sandbox or listen socket can't be set up
	static UniqueFtpServer create (UniqueFtpConfig config_);

	/// \brief Listen address
	SockAddr const &sockName () const;

	/// \brief Number of live sessions
	std::size_t sessionCount () const;

	/// \brief Stop accepting, drain sessions and join all threads
	/// \note Idempotent
	void shutdown ();

private:
	/// \brief Session and the thread running it
	struct Worker
	{
		/// \brief Session
		UniqueFtpSession session;

		/// \brief Thread
		platform::Thread thread;
	};

	/// \brief Parameterized constructor
	/// \param config_ FTP config
	/// \param sandbox_ Served filesystem
	/// \param socket_ Listen socket
	FtpServer (UniqueFtpConfig config_, fs::UniqueSandbox sandbox_, UniqueSocket socket_);

	/// \brief Accept one pending connection
	void accept ();

	/// \brief Join threads of finished sessions
	void reap ();

	/// \brief Thread entry point
	void threadFunc ();

	/// \brief Config
	UniqueFtpConfig const m_config;

	/// \brief Served filesystem
	fs::UniqueSandbox const m_sandbox;

	/// \brief Event sink
	SharedFtpEventSink const m_events;

	/// \brief Listen socket
	UniqueSocket m_socket;

	/// \brief Listen address
	SockAddr const m_sockName;

	/// \brief Live sessions
	SessionRegistry m_registry;

	/// \brief Mutex
	platform::Mutex m_lock;

	/// \brief Session workers
	std::vector<Worker> m_workers;

	/// \brief Next session id
	SessionId m_nextId = 1;

	/// \brief Whether to stop accepting
	std::atomic<bool> m_draining = false;

	/// \brief Whether shutdown has run
	std::atomic<bool> m_shutdown = false;

	/// \brief Acceptor thread
	platform::Thread m_thread;
};

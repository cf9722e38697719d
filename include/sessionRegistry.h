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

#include "cancel.h"
#include "ftpEvents.h"
#include "platform.h"
#include "socket.h"

#include <cstddef>
#include <memory>
#include <vector>

/// \brief Live sessions known to the server
/// \note Holds non-owning handles only; sessions own their sockets
class SessionRegistry
{
public:
	~SessionRegistry ();

	SessionRegistry ();

	SessionRegistry (SessionRegistry const &that_) = delete;

	SessionRegistry &operator= (SessionRegistry const &that_) = delete;

	/// \brief Register a session
	/// \param id_ Session id
	/// \param cancel_ Session cancel token
	/// \param socket_ Session control socket
	void add (SessionId id_, SharedCancelToken cancel_, SharedSocket const &socket_);

	/// \brief Deregister a session
	/// \param id_ Session id
	void remove (SessionId id_);

	/// \brief Ask every registered session to stop
	void cancelAll ();

	/// \brief Shut down the control sockets of all remaining sessions
	/// \returns Number of sockets shut down
	std::size_t forceClose ();

	/// \brief Whether no sessions are registered
	bool empty () const;

	/// \brief Number of registered sessions
	std::size_t size () const;

private:
	/// \brief Registry entry
	struct Handle
	{
		/// \brief Session id
		SessionId id;

		/// \brief Session cancel token
		SharedCancelToken cancel;

		/// \brief Session control socket
		std::weak_ptr<Socket> socket;
	};

	/// \brief Mutex
	mutable platform::Mutex m_lock;

	/// \brief Registered sessions
	std::vector<Handle> m_handles;
};

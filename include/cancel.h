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

#include "socket.h"

#include <atomic>
#include <chrono>
#include <memory>

class CancelToken;
using SharedCancelToken = std::shared_ptr<CancelToken>;

/// \brief Cooperative cancellation flag shared between a session and the registry
class CancelToken
{
public:
	/// \brief Request cancellation
	void cancel ();

	/// \brief Whether cancellation was requested
	bool cancelled () const;

	/// \brief Create token
	static SharedCancelToken create ();

private:
	/// \brief Cancellation flag
	std::atomic<bool> m_cancelled = false;
};

/// \brief Outcome of waitSocket
enum class WaitResult
{
	Ready,
	Cancelled,
	TimedOut,
	Failed,
};

/// \brief Wait for socket readiness in bounded slices
/// \param socket_ Socket to wait on
/// \param events_ Poll events (POLLIN/POLLOUT)
/// \param cancel_ Cancellation token checked between slices
/// \param timeout_ Overall timeout
/// \note Hangup and error conditions report Ready so the next I/O call observes them
WaitResult waitSocket (Socket &socket_,
    int events_,
    CancelToken const &cancel_,
    std::chrono::milliseconds timeout_);

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

#include "sockAddr.h"

#include <cstdint>
#include <memory>
#include <string_view>

class FtpEventSink;
using SharedFtpEventSink = std::shared_ptr<FtpEventSink>;

/// \brief Session identifier
using SessionId = std::uint64_t;

/// \brief Receiver of session lifecycle events
/// \note Called concurrently from every session thread
class FtpEventSink
{
public:
	virtual ~FtpEventSink ();

	/// \brief Control connection accepted
	/// \param id_ Session id
	/// \param peer_ Peer address
	virtual void connectionOpened (SessionId id_, SockAddr const &peer_) = 0;

	/// \brief Control connection finished
	/// \param id_ Session id
	virtual void connectionClosed (SessionId id_) = 0;

	/// \brief Command line received
	/// \param id_ Session id
	/// \param line_ Command line, with any password masked
	virtual void commandReceived (SessionId id_, std::string_view line_) = 0;

	/// \brief Session-level failure
	/// \param id_ Session id
	/// \param message_ Error description
	virtual void error (SessionId id_, std::string_view message_) = 0;

	/// \brief Create sink which forwards to the log
	static SharedFtpEventSink create ();
};

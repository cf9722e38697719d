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
#include "ioBuffer.h"
#include "sockAddr.h"
#include "socket.h"

#include <chrono>
#include <memory>
#include <type_traits>

class DataChannel;
using UniqueDataChannel = std::unique_ptr<DataChannel>;

/// \brief Data connection for exactly one transfer
class DataChannel
{
public:
	/// \brief Who opens the connection
	enum class Mode
	{
		Active,
		Passive,
	};

	/// \brief Connection progress
	enum class Status
	{
		Negotiated,
		Connected,
		Closed,
	};

	~DataChannel ();

	/// \brief Start listening for a passive connection
	/// \param local_ Address to listen on; the port is ignored
	/// \returns nullptr on failure (errno is set)
	/// \note The listener's port is the one the kernel actually bound
	static UniqueDataChannel listen (SockAddr const &local_);

	/// \brief Record an active connection target
	/// \param peer_ Address the client listens on
	/// \note Nothing is connected until establish
	static UniqueDataChannel target (SockAddr const &peer_);

	/// \brief Who opens the connection
	Mode mode () const;

	/// \brief Connection progress
	Status status () const;

	/// \brief Passive listen address or active target
	SockAddr const &address () const;

	/// \brief Accept or connect
	/// \param cancel_ Cancellation token
	/// \param timeout_ How long to wait for the peer
	/// \returns false on failure; errno is ETIMEDOUT, ECANCELED or the socket error
	bool establish (CancelToken const &cancel_, std::chrono::milliseconds timeout_);

	/// \brief Receive into buffer
	/// \param buffer_ Buffer to fill
	/// \param cancel_ Cancellation token
	/// \param timeout_ Stall timeout
	/// \returns bytes read, 0 on EOF, -1 on failure (errno is set)
	std::make_signed_t<std::size_t> read (IOBuffer &buffer_,
	    CancelToken const &cancel_,
	    std::chrono::milliseconds timeout_);

	/// \brief Send the whole used area of buffer
	/// \param buffer_ Buffer to drain
	/// \param cancel_ Cancellation token
	/// \param timeout_ Stall timeout
	bool writeAll (IOBuffer &buffer_, CancelToken const &cancel_, std::chrono::milliseconds timeout_);

	/// \brief Half-close and wait for the peer to close its side
	/// \param cancel_ Cancellation token
	/// \param timeout_ How long to wait for the peer
	bool finish (CancelToken const &cancel_, std::chrono::milliseconds timeout_);

	/// \brief Release both sockets
	void close ();

private:
	/// \brief Parameterized constructor
	/// \param mode_ Who opens the connection
	/// \param address_ Passive listen address or active target
	DataChannel (Mode mode_, SockAddr const &address_);

	DataChannel (DataChannel const &that_) = delete;

	DataChannel &operator= (DataChannel const &that_) = delete;

	/// \brief Wait then accept the passive connection
	bool accept (CancelToken const &cancel_, std::chrono::milliseconds timeout_);

	/// \brief Connect to the active target
	bool connect (CancelToken const &cancel_, std::chrono::milliseconds timeout_);

	/// \brief Who opens the connection
	Mode const m_mode;

	/// \brief Connection progress
	Status m_status = Status::Negotiated;

	/// \brief Passive listen address or active target
	SockAddr m_address;

	/// \brief Passive listener
	UniqueSocket m_listen;

	/// \brief Connected data socket
	UniqueSocket m_socket;
};

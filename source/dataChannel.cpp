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

#include "dataChannel.h"

#include "log.h"
#include "platform.h"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>

namespace
{
/// \brief Map a wait failure onto errno
/// \param result_ Wait result
void setWaitErrno (WaitResult const result_)
{
	switch (result_)
	{
	case WaitResult::Cancelled:
		errno = ECANCELED;
		break;

	case WaitResult::TimedOut:
		errno = ETIMEDOUT;
		break;

	case WaitResult::Failed:
	case WaitResult::Ready:
		break;
	}
}
}

///////////////////////////////////////////////////////////////////////////
DataChannel::~DataChannel () = default;

DataChannel::DataChannel (Mode const mode_, SockAddr const &address_)
    : m_mode (mode_), m_address (address_)
{
}

UniqueDataChannel DataChannel::listen (SockAddr const &local_)
{
	auto socket = Socket::create (local_.family ());
	if (!socket)
		return nullptr;

	auto addr = local_;
	addr.setPort (0);

	if (!socket->bind (addr))
		return nullptr;

	if (!socket->listen (1))
		return nullptr;

	if (!socket->setNonBlocking ())
		return nullptr;

	// the advertised port must be a real one
	if (socket->sockName ().port () == 0)
	{
		errno = EADDRNOTAVAIL;
		error ("listen: no port bound\n");
		return nullptr;
	}

	auto channel      = UniqueDataChannel (new DataChannel (Mode::Passive, socket->sockName ()));
	channel->m_listen = std::move (socket);

	debug ("Listening on %s\n", channel->m_address.str ().c_str ());
	return channel;
}

UniqueDataChannel DataChannel::target (SockAddr const &peer_)
{
	return UniqueDataChannel (new DataChannel (Mode::Active, peer_));
}

DataChannel::Mode DataChannel::mode () const
{
	return m_mode;
}

DataChannel::Status DataChannel::status () const
{
	return m_status;
}

SockAddr const &DataChannel::address () const
{
	return m_address;
}

bool DataChannel::establish (CancelToken const &cancel_, std::chrono::milliseconds const timeout_)
{
	if (m_status != Status::Negotiated)
	{
		errno = m_status == Status::Connected ? EISCONN : EBADF;
		return false;
	}

	auto const rc = m_mode == Mode::Passive ? accept (cancel_, timeout_) : connect (cancel_, timeout_);
	if (!rc)
	{
		auto const err = errno;
		close ();
		errno = err;
		return false;
	}

	m_status = Status::Connected;
	return true;
}

bool DataChannel::accept (CancelToken const &cancel_, std::chrono::milliseconds const timeout_)
{
	auto const deadline = platform::steady_clock::now () + timeout_;

	while (true)
	{
		auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds> (
		    deadline - platform::steady_clock::now ());

		auto const result = waitSocket (*m_listen, POLLIN, cancel_, remaining);
		if (result != WaitResult::Ready)
		{
			setWaitErrno (result);
			return false;
		}

		m_socket = m_listen->accept ();
		if (m_socket)
			break;

		// spurious wakeup or connection aborted before accept
		if (errno != EAGAIN && errno != EWOULDBLOCK && errno != ECONNABORTED)
			return false;
	}

	// one connection per channel
	m_listen.reset ();

	return m_socket->setNonBlocking ();
}

bool DataChannel::connect (CancelToken const &cancel_, std::chrono::milliseconds const timeout_)
{
	m_socket = Socket::create (m_address.family ());
	if (!m_socket)
		return false;

	if (!m_socket->setNonBlocking ())
		return false;

	if (m_socket->connect (m_address))
		return true;

	if (errno != EINPROGRESS)
		return false;

	auto const result = waitSocket (*m_socket, POLLOUT, cancel_, timeout_);
	if (result != WaitResult::Ready)
	{
		setWaitErrno (result);
		return false;
	}

	auto const err = m_socket->pendingError ();
	if (err != 0)
	{
		errno = err;
		error ("connect: %s\n", std::strerror (err));
		return false;
	}

	return true;
}

std::make_signed_t<std::size_t> DataChannel::read (IOBuffer &buffer_,
    CancelToken const &cancel_,
    std::chrono::milliseconds const timeout_)
{
	if (!m_socket)
	{
		errno = ENOTCONN;
		return -1;
	}

	while (true)
	{
		auto const rc = m_socket->read (buffer_);
		if (rc >= 0)
			return rc;

		if (errno != EAGAIN && errno != EWOULDBLOCK)
			return -1;

		auto const result = waitSocket (*m_socket, POLLIN, cancel_, timeout_);
		if (result != WaitResult::Ready)
		{
			setWaitErrno (result);
			return -1;
		}
	}
}

bool DataChannel::writeAll (IOBuffer &buffer_,
    CancelToken const &cancel_,
    std::chrono::milliseconds const timeout_)
{
	if (!m_socket)
	{
		errno = ENOTCONN;
		return false;
	}

	while (!buffer_.empty ())
	{
		auto const rc = m_socket->write (buffer_);
		if (rc > 0)
			continue;

		if (rc == 0 || (errno != EAGAIN && errno != EWOULDBLOCK))
			return false;

		auto const result = waitSocket (*m_socket, POLLOUT, cancel_, timeout_);
		if (result != WaitResult::Ready)
		{
			setWaitErrno (result);
			return false;
		}
	}

	return true;
}

bool DataChannel::finish (CancelToken const &cancel_, std::chrono::milliseconds const timeout_)
{
	if (!m_socket)
	{
		errno = ENOTCONN;
		return false;
	}

	// signal EOF, then let the peer close so no data is lost to a reset
	m_socket->shutdown (SHUT_WR);

	char discard[1024];
	auto const deadline = platform::steady_clock::now () + timeout_;
	while (true)
	{
		auto const rc = m_socket->read (discard, sizeof (discard));
		if (rc == 0)
			break;

		if (rc < 0)
		{
			if (errno != EAGAIN && errno != EWOULDBLOCK)
				return false;

			auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds> (
			    deadline - platform::steady_clock::now ());

			auto const result = waitSocket (*m_socket, POLLIN, cancel_, remaining);
			if (result != WaitResult::Ready)
			{
				setWaitErrno (result);
				return false;
			}
		}
	}

	close ();
	return true;
}

void DataChannel::close ()
{
	m_listen.reset ();
	m_socket.reset ();
	m_status = Status::Closed;
}

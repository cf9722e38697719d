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

#include "socket.h"

#include "log.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace
{
bool wouldBlock (int const errno_)
{
	return errno_ == EWOULDBLOCK || errno_ == EAGAIN;
}
}

///////////////////////////////////////////////////////////////////////////
Socket::~Socket ()
{
	if (m_listening)
		debug ("Stop listening on %s\n", m_sockName.str ().c_str ());

	if (m_connected)
		debug ("Closing connection to %s\n", m_peerName.str ().c_str ());

	if (::close (m_fd) != 0)
		error ("close: %s\n", std::strerror (errno));
}

Socket::Socket (int const fd_) : m_fd (fd_), m_listening (false), m_connected (false)
{
}

Socket::Socket (int const fd_, SockAddr const &sockName_, SockAddr const &peerName_)
    : m_sockName (sockName_),
      m_peerName (peerName_),
      m_fd (fd_),
      m_listening (false),
      m_connected (true)
{
}

UniqueSocket Socket::accept ()
{
	SockAddr addr;
	socklen_t addrLen = sizeof (struct sockaddr_storage);

	auto const fd = ::accept (m_fd, addr, &addrLen);
	if (fd < 0)
	{
		if (!wouldBlock (errno))
			error ("accept: %s\n", std::strerror (errno));
		return nullptr;
	}

	// a wildcard listener hands out connections on a concrete interface
	SockAddr local;
	addrLen = sizeof (struct sockaddr_storage);
	if (::getsockname (fd, local, &addrLen) != 0)
	{
		error ("getsockname: %s\n", std::strerror (errno));
		local = m_sockName;
	}

	debug ("Accepted connection from %s\n", addr.str ().c_str ());
	return UniqueSocket (new Socket (fd, local, addr));
}

bool Socket::bind (SockAddr const &addr_)
{
	switch (addr_.family ())
	{
	case AF_INET:
	case AF_INET6:
		if (::bind (m_fd, addr_, addr_.size ()) != 0)
		{
			error ("bind: %s\n", std::strerror (errno));
			return false;
		}
		break;

	default:
		errno = EINVAL;
		error ("bind: %s\n", std::strerror (errno));
		return false;
	}

	if (addr_.port () == 0)
	{
		// get socket name due to request for ephemeral port
		socklen_t addrLen = sizeof (struct sockaddr_storage);
		if (::getsockname (m_fd, m_sockName, &addrLen) != 0)
		{
			error ("getsockname: %s\n", std::strerror (errno));
			return false;
		}
	}
	else
		m_sockName = addr_;

	return true;
}

bool Socket::connect (SockAddr const &addr_)
{
	if (::connect (m_fd, addr_, addr_.size ()) != 0)
	{
		if (errno != EINPROGRESS)
			error ("connect: %s\n", std::strerror (errno));
		else
		{
			m_peerName  = addr_;
			m_connected = true;
			debug ("Connecting to %s\n", addr_.str ().c_str ());
		}
		return false;
	}

	m_peerName  = addr_;
	m_connected = true;
	debug ("Connected to %s\n", addr_.str ().c_str ());
	return true;
}

int Socket::pendingError ()
{
	int err          = 0;
	socklen_t errLen = sizeof (err);
	if (::getsockopt (m_fd, SOL_SOCKET, SO_ERROR, &err, &errLen) != 0)
	{
		error ("getsockopt(SO_ERROR): %s\n", std::strerror (errno));
		return errno;
	}

	if (err != 0)
	{
		m_connected = false;
		return err;
	}

	socklen_t addrLen = sizeof (struct sockaddr_storage);
	if (::getsockname (m_fd, m_sockName, &addrLen) != 0)
		error ("getsockname: %s\n", std::strerror (errno));

	return 0;
}

bool Socket::listen (int const backlog_)
{
	if (::listen (m_fd, backlog_) != 0)
	{
		error ("listen: %s\n", std::strerror (errno));
		return false;
	}

	m_listening = true;
	return true;
}

bool Socket::shutdown (int const how_)
{
	if (::shutdown (m_fd, how_) != 0)
	{
		// peer may already be gone
		if (errno != ENOTCONN)
			error ("shutdown: %s\n", std::strerror (errno));
		return false;
	}

	return true;
}

bool Socket::setNonBlocking (bool const nonBlocking_)
{
	auto flags = ::fcntl (m_fd, F_GETFL, 0);
	if (flags == -1)
	{
		error ("fcntl(F_GETFL): %s\n", std::strerror (errno));
		return false;
	}

	if (nonBlocking_)
		flags |= O_NONBLOCK;
	else
		flags &= ~O_NONBLOCK;

	if (::fcntl (m_fd, F_SETFL, flags) != 0)
	{
		error ("fcntl(F_SETFL, %d): %s\n", flags, std::strerror (errno));
		return false;
	}

	return true;
}

bool Socket::setReuseAddress (bool const reuse_)
{
	int const reuse = reuse_;
	if (::setsockopt (m_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof (reuse)) != 0)
	{
		error ("setsockopt(SO_REUSEADDR, %s): %s\n", reuse_ ? "yes" : "no", std::strerror (errno));
		return false;
	}

	return true;
}

std::make_signed_t<std::size_t> Socket::read (void *const buffer_, std::size_t const size_)
{
	assert (buffer_);
	assert (size_);

	auto const rc = ::recv (m_fd, buffer_, size_, 0);
	if (rc < 0 && !wouldBlock (errno))
		error ("recv: %s\n", std::strerror (errno));

	return rc;
}

std::make_signed_t<std::size_t> Socket::read (IOBuffer &buffer_)
{
	assert (buffer_.freeSize () > 0);

	auto const rc = read (buffer_.freeArea (), buffer_.freeSize ());
	if (rc > 0)
		buffer_.markUsed (rc);

	return rc;
}

std::make_signed_t<std::size_t> Socket::write (void const *const buffer_, std::size_t const size_)
{
	assert (buffer_);
	assert (size_ > 0);

	// a vanished peer must surface as EPIPE, not as a signal
	auto const rc = ::send (m_fd, buffer_, size_, MSG_NOSIGNAL);
	if (rc < 0 && !wouldBlock (errno))
		error ("send: %s\n", std::strerror (errno));

	return rc;
}

std::make_signed_t<std::size_t> Socket::write (IOBuffer &buffer_)
{
	assert (buffer_.usedSize () > 0);

	auto const rc = write (buffer_.usedArea (), buffer_.usedSize ());
	if (rc > 0)
		buffer_.markFree (rc);

	return rc;
}

SockAddr const &Socket::sockName () const
{
	return m_sockName;
}

SockAddr const &Socket::peerName () const
{
	return m_peerName;
}

UniqueSocket Socket::create (int const family_)
{
	auto const fd = ::socket (family_, SOCK_STREAM | SOCK_CLOEXEC, 0);
	if (fd < 0)
	{
		error ("socket: %s\n", std::strerror (errno));
		return nullptr;
	}

	return UniqueSocket (new Socket (fd));
}

int Socket::poll (PollInfo *const info_,
    std::size_t const count_,
    std::chrono::milliseconds const timeout_)
{
	if (count_ == 0)
		return 0;

	auto const pfd = std::make_unique<struct pollfd[]> (count_);
	for (std::size_t i = 0; i < count_; ++i)
	{
		pfd[i].fd      = info_[i].socket.get ().m_fd;
		pfd[i].events  = info_[i].events;
		pfd[i].revents = 0;
	}

	auto const rc = ::poll (pfd.get (), count_, timeout_.count ());
	if (rc < 0)
	{
		if (errno != EINTR)
			error ("poll: %s\n", std::strerror (errno));
		return rc;
	}

	for (std::size_t i = 0; i < count_; ++i)
		info_[i].revents = pfd[i].revents;

	return rc;
}

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

#include "sockAddr.h"

#include <arpa/inet.h>

#include <cassert>
#include <cerrno>
#include <cstring>

///////////////////////////////////////////////////////////////////////////
SockAddr::~SockAddr () = default;

SockAddr::SockAddr () = default;

SockAddr::SockAddr (SockAddr const &that_) = default;

SockAddr::SockAddr (SockAddr &&that_) = default;

SockAddr &SockAddr::operator= (SockAddr const &that_) = default;

SockAddr &SockAddr::operator= (SockAddr &&that_) = default;

SockAddr::SockAddr (struct sockaddr const &addr_)
{
	switch (addr_.sa_family)
	{
	case AF_INET:
		std::memcpy (&m_addr, &addr_, sizeof (struct sockaddr_in));
		break;

	case AF_INET6:
		std::memcpy (&m_addr, &addr_, sizeof (struct sockaddr_in6));
		break;

	default:
		// unsupported family stays AF_UNSPEC
		break;
	}
}

SockAddr::SockAddr (struct sockaddr_in const &addr_)
    : SockAddr (reinterpret_cast<struct sockaddr const &> (addr_))
{
}

SockAddr::SockAddr (struct sockaddr_in6 const &addr_)
    : SockAddr (reinterpret_cast<struct sockaddr const &> (addr_))
{
}

SockAddr::SockAddr (struct sockaddr_storage const &addr_)
    : SockAddr (reinterpret_cast<struct sockaddr const &> (addr_))
{
}

SockAddr SockAddr::fromOctets (std::array<std::uint8_t, 4> const &octets_,
    std::uint16_t const port_)
{
	struct sockaddr_in addr = {};
	addr.sin_family         = AF_INET;
	addr.sin_port           = htons (port_);
	std::memcpy (&addr.sin_addr.s_addr, octets_.data (), octets_.size ());

	return addr;
}

bool SockAddr::parse (std::string_view const host_, std::uint16_t const port_, SockAddr &addr_)
{
	struct sockaddr_in addr = {};
	addr.sin_family         = AF_INET;
	addr.sin_port           = htons (port_);

	auto const host = std::string (host_);
	if (::inet_pton (AF_INET, host.c_str (), &addr.sin_addr) != 1)
	{
		errno = EINVAL;
		return false;
	}

	addr_ = addr;
	return true;
}

SockAddr::operator struct sockaddr_in const & () const
{
	assert (m_addr.ss_family == AF_INET);
	return reinterpret_cast<struct sockaddr_in const &> (m_addr);
}

SockAddr::operator struct sockaddr_in6 const & () const
{
	assert (m_addr.ss_family == AF_INET6);
	return reinterpret_cast<struct sockaddr_in6 const &> (m_addr);
}

SockAddr::operator struct sockaddr_storage const & () const
{
	return m_addr;
}

SockAddr::operator struct sockaddr * ()
{
	return reinterpret_cast<struct sockaddr *> (&m_addr);
}

SockAddr::operator struct sockaddr const * () const
{
	return reinterpret_cast<struct sockaddr const *> (&m_addr);
}

sa_family_t SockAddr::family () const
{
	return m_addr.ss_family;
}

socklen_t SockAddr::size () const
{
	switch (m_addr.ss_family)
	{
	case AF_INET:
		return sizeof (struct sockaddr_in);

	case AF_INET6:
		return sizeof (struct sockaddr_in6);

	default:
		return sizeof (struct sockaddr_storage);
	}
}

bool SockAddr::setPort (std::uint16_t const port_)
{
	switch (m_addr.ss_family)
	{
	case AF_INET:
		reinterpret_cast<struct sockaddr_in *> (&m_addr)->sin_port = htons (port_);
		return true;

	case AF_INET6:
		reinterpret_cast<struct sockaddr_in6 *> (&m_addr)->sin6_port = htons (port_);
		return true;

	default:
		errno = EAFNOSUPPORT;
		return false;
	}
}

std::uint16_t SockAddr::port () const
{
	switch (m_addr.ss_family)
	{
	case AF_INET:
		return ntohs (reinterpret_cast<struct sockaddr_in const *> (&m_addr)->sin_port);

	case AF_INET6:
		return ntohs (reinterpret_cast<struct sockaddr_in6 const *> (&m_addr)->sin6_port);

	default:
		return 0;
	}
}

bool SockAddr::isWildcard () const
{
	switch (m_addr.ss_family)
	{
	case AF_INET:
		return reinterpret_cast<struct sockaddr_in const *> (&m_addr)->sin_addr.s_addr ==
		       htonl (INADDR_ANY);

	case AF_INET6:
		return IN6_IS_ADDR_UNSPECIFIED (
		    &reinterpret_cast<struct sockaddr_in6 const *> (&m_addr)->sin6_addr);

	default:
		return true;
	}
}

std::array<std::uint8_t, 4> SockAddr::octets () const
{
	std::array<std::uint8_t, 4> octets{};
	if (m_addr.ss_family == AF_INET)
	{
		auto const &addr = reinterpret_cast<struct sockaddr_in const *> (&m_addr)->sin_addr;
		std::memcpy (octets.data (), &addr.s_addr, octets.size ());
	}

	return octets;
}

char const *SockAddr::name (char *buffer_, std::size_t size_) const
{
	switch (m_addr.ss_family)
	{
	case AF_INET:
		return inet_ntop (AF_INET,
		    &reinterpret_cast<struct sockaddr_in const *> (&m_addr)->sin_addr,
		    buffer_,
		    size_);

	case AF_INET6:
		return inet_ntop (AF_INET6,
		    &reinterpret_cast<struct sockaddr_in6 const *> (&m_addr)->sin6_addr,
		    buffer_,
		    size_);

	default:
		errno = EAFNOSUPPORT;
		return nullptr;
	}
}

char const *SockAddr::name () const
{
	thread_local static char buffer[INET6_ADDRSTRLEN];

	auto const rc = name (buffer, sizeof (buffer));
	return rc ? rc : "?";
}

std::string SockAddr::str () const
{
	return "[" + std::string (name ()) + "]:" + std::to_string (port ());
}

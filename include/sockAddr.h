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

#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

/// \brief Socket address
class SockAddr
{
public:
	~SockAddr ();

	SockAddr ();

	/// \brief Copy constructor
	/// \param that_ Object to copy
	SockAddr (SockAddr const &that_);

	/// \brief Move constructor
	/// \param that_ Object to move from
	SockAddr (SockAddr &&that_);

	/// \brief Copy assignment
	/// \param that_ Object to copy
	SockAddr &operator= (SockAddr const &that_);

	/// \brief Move assignment
	/// \param that_ Object to move from
	SockAddr &operator= (SockAddr &&that_);

	/// \param Parameterized constructor
	/// \param addr_ Address
	SockAddr (struct sockaddr const &addr_);

	/// \param Parameterized constructor
	/// \param addr_ Address
	SockAddr (struct sockaddr_in const &addr_);

	/// \param Parameterized constructor
	/// \param addr_ Address
	SockAddr (struct sockaddr_in6 const &addr_);

	/// \param Parameterized constructor
	/// \param addr_ Address
	SockAddr (struct sockaddr_storage const &addr_);

	/// \brief Build an IPv4 address from its four octets
	/// \param octets_ Address octets in network order
	/// \param port_ Port
	static SockAddr fromOctets (std::array<std::uint8_t, 4> const &octets_, std::uint16_t port_);

	/// \brief Parse a dotted-quad IPv4 address
	/// \param host_ Address text
	/// \param port_ Port
	/// \param[out] addr_ Parsed address
	static bool parse (std::string_view host_, std::uint16_t port_, SockAddr &addr_);

	/// \param sockaddr_in cast operator
	operator struct sockaddr_in const & () const;

	/// \param sockaddr_in6 cast operator
	operator struct sockaddr_in6 const & () const;

	/// \param sockaddr_storage cast operator
	operator struct sockaddr_storage const & () const;

	/// \param sockaddr* cast operator
	operator struct sockaddr * ();
	/// \param sockaddr const* cast operator
	operator struct sockaddr const * () const;

	/// \brief Address family
	sa_family_t family () const;

	/// \brief Size of the underlying sockaddr for this family
	socklen_t size () const;

	/// \brief Address port
	std::uint16_t port () const;

	/// \brief Set address port
	/// \param port_ Port to set
	bool setPort (std::uint16_t port_);

	/// \brief Whether this is INADDR_ANY / in6addr_any
	bool isWildcard () const;

	/// \brief IPv4 address octets
	/// \note Only meaningful for AF_INET
	std::array<std::uint8_t, 4> octets () const;

	/// \brief Address name
	/// \param buffer_ Buffer to hold name
	/// \param size_ Size of buffer_
	/// \retval buffer_ success
	/// \retval nullptr failure
	char const *name (char *buffer_, std::size_t size_) const;

	/// \brief Address name
	/// \retval nullptr failure
	/// \note This function is not reentrant
	char const *name () const;

	/// \brief "[name]:port" for log messages
	std::string str () const;

private:
	/// \brief Address storage
	struct sockaddr_storage m_addr = {};
};

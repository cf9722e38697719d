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

#include <string>
#include <vector>

/// \brief Control connection reply
struct FtpReply
{
	/// \brief Build a single-line reply
	/// \param code_ Reply code
	/// \param fmt_ Text format
	__attribute__ ((format (printf, 2, 3))) static FtpReply format (unsigned code_,
	    char const *fmt_,
	    ...);

	/// \brief Whether a reply is present
	explicit operator bool () const
	{
		return code != 0;
	}

	/// \brief Wire form
	/// \note Multi-line replies start with "code-" and end with "code text"
	std::string encode () const;

	/// \brief Three-digit reply code, 0 for none
	unsigned code = 0;

	/// \brief Text lines; continuation lines starting with a space are sent verbatim
	std::vector<std::string> lines;
};

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

#include "ftpReply.h"

#include <cstdarg>
#include <cstdio>

FtpReply FtpReply::format (unsigned const code_, char const *const fmt_, ...)
{
	thread_local static char buffer[1024];

	va_list ap;

	va_start (ap, fmt_);
	auto const rc = std::vsnprintf (buffer, sizeof (buffer), fmt_, ap);
	va_end (ap);

	FtpReply reply;
	reply.code = code_;
	reply.lines.emplace_back (rc < 0 ? "" : buffer);
	return reply;
}

std::string FtpReply::encode () const
{
	char codeString[8];
	std::snprintf (codeString, sizeof (codeString), "%03u", code);

	std::string out;
	if (lines.size () <= 1)
	{
		out = codeString;
		out.push_back (' ');
		if (!lines.empty ())
			out += lines.front ();
		out += "\r\n";
		return out;
	}

	for (std::size_t i = 0; i < lines.size (); ++i)
	{
		auto const &line = lines[i];
		if (i == 0)
		{
			out += codeString;
			out.push_back ('-');
		}
		else if (i == lines.size () - 1)
		{
			out += codeString;
			out.push_back (' ');
		}
		else if (line.empty () || line.front () != ' ')
		{
			// a bare continuation line could be mistaken for the final line
			out.push_back (' ');
		}

		out += line;
		out += "\r\n";
	}

	return out;
}

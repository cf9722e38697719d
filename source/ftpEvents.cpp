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

#include "ftpEvents.h"

#include "log.h"

#include <gsl/util>

#include <cinttypes>

namespace
{
/// \brief Event sink backed by the leveled log
class LogEventSink final : public FtpEventSink
{
public:
	void connectionOpened (SessionId const id_, SockAddr const &peer_) override
	{
		info ("#%" PRIu64 " Accepted connection from %s\n", id_, peer_.str ().c_str ());
	}

	void connectionClosed (SessionId const id_) override
	{
		info ("#%" PRIu64 " Connection closed\n", id_);
	}

	void commandReceived (SessionId const id_, std::string_view const line_) override
	{
		::command ("#%" PRIu64 " %.*s\n",
		    id_,
		    gsl::narrow_cast<int> (line_.size ()),
		    line_.data ());
	}

	void error (SessionId const id_, std::string_view const message_) override
	{
		::error ("#%" PRIu64 " %.*s\n",
		    id_,
		    gsl::narrow_cast<int> (message_.size ()),
		    message_.data ());
	}
};
}

///////////////////////////////////////////////////////////////////////////
FtpEventSink::~FtpEventSink () = default;

SharedFtpEventSink FtpEventSink::create ()
{
	return std::make_shared<LogEventSink> ();
}

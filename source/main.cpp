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

#include "platform.h"

#include "ftpConfig.h"
#include "ftpServer.h"
#include "log.h"

#include <cstdlib>

#ifndef SANDFTPD_CONFIG
#define SANDFTPD_CONFIG "/etc/sandftpd.cfg"
#endif

int main (int const argc_, char *argv_[])
{
	if (!platform::init ())
		return EXIT_FAILURE;

	auto const path = argc_ > 1 ? argv_[1] : SANDFTPD_CONFIG;

	auto config = FtpConfig::load (path);
	if (!config)
		return EXIT_FAILURE;

	auto server = FtpServer::create (std::move (config));
	if (!server)
	{
		error ("Failed to start server\n");
		return EXIT_FAILURE;
	}

	while (platform::loop ())
		;

	server->shutdown ();
	server.reset ();

	platform::exit ();
}

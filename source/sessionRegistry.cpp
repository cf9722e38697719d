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

#include "sessionRegistry.h"

#include "log.h"

#include <sys/socket.h>

#include <algorithm>
#include <cinttypes>
#include <mutex>

///////////////////////////////////////////////////////////////////////////
SessionRegistry::~SessionRegistry () = default;

SessionRegistry::SessionRegistry () = default;

void SessionRegistry::add (SessionId const id_,
    SharedCancelToken cancel_,
    SharedSocket const &socket_)
{
	auto const lock = std::scoped_lock (m_lock);
	m_handles.emplace_back (Handle{id_, std::move (cancel_), socket_});
}

void SessionRegistry::remove (SessionId const id_)
{
	auto const lock = std::scoped_lock (m_lock);
	auto const it   = std::remove_if (std::begin (m_handles),
        std::end (m_handles),
        [id_] (Handle const &handle_) { return handle_.id == id_; });
	m_handles.erase (it, std::end (m_handles));
}

void SessionRegistry::cancelAll ()
{
	auto const lock = std::scoped_lock (m_lock);
	for (auto const &handle : m_handles)
		handle.cancel->cancel ();
}

std::size_t SessionRegistry::forceClose ()
{
	std::size_t count = 0;

	auto const lock = std::scoped_lock (m_lock);
	for (auto const &handle : m_handles)
	{
		handle.cancel->cancel ();

		auto const socket = handle.socket.lock ();
		if (!socket)
			continue;

		info ("Forcing session #%" PRIu64 " closed\n", handle.id);
		socket->shutdown (SHUT_RDWR);
		++count;
	}

	return count;
}

bool SessionRegistry::empty () const
{
	auto const lock = std::scoped_lock (m_lock);
	return m_handles.empty ();
}

std::size_t SessionRegistry::size () const
{
	auto const lock = std::scoped_lock (m_lock);
	return m_handles.size ();
}

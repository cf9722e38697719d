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

#include "ftpServer.h"

#include "log.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstring>
#include <functional>
#include <mutex>
using namespace std::chrono_literals;

namespace
{
/// \brief Acceptor poll interval
constexpr auto ACCEPT_SLICE = 100ms;

/// \brief Drain check interval
constexpr auto DRAIN_SLICE = 10ms;

/// \brief Listen backlog
constexpr auto LISTEN_BACKLOG = 10;
}

///////////////////////////////////////////////////////////////////////////
FtpServer::~FtpServer ()
{
	shutdown ();
}

FtpServer::FtpServer (UniqueFtpConfig config_, fs::UniqueSandbox sandbox_, UniqueSocket socket_)
    : m_config (std::move (config_)),
      m_sandbox (std::move (sandbox_)),
      m_events (m_config->eventSink ()),
      m_socket (std::move (socket_)),
      m_sockName (m_socket->sockName ())
{
	m_thread = platform::Thread (std::bind (&FtpServer::threadFunc, this));
}

UniqueFtpServer FtpServer::create (UniqueFtpConfig config_)
{
	if (!config_)
		return nullptr;

	auto sandbox = fs::Sandbox::create (config_->sandboxRoot ().c_str ());
	if (!sandbox)
		return nullptr;

	auto const addr = config_->bindAddress ();

	auto socket = Socket::create (addr.family ());
	if (!socket)
		return nullptr;

	if (addr.port () != 0 && !socket->setReuseAddress (true))
		return nullptr;

	if (!socket->bind (addr))
		return nullptr;

	if (!socket->listen (LISTEN_BACKLOG))
		return nullptr;

	if (!socket->setNonBlocking ())
		return nullptr;

	info ("Started server at %s serving %s\n",
	    socket->sockName ().str ().c_str (),
	    sandbox->root ().c_str ());

	return UniqueFtpServer (
	    new FtpServer (std::move (config_), std::move (sandbox), std::move (socket)));
}

SockAddr const &FtpServer::sockName () const
{
	return m_sockName;
}

std::size_t FtpServer::sessionCount () const
{
	return m_registry.size ();
}

void FtpServer::shutdown ()
{
	if (m_shutdown.exchange (true))
		return;

	info ("Shutting down server at %s\n", m_sockName.str ().c_str ());

	// stop accepting before anyone is told to leave
	m_draining = true;
	if (m_thread.joinable ())
		m_thread.join ();
	m_socket.reset ();

	m_registry.cancelAll ();

	auto const deadline = platform::steady_clock::now () + m_config->shutdownGracePeriod ();
	while (!m_registry.empty () && platform::steady_clock::now () < deadline)
		platform::Thread::sleep (DRAIN_SLICE);

	if (!m_registry.empty ())
	{
		auto const count = m_registry.forceClose ();
		info ("Grace period elapsed; forced %zu session(s) closed\n", count);
	}

	std::vector<Worker> workers;
	{
		auto const lock = std::scoped_lock (m_lock);
		workers         = std::move (m_workers);
	}

	for (auto &worker : workers)
	{
		if (worker.thread.joinable ())
			worker.thread.join ();
	}

	info ("Server stopped\n");
}

void FtpServer::accept ()
{
	auto socket = m_socket->accept ();
	if (!socket)
		return;

	// a connection that raced the drain is dropped unanswered
	if (m_draining)
		return;

	auto const id = m_nextId++;
	auto session  = FtpSession::create (id, *m_config, *m_sandbox, std::move (socket));
	if (!session)
		return;

	m_events->connectionOpened (id, session->peerName ());
	m_registry.add (id, session->cancelToken (), session->commandSocket ());

	auto const raw = session.get ();
	auto thread    = platform::Thread ([this, raw] () {
        raw->run ();
        m_registry.remove (raw->id ());
        m_events->connectionClosed (raw->id ());
    });

	auto const lock = std::scoped_lock (m_lock);
	m_workers.emplace_back (Worker{std::move (session), std::move (thread)});
}

void FtpServer::reap ()
{
	std::vector<Worker> deadWorkers;
	{
		// remove dead sessions
		auto const lock = std::scoped_lock (m_lock);
		auto it         = std::begin (m_workers);
		while (it != std::end (m_workers))
		{
			if (it->session->dead ())
			{
				deadWorkers.emplace_back (std::move (*it));
				it = m_workers.erase (it);
			}
			else
				++it;
		}
	}

	for (auto &worker : deadWorkers)
	{
		if (worker.thread.joinable ())
			worker.thread.join ();
	}
}

void FtpServer::threadFunc ()
{
	while (!m_draining)
	{
		Socket::PollInfo info{*m_socket, POLLIN, 0};
		auto const rc = Socket::poll (&info, 1, ACCEPT_SLICE);
		if (rc < 0 && errno != EINTR)
		{
			error ("Acceptor stopped: %s\n", std::strerror (errno));
			break;
		}

		if (rc > 0 && (info.revents & POLLIN))
			accept ();

		reap ();
	}
}

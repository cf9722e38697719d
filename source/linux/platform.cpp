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

#include "log.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <signal.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <mutex>
#include <thread>

namespace
{
/// \brief Set by the termination signal handler
volatile std::sig_atomic_t s_terminate = 0;

/// \brief Termination signal handler
/// \param signal_ Received signal
void handleSignal (int const signal_)
{
	(void)signal_;
	s_terminate = 1;
}

/// \brief Install a signal handler
/// \param signal_ Signal to handle
/// \param handler_ Handler
bool installHandler (int const signal_, void (*const handler_) (int))
{
	struct sigaction action = {};
	action.sa_handler       = handler_;
	sigemptyset (&action.sa_mask);

	if (::sigaction (signal_, &action, nullptr) != 0)
	{
		error ("sigaction(%s): %s\n", strsignal (signal_), std::strerror (errno));
		return false;
	}

	return true;
}
}

bool platform::init ()
{
	// peers closing mid-write must not kill the process
	if (!installHandler (SIGPIPE, SIG_IGN))
		return false;

	if (!installHandler (SIGINT, handleSignal))
		return false;

	if (!installHandler (SIGTERM, handleSignal))
		return false;

	return true;
}

bool platform::networkAddress (SockAddr &addr_)
{
	struct ifaddrs *ifaddr = nullptr;
	if (::getifaddrs (&ifaddr) != 0)
	{
		error ("getifaddrs: %s\n", std::strerror (errno));
		return false;
	}

	auto const ifaddrs = std::unique_ptr<struct ifaddrs, void (*) (struct ifaddrs *)> (
	    ifaddr, ::freeifaddrs);

	for (auto ifa = ifaddrs.get (); ifa; ifa = ifa->ifa_next)
	{
		if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
			continue;

		if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK))
			continue;

		addr_ = SockAddr (*ifa->ifa_addr);
		return true;
	}

	// no external interface; loopback still works for local clients
	struct sockaddr_in addr = {};
	addr.sin_family         = AF_INET;
	addr.sin_addr.s_addr    = htonl (INADDR_LOOPBACK);

	addr_ = addr;
	return true;
}

bool platform::loop ()
{
	if (s_terminate)
		return false;

	Thread::sleep (std::chrono::milliseconds (100));
	return !s_terminate;
}

void platform::exit ()
{
	info ("Exiting\n");
}

///////////////////////////////////////////////////////////////////////////
/// \brief Platform thread pimpl
class platform::Thread::privateData_t
{
public:
	privateData_t () = default;

	/// \brief Parameterized constructor
	/// \param func_ Thread entry point
	privateData_t (std::function<void ()> &&func_) : thread (std::move (func_))
	{
	}

	/// \brief Underlying thread object
	std::thread thread;
};

///////////////////////////////////////////////////////////////////////////
platform::Thread::~Thread ()
{
	if (m_d && m_d->thread.joinable ())
		m_d->thread.join ();
}

platform::Thread::Thread () : m_d (new privateData_t ())
{
}

platform::Thread::Thread (std::function<void ()> &&func_)
    : m_d (new privateData_t (std::move (func_)))
{
}

platform::Thread::Thread (Thread &&that_) : m_d (new privateData_t ())
{
	std::swap (m_d, that_.m_d);
}

platform::Thread &platform::Thread::operator= (Thread &&that_)
{
	std::swap (m_d, that_.m_d);
	return *this;
}

bool platform::Thread::joinable () const
{
	return m_d && m_d->thread.joinable ();
}

void platform::Thread::join ()
{
	m_d->thread.join ();
}

void platform::Thread::sleep (std::chrono::milliseconds const timeout_)
{
	std::this_thread::sleep_for (timeout_);
}

///////////////////////////////////////////////////////////////////////////
/// \brief Platform mutex pimpl
class platform::Mutex::privateData_t
{
public:
	/// \brief Underlying mutex
	std::mutex mutex;
};

///////////////////////////////////////////////////////////////////////////
platform::Mutex::~Mutex () = default;

platform::Mutex::Mutex () : m_d (new privateData_t ())
{
}

void platform::Mutex::lock ()
{
	m_d->mutex.lock ();
}

void platform::Mutex::unlock ()
{
	m_d->mutex.unlock ();
}

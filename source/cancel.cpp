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

#include "cancel.h"

#include "platform.h"

#include <algorithm>
#include <cerrno>

namespace
{
/// \brief Longest single poll; bounds how late a cancellation is noticed
constexpr auto POLL_SLICE = std::chrono::milliseconds (100);
}

///////////////////////////////////////////////////////////////////////////
void CancelToken::cancel ()
{
	m_cancelled.store (true, std::memory_order_release);
}

bool CancelToken::cancelled () const
{
	return m_cancelled.load (std::memory_order_acquire);
}

SharedCancelToken CancelToken::create ()
{
	return std::make_shared<CancelToken> ();
}

///////////////////////////////////////////////////////////////////////////
WaitResult waitSocket (Socket &socket_,
    int const events_,
    CancelToken const &cancel_,
    std::chrono::milliseconds const timeout_)
{
	auto const deadline = platform::steady_clock::now () + timeout_;

	while (true)
	{
		if (cancel_.cancelled ())
			return WaitResult::Cancelled;

		auto const now = platform::steady_clock::now ();
		if (now >= deadline)
			return WaitResult::TimedOut;

		auto const remaining =
		    std::chrono::duration_cast<std::chrono::milliseconds> (deadline - now);

		Socket::PollInfo info{socket_, events_, 0};
		auto const rc = Socket::poll (&info, 1, std::min (remaining, POLL_SLICE));
		if (rc < 0)
		{
			if (errno == EINTR)
				continue;
			return WaitResult::Failed;
		}

		if (rc == 0)
			continue;

		if (info.revents & POLLNVAL)
			return WaitResult::Failed;

		if (info.revents & (events_ | POLLERR | POLLHUP))
			return WaitResult::Ready;
	}
}

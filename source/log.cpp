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

#include "log.h"

#include "platform.h"

#include <cerrno>
#include <cstdio>
#include <deque>
#include <mutex>

namespace
{
/// \brief Maximum number of log messages to keep
constexpr std::size_t MAX_LOGS = 10000;

/// \brief Message prefix
char const *const s_prefix[] = {
    [DEBUG]    = "[DEBUG]",
    [INFO]     = "[INFO]",
    [ERROR]    = "[ERROR]",
    [COMMAND]  = "[COMMAND]",
    [RESPONSE] = "[RESPONSE]",
};

/// \brief Log message
struct Message
{
	/// \brief Parameterized constructor
	/// \param level_ Log level
	/// \param message_ Log message
	Message (LogLevel const level_, std::string message_)
	    : level (level_), message (std::move (message_))
	{
	}

	/// \brief Log level
	LogLevel level;
	/// \brief Log message
	std::string message;
};

/// \brief Log messages
std::deque<Message> s_messages;

/// \brief Whether to echo to stderr
bool s_echo = true;

/// \brief Log lock
platform::Mutex s_lock;

/// \brief Append message to history and echo it
/// \param level_ Log level
/// \param message_ Message to append
/// \note s_lock must be held
void pushMessage (LogLevel const level_, std::string message_)
{
	if (s_echo)
	{
		std::fputs (s_prefix[level_], stderr);
		std::fputc (' ', stderr);
		std::fwrite (message_.data (), 1, message_.size (), stderr);
		if (message_.empty () || message_.back () != '\n')
			std::fputc ('\n', stderr);
	}

	s_messages.emplace_back (level_, std::move (message_));
	while (s_messages.size () > MAX_LOGS)
		s_messages.pop_front ();
}
}

std::vector<std::pair<LogLevel, std::string>> getLog ()
{
	auto const lock = std::lock_guard (s_lock);

	std::vector<std::pair<LogLevel, std::string>> log;
	log.reserve (s_messages.size ());
	for (auto const &message : s_messages)
		log.emplace_back (message.level, message.message);

	return log;
}

void setLogEcho (bool const enable_)
{
	auto const lock = std::lock_guard (s_lock);
	s_echo          = enable_;
}

void debug (char const *const fmt_, ...)
{
#ifndef NDEBUG
	va_list ap;

	va_start (ap, fmt_);
	addLog (DEBUG, fmt_, ap);
	va_end (ap);
#else
	(void)fmt_;
#endif
}

void info (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (INFO, fmt_, ap);
	va_end (ap);
}

void error (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (ERROR, fmt_, ap);
	va_end (ap);
}

void command (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (COMMAND, fmt_, ap);
	va_end (ap);
}

void response (char const *const fmt_, ...)
{
	va_list ap;

	va_start (ap, fmt_);
	addLog (RESPONSE, fmt_, ap);
	va_end (ap);
}

void addLog (LogLevel const level_, char const *const fmt_, va_list ap_)
{
#ifdef NDEBUG
	if (level_ == DEBUG)
		return;
#endif

	// callers report errno after logging
	auto const err = errno;

	thread_local static char buffer[1024];

	std::vsnprintf (buffer, sizeof (buffer), fmt_, ap_);

	{
		auto const lock = std::lock_guard (s_lock);
		pushMessage (level_, buffer);
	}

	errno = err;
}

void addLog (LogLevel const level_, std::string_view const message_)
{
#ifdef NDEBUG
	if (level_ == DEBUG)
		return;
#endif

	auto const err = errno;

	auto msg = std::string (message_);
	for (auto &c : msg)
	{
		// replace nul-characters with ? to avoid truncation
		if (c == '\0')
			c = '?';
	}

	{
		auto const lock = std::lock_guard (s_lock);
		pushMessage (level_, std::move (msg));
	}

	errno = err;
}

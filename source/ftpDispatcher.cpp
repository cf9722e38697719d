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

#include "ftpDispatcher.h"

#include "log.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <type_traits>
#include <utility>

namespace
{
/// \brief Outcome with a reply and no directive
/// \param state_ Session state
/// \param reply_ Reply to send
Outcome replyWith (SessionState &&state_, FtpReply reply_)
{
	return Outcome{std::move (state_), std::move (reply_), std::nullopt};
}

/// \brief Outcome reporting a filesystem error
/// \param state_ Session state
/// \param error_ errno value
Outcome fsError (SessionState &&state_, int const error_)
{
	return replyWith (std::move (state_), FtpReply::format (550, "%s", std::strerror (error_)));
}

/// \brief Quoted path for 257 replies
/// \param path_ Virtual path
std::string quoted (std::string_view const path_)
{
	return "\"" + encodePath (path_, true) + "\"";
}
}

///////////////////////////////////////////////////////////////////////////
FtpDispatcher::~FtpDispatcher () = default;

FtpDispatcher::FtpDispatcher (FtpConfig const &config_, fs::Sandbox const &sandbox_)
    : m_config (config_), m_sandbox (sandbox_)
{
}

bool FtpDispatcher::authenticated (SessionState const &state_)
{
	return std::holds_alternative<auth::Authenticated> (state_.auth);
}

Outcome FtpDispatcher::dispatch (SessionState state_, FtpCommand const &command_) const
{
	// any command but RNTO ends a rename sequence
	if (!std::holds_alternative<cmd::Rnto> (command_))
		state_.renameFrom.clear ();

	return std::visit (
	    [this, &state_] (auto const &command) -> Outcome {
		    using T = std::decay_t<decltype (command)>;
		    if constexpr (T::AUTH_REQUIRED)
		    {
			    if (!authenticated (state_))
				    return replyWith (std::move (state_), FtpReply::format (530, "Not logged in"));
		    }

		    return handle (std::move (state_), command);
	    },
	    command_);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Malformed const &command_) const
{
	if (command_.unknown)
		return replyWith (std::move (state_), FtpReply::format (502, "Command not implemented"));

	return replyWith (std::move (state_),
	    FtpReply::format (501, "%s: %s", command_.verb.c_str (), command_.reason.c_str ()));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::User const &command_) const
{
	state_.auth = auth::AwaitingPassword{command_.name};
	return replyWith (std::move (state_), FtpReply::format (331, "User name okay, need password"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Pass const &command_) const
{
	if (authenticated (state_))
		return replyWith (std::move (state_), FtpReply::format (503, "Already logged in"));

	auto const awaiting = std::get_if<auth::AwaitingPassword> (&state_.auth);
	if (!awaiting)
		return replyWith (std::move (state_), FtpReply::format (503, "Login with USER first"));

	if (!m_config.acceptsCredentials (awaiting->user, command_.password))
	{
		// stay in AwaitingPassword so the client may retry
		info ("Login failed for user %s\n", awaiting->user.c_str ());
		return replyWith (std::move (state_), FtpReply::format (530, "Login incorrect"));
	}

	state_.auth = auth::Authenticated{std::move (awaiting->user)};
	return replyWith (std::move (state_), FtpReply::format (230, "User logged in, proceed"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Quit const &command_) const
{
	(void)command_;

	state_.lifecycle = Lifecycle::Closing;
	return replyWith (std::move (state_), FtpReply::format (221, "Goodbye"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Syst const &command_) const
{
	(void)command_;
	return replyWith (std::move (state_), FtpReply::format (215, "UNIX Type: L8"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Feat const &command_) const
{
	(void)command_;

	FtpReply reply;
	reply.code = 211;
	reply.lines.emplace_back ("Features:");
	for (auto const &verb : ftpVerbs ())
	{
		if (!verb.feature.empty ())
			reply.lines.emplace_back (" " + std::string (verb.feature));
	}
	reply.lines.emplace_back ("End");

	return replyWith (std::move (state_), std::move (reply));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Help const &command_) const
{
	(void)command_;

	constexpr std::size_t VERBS_PER_LINE = 12;

	FtpReply reply;
	reply.code = 214;
	reply.lines.emplace_back ("The following commands are recognized");

	std::string line;
	std::size_t count = 0;
	for (auto const &verb : ftpVerbs ())
	{
		line.push_back (' ');
		line += verb.verb;

		if (++count % VERBS_PER_LINE == 0)
			reply.lines.emplace_back (std::move (line)), line.clear ();
	}
	if (!line.empty ())
		reply.lines.emplace_back (std::move (line));

	reply.lines.emplace_back ("Help OK");
	return replyWith (std::move (state_), std::move (reply));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Noop const &command_) const
{
	(void)command_;
	return replyWith (std::move (state_), FtpReply::format (200, "OK"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Pwd const &command_) const
{
	(void)command_;

	auto const path = quoted (state_.cwd);
	return replyWith (
	    std::move (state_), FtpReply::format (257, "%s is the current directory", path.c_str ()));
}

Outcome FtpDispatcher::changeDir (SessionState &&state_, std::string_view const path_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, path_, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	if (!S_ISDIR (path.st.st_mode))
		return fsError (std::move (state_), ENOTDIR);

	if (::access (path.hostPath.c_str (), X_OK) != 0)
		return fsError (std::move (state_), errno);

	state_.cwd = path.path;
	return replyWith (std::move (state_), FtpReply::format (250, "OK"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Cwd const &command_) const
{
	return changeDir (std::move (state_), command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Cdup const &command_) const
{
	(void)command_;
	return changeDir (std::move (state_), "..");
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Type const &command_) const
{
	state_.type = command_.type;
	return replyWith (std::move (state_),
	    FtpReply::format (
	        200, "Type set to %s", command_.type == TransferType::Ascii ? "A" : "I"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Mode const &command_) const
{
	if (command_.mode != 'S')
		return replyWith (std::move (state_), FtpReply::format (504, "Mode not supported"));

	return replyWith (std::move (state_), FtpReply::format (200, "Mode set to S"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Stru const &command_) const
{
	if (command_.structure != 'F')
		return replyWith (std::move (state_), FtpReply::format (504, "Structure not supported"));

	return replyWith (std::move (state_), FtpReply::format (200, "Structure set to F"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Pasv const &command_) const
{
	(void)command_;
	return Outcome{std::move (state_), {}, directive::EnterPassive{}};
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Port const &command_) const
{
	state_.pending = channel::ActiveTarget{command_.addr};
	return replyWith (std::move (state_), FtpReply::format (200, "PORT command successful"));
}

Outcome FtpDispatcher::transfer (SessionState &&state_,
    TransferKind const kind_,
    std::string_view const path_) const
{
	auto const upload = kind_ == TransferKind::Store || kind_ == TransferKind::Append;

	auto path = m_sandbox.resolve (state_.cwd, path_, !upload);
	if (!path)
		return fsError (std::move (state_), path.error);

	switch (kind_)
	{
	case TransferKind::Retrieve:
		if (!S_ISREG (path.st.st_mode))
			return replyWith (std::move (state_), FtpReply::format (550, "Not a regular file"));
		break;

	case TransferKind::Store:
	case TransferKind::Append:
		if (path.exists && S_ISDIR (path.st.st_mode))
			return fsError (std::move (state_), EISDIR);
		break;

	case TransferKind::MachineList:
		if (!S_ISDIR (path.st.st_mode))
			return fsError (std::move (state_), ENOTDIR);
		break;

	case TransferKind::List:
	case TransferKind::NameList:
		break;
	}

	if (std::holds_alternative<channel::None> (state_.pending))
		return replyWith (std::move (state_), FtpReply::format (503, "Use PORT or PASV first"));

	return Outcome{std::move (state_), {}, directive::Transfer{kind_, std::move (path)}};
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::List const &command_) const
{
	return transfer (std::move (state_), TransferKind::List, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Nlst const &command_) const
{
	return transfer (std::move (state_), TransferKind::NameList, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Mlsd const &command_) const
{
	return transfer (std::move (state_), TransferKind::MachineList, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Retr const &command_) const
{
	return transfer (std::move (state_), TransferKind::Retrieve, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Stor const &command_) const
{
	return transfer (std::move (state_), TransferKind::Store, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Appe const &command_) const
{
	return transfer (std::move (state_), TransferKind::Append, command_.path);
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Mlst const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	auto const name = encodePath (path.path);

	FtpReply reply;
	reply.code = 250;
	reply.lines.emplace_back ("Listing " + name);
	reply.lines.emplace_back (" " + formatFacts (path.st) + " " + name);
	reply.lines.emplace_back ("End");

	return replyWith (std::move (state_), std::move (reply));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Size const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	if (!S_ISREG (path.st.st_mode))
		return replyWith (std::move (state_), FtpReply::format (550, "Not a regular file"));

	return replyWith (std::move (state_),
	    FtpReply::format (213, "%llu", static_cast<unsigned long long> (path.st.st_size)));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Mdtm const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	struct tm tm;
	if (!::gmtime_r (&path.st.st_mtime, &tm))
		return fsError (std::move (state_), errno);

	char timestamp[16];
	if (std::strftime (timestamp, sizeof (timestamp), "%Y%m%d%H%M%S", &tm) == 0)
		return fsError (std::move (state_), EOVERFLOW);

	return replyWith (std::move (state_), FtpReply::format (213, "%s", timestamp));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Mkd const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, false);
	if (!path)
		return fsError (std::move (state_), path.error);

	if (path.exists)
		return fsError (std::move (state_), EEXIST);

	if (::mkdir (path.hostPath.c_str (), 0755) != 0)
	{
		auto const err = errno;
		error ("mkdir(%s): %s\n", path.hostPath.c_str (), std::strerror (err));
		return fsError (std::move (state_), err);
	}

	auto const name = quoted (path.path);
	return replyWith (
	    std::move (state_), FtpReply::format (257, "%s directory created", name.c_str ()));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Rmd const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	// the root is not the client's to remove
	if (path.path == "/")
		return fsError (std::move (state_), EPERM);

	if (::rmdir (path.hostPath.c_str ()) != 0)
		return fsError (std::move (state_), errno);

	return replyWith (std::move (state_), FtpReply::format (250, "OK"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Dele const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	if (S_ISDIR (path.st.st_mode))
		return fsError (std::move (state_), EISDIR);

	if (::unlink (path.hostPath.c_str ()) != 0)
		return fsError (std::move (state_), errno);

	return replyWith (std::move (state_), FtpReply::format (250, "OK"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Rnfr const &command_) const
{
	auto const path = m_sandbox.resolve (state_.cwd, command_.path, true);
	if (!path)
		return fsError (std::move (state_), path.error);

	if (path.path == "/")
		return fsError (std::move (state_), EPERM);

	state_.renameFrom = path.path;
	return replyWith (std::move (state_), FtpReply::format (350, "Ready for RNTO"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Rnto const &command_) const
{
	if (state_.renameFrom.empty ())
		return replyWith (std::move (state_), FtpReply::format (503, "RNFR required first"));

	auto const from = m_sandbox.resolve ("/", std::exchange (state_.renameFrom, {}), true);
	if (!from)
		return fsError (std::move (state_), from.error);

	auto const to = m_sandbox.resolve (state_.cwd, command_.path, false);
	if (!to)
		return fsError (std::move (state_), to.error);

	if (to.path == "/")
		return fsError (std::move (state_), EPERM);

	if (::rename (from.hostPath.c_str (), to.hostPath.c_str ()) != 0)
		return fsError (std::move (state_), errno);

	return replyWith (std::move (state_), FtpReply::format (250, "OK"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Allo const &command_) const
{
	(void)command_;
	return replyWith (std::move (state_), FtpReply::format (202, "Superfluous command"));
}

Outcome FtpDispatcher::handle (SessionState &&state_, cmd::Stat const &command_) const
{
	(void)command_;

	auto const &user = std::get<auth::Authenticated> (state_.auth).user;

	char const *channel = "none";
	if (std::holds_alternative<channel::PassiveListening> (state_.pending))
		channel = "passive";
	else if (std::holds_alternative<channel::ActiveTarget> (state_.pending))
		channel = "active";

	FtpReply reply;
	reply.code = 211;
	reply.lines.emplace_back ("sandftpd status");
	reply.lines.emplace_back (" Logged in as " + user);
	reply.lines.emplace_back (
	    std::string (" TYPE: ") + (state_.type == TransferType::Ascii ? "ASCII" : "BINARY"));
	reply.lines.emplace_back (" Working directory: " + encodePath (state_.cwd));
	reply.lines.emplace_back (std::string (" Data connection: ") + channel);
	reply.lines.emplace_back ("End of status");

	return replyWith (std::move (state_), std::move (reply));
}

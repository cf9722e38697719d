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

#include "fs.h"
#include "ftpCommand.h"
#include "ftpConfig.h"
#include "ftpReply.h"
#include "ftpTransfer.h"
#include "sockAddr.h"

#include <optional>
#include <string>
#include <variant>

/// \brief Authentication progress
namespace auth
{
struct Unauthenticated
{
};

struct AwaitingPassword
{
	std::string user;
};

struct Authenticated
{
	std::string user;
};
}

using AuthState = std::variant<auth::Unauthenticated, auth::AwaitingPassword, auth::Authenticated>;

/// \brief Data connection configured for the next transfer
namespace channel
{
struct None
{
};

struct PassiveListening
{
	SockAddr addr;
};

struct ActiveTarget
{
	SockAddr addr;
};
}

using PendingChannel = std::variant<channel::None, channel::PassiveListening, channel::ActiveTarget>;

/// \brief Session lifecycle
enum class Lifecycle
{
	Open,
	Closing,
};

/// \brief Per-connection protocol state
struct SessionState
{
	/// \brief Authentication progress
	AuthState auth;

	/// \brief Working directory, normalized virtual path
	std::string cwd = "/";

	/// \brief Representation type
	TransferType type = TransferType::Binary;

	/// \brief Data connection for the next transfer
	PendingChannel pending;

	/// \brief Lifecycle
	Lifecycle lifecycle = Lifecycle::Open;

	/// \brief RNFR source, virtual path; empty if none
	std::string renameFrom;
};

/// \brief Which transfer to run
enum class TransferKind
{
	Retrieve,
	Store,
	Append,
	List,
	NameList,
	MachineList,
};

/// \brief Work the session must perform after dispatch
namespace directive
{
/// \brief Open a passive listener and answer 227
struct EnterPassive
{
};

/// \brief Run a data transfer over the pending channel
struct Transfer
{
	TransferKind kind;
	fs::SandboxedPath path;
};
}

using Directive = std::variant<directive::EnterPassive, directive::Transfer>;

/// \brief Result of dispatching one command
struct Outcome
{
	/// \brief State after the command
	SessionState state;

	/// \brief Reply to send; empty when a directive produces the replies
	FtpReply reply;

	/// \brief Follow-up work
	std::optional<Directive> directive;
};

/// \brief Routes parsed commands to their handlers
/// \note Stateless apart from its read-only collaborators; safe to share
class FtpDispatcher
{
public:
	~FtpDispatcher ();

	/// \brief Parameterized constructor
	/// \param config_ Server configuration
	/// \param sandbox_ Served filesystem
	FtpDispatcher (FtpConfig const &config_, fs::Sandbox const &sandbox_);

	/// \brief Dispatch one command
	/// \param state_ State before the command
	/// \param command_ Parsed command
	Outcome dispatch (SessionState state_, FtpCommand const &command_) const;

	/// \brief Whether a state is logged in
	/// \param state_ State to check
	static bool authenticated (SessionState const &state_);

private:
	Outcome handle (SessionState &&state_, cmd::User const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Pass const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Quit const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Syst const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Feat const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Help const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Noop const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Pwd const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Cwd const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Cdup const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Type const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Mode const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Stru const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Pasv const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Port const &command_) const;
	Outcome handle (SessionState &&state_, cmd::List const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Nlst const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Mlsd const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Mlst const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Retr const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Stor const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Appe const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Size const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Mdtm const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Mkd const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Rmd const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Dele const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Rnfr const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Rnto const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Allo const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Stat const &command_) const;
	Outcome handle (SessionState &&state_, cmd::Malformed const &command_) const;

	/// \brief Change working directory
	/// \param state_ Session state
	/// \param path_ Client path
	Outcome changeDir (SessionState &&state_, std::string_view path_) const;

	/// \brief Validate a transfer and emit its directive
	/// \param state_ Session state
	/// \param kind_ Transfer kind
	/// \param path_ Client path
	Outcome transfer (SessionState &&state_, TransferKind kind_, std::string_view path_) const;

	/// \brief Server configuration
	FtpConfig const &m_config;

	/// \brief Served filesystem
	fs::Sandbox const &m_sandbox;
};

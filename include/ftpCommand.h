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

#include "sockAddr.h"

#include <span>
#include <string>
#include <string_view>
#include <variant>

/// \brief Representation type
enum class TransferType
{
	Ascii,
	Binary,
};

/// \brief Parsed commands, one type per verb
namespace cmd
{
struct User
{
	static constexpr bool AUTH_REQUIRED = false;
	std::string name;
};

struct Pass
{
	static constexpr bool AUTH_REQUIRED = false;
	std::string password;
};

struct Quit
{
	static constexpr bool AUTH_REQUIRED = false;
};

struct Syst
{
	static constexpr bool AUTH_REQUIRED = false;
};

struct Feat
{
	static constexpr bool AUTH_REQUIRED = false;
};

struct Help
{
	static constexpr bool AUTH_REQUIRED = false;
};

struct Noop
{
	static constexpr bool AUTH_REQUIRED = false;
};

struct Pwd
{
	static constexpr bool AUTH_REQUIRED = true;
};

struct Cwd
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Cdup
{
	static constexpr bool AUTH_REQUIRED = true;
};

struct Type
{
	static constexpr bool AUTH_REQUIRED = true;
	TransferType type;
};

struct Mode
{
	static constexpr bool AUTH_REQUIRED = true;
	char mode;
};

struct Stru
{
	static constexpr bool AUTH_REQUIRED = true;
	char structure;
};

struct Pasv
{
	static constexpr bool AUTH_REQUIRED = true;
};

struct Port
{
	static constexpr bool AUTH_REQUIRED = true;
	SockAddr addr;
};

struct List
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Nlst
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Mlsd
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Mlst
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Retr
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Stor
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Appe
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Size
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Mdtm
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Mkd
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Rmd
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Dele
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Rnfr
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Rnto
{
	static constexpr bool AUTH_REQUIRED = true;
	std::string path;
};

struct Allo
{
	static constexpr bool AUTH_REQUIRED = true;
};

struct Stat
{
	static constexpr bool AUTH_REQUIRED = true;
};

/// \brief Line that could not be turned into a command
struct Malformed
{
	static constexpr bool AUTH_REQUIRED = false;

	/// \brief Upper-cased verb as received
	std::string verb;

	/// \brief Why the arguments were rejected
	std::string reason;

	/// \brief Whether the verb itself is unknown
	bool unknown = false;
};
}

/// \brief Parsed command line
using FtpCommand = std::variant<cmd::User,
    cmd::Pass,
    cmd::Quit,
    cmd::Syst,
    cmd::Feat,
    cmd::Help,
    cmd::Noop,
    cmd::Pwd,
    cmd::Cwd,
    cmd::Cdup,
    cmd::Type,
    cmd::Mode,
    cmd::Stru,
    cmd::Pasv,
    cmd::Port,
    cmd::List,
    cmd::Nlst,
    cmd::Mlsd,
    cmd::Mlst,
    cmd::Retr,
    cmd::Stor,
    cmd::Appe,
    cmd::Size,
    cmd::Mdtm,
    cmd::Mkd,
    cmd::Rmd,
    cmd::Dele,
    cmd::Rnfr,
    cmd::Rnto,
    cmd::Allo,
    cmd::Stat,
    cmd::Malformed>;

/// \brief Verb table entry
struct FtpVerb
{
	/// \brief Verb, upper case
	std::string_view verb;

	/// \brief Argument parser
	FtpCommand (*parse) (std::string_view args_);

	/// \brief FEAT line, empty if not advertised
	std::string_view feature;
};

/// \brief Supported verbs sorted by name, aliases included
std::span<FtpVerb const> ftpVerbs ();

/// \brief Parse a command line
/// \param line_ Line without its CRLF/LF delimiter
FtpCommand parseCommand (std::string_view line_);

/// \brief Name of the verb a command was parsed from
/// \param command_ Parsed command
/// \note Aliases report the canonical verb
std::string_view commandName (FtpCommand const &command_);

/// \brief Encode path for the control connection
/// \param path_ Path to encode
/// \param quotes_ Whether to double embedded quotes
/// \note LF is sent as NUL (RFC 959 pathname convention)
std::string encodePath (std::string_view path_, bool quotes_ = false);

/// \brief Reverse encodePath on received arguments
/// \param path_ Path to decode
std::string decodePath (std::string_view path_);

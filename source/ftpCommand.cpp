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

#include "ftpCommand.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <system_error>

namespace
{
/// \brief Strip surrounding blanks
/// \param str_ String to strip
std::string_view strip (std::string_view const str_)
{
	auto const start = str_.find_first_not_of (" \t");
	if (start == std::string_view::npos)
		return {};

	auto const end = str_.find_last_not_of (" \t");
	return str_.substr (start, end + 1 - start);
}

/// \brief Upper-case a string
/// \param str_ String to convert
std::string upper (std::string_view const str_)
{
	std::string out (str_);
	for (auto &c : out)
		c = static_cast<char> (std::toupper (static_cast<unsigned char> (c)));

	return out;
}

cmd::Malformed malformed (char const *const reason_)
{
	return cmd::Malformed{{}, reason_, false};
}

template <typename T>
FtpCommand noArgs (std::string_view const args_)
{
	(void)args_;
	return T{};
}

template <typename T>
FtpCommand requiredPath (std::string_view const args_)
{
	if (args_.empty ())
		return malformed ("Path required");

	return T{decodePath (args_)};
}

template <typename T>
FtpCommand optionalPath (std::string_view const args_)
{
	return T{decodePath (args_)};
}

template <typename T>
FtpCommand listPath (std::string_view args_)
{
	// clients like to send "LIST -la"; ls flags are not paths
	while (!args_.empty () && args_.front () == '-')
	{
		auto const pos = args_.find (' ');
		if (pos == std::string_view::npos)
			args_ = {};
		else
			args_ = strip (args_.substr (pos));
	}

	return T{decodePath (args_)};
}

FtpCommand parseUser (std::string_view const args_)
{
	if (args_.empty ())
		return malformed ("User name required");

	return cmd::User{std::string (args_)};
}

FtpCommand parsePass (std::string_view const args_)
{
	return cmd::Pass{std::string (args_)};
}

FtpCommand parseType (std::string_view const args_)
{
	auto const type = upper (strip (args_));

	if (type == "A" || type == "A N")
		return cmd::Type{TransferType::Ascii};

	if (type == "I" || type == "L 8")
		return cmd::Type{TransferType::Binary};

	return malformed ("Unsupported type");
}

FtpCommand parseMode (std::string_view const args_)
{
	auto const mode = strip (args_);
	if (mode.size () != 1)
		return malformed ("Mode required");

	return cmd::Mode{static_cast<char> (std::toupper (static_cast<unsigned char> (mode[0])))};
}

FtpCommand parseStru (std::string_view const args_)
{
	auto const stru = strip (args_);
	if (stru.size () != 1)
		return malformed ("Structure required");

	return cmd::Stru{static_cast<char> (std::toupper (static_cast<unsigned char> (stru[0])))};
}

FtpCommand parsePort (std::string_view const args_)
{
	// h1,h2,h3,h4,p1,p2
	std::array<std::uint8_t, 6> fields{};

	auto str = strip (args_);
	for (std::size_t i = 0; i < fields.size (); ++i)
	{
		auto const pos   = str.find (',');
		auto const field = strip (str.substr (0, pos));

		if ((pos == std::string_view::npos) != (i == fields.size () - 1))
			return malformed ("Expected h1,h2,h3,h4,p1,p2");

		unsigned value = 0;
		auto const end = field.data () + field.size ();
		auto const rc  = std::from_chars (field.data (), end, value);
		if (field.empty () || rc.ec != std::errc{} || rc.ptr != end || value > 0xFF)
			return malformed ("Expected h1,h2,h3,h4,p1,p2");

		fields[i] = static_cast<std::uint8_t> (value);
		str       = pos == std::string_view::npos ? std::string_view{} : str.substr (pos + 1);
	}

	auto const port = static_cast<std::uint16_t> ((fields[4] << 8) | fields[5]);
	if (port == 0)
		return malformed ("Invalid port");

	return cmd::Port{SockAddr::fromOctets ({fields[0], fields[1], fields[2], fields[3]}, port)};
}

// clang-format off
constexpr std::array<FtpVerb, 36> s_verbs = {{
	{"ALLO", &noArgs<cmd::Allo>,              {}},
	{"APPE", &requiredPath<cmd::Appe>,        {}},
	{"CDUP", &noArgs<cmd::Cdup>,              {}},
	{"CWD",  &requiredPath<cmd::Cwd>,         {}},
	{"DELE", &requiredPath<cmd::Dele>,        {}},
	{"FEAT", &noArgs<cmd::Feat>,              {}},
	{"HELP", &noArgs<cmd::Help>,              {}},
	{"LIST", &listPath<cmd::List>,            {}},
	{"MDTM", &requiredPath<cmd::Mdtm>,        "MDTM"},
	{"MKD",  &requiredPath<cmd::Mkd>,         {}},
	{"MLSD", &optionalPath<cmd::Mlsd>,        {}},
	{"MLST", &optionalPath<cmd::Mlst>,        "MLST type*;size*;modify*;perm*;"},
	{"MODE", &parseMode,                      {}},
	{"NLST", &listPath<cmd::Nlst>,            {}},
	{"NOOP", &noArgs<cmd::Noop>,              {}},
	{"PASS", &parsePass,                      {}},
	{"PASV", &noArgs<cmd::Pasv>,              "PASV"},
	{"PORT", &parsePort,                      {}},
	{"PWD",  &noArgs<cmd::Pwd>,               {}},
	{"QUIT", &noArgs<cmd::Quit>,              {}},
	{"RETR", &requiredPath<cmd::Retr>,        {}},
	{"RMD",  &requiredPath<cmd::Rmd>,         {}},
	{"RNFR", &requiredPath<cmd::Rnfr>,        {}},
	{"RNTO", &requiredPath<cmd::Rnto>,        {}},
	{"SIZE", &requiredPath<cmd::Size>,        "SIZE"},
	{"STAT", &noArgs<cmd::Stat>,              {}},
	{"STOR", &requiredPath<cmd::Stor>,        {}},
	{"STRU", &parseStru,                      {}},
	{"SYST", &noArgs<cmd::Syst>,              {}},
	{"TYPE", &parseType,                      {}},
	{"USER", &parseUser,                      {}},
	{"XCUP", &noArgs<cmd::Cdup>,              {}},
	{"XCWD", &requiredPath<cmd::Cwd>,         {}},
	{"XMKD", &requiredPath<cmd::Mkd>,         {}},
	{"XPWD", &noArgs<cmd::Pwd>,               {}},
	{"XRMD", &requiredPath<cmd::Rmd>,         {}},
}};
// clang-format on

/// \brief Canonical verb per FtpCommand alternative, in variant order
constexpr std::array<std::string_view, std::variant_size_v<FtpCommand>> s_names = {
    "USER", "PASS", "QUIT", "SYST", "FEAT", "HELP", "NOOP", "PWD",  "CWD",  "CDUP", "TYPE",
    "MODE", "STRU", "PASV", "PORT", "LIST", "NLST", "MLSD", "MLST", "RETR", "STOR", "APPE",
    "SIZE", "MDTM", "MKD",  "RMD",  "DELE", "RNFR", "RNTO", "ALLO", "STAT", "",
};
}

std::span<FtpVerb const> ftpVerbs ()
{
	return s_verbs;
}

FtpCommand parseCommand (std::string_view const line_)
{
	auto const pos  = line_.find (' ');
	auto const verb = upper (line_.substr (0, pos));
	auto const args = pos == std::string_view::npos ? std::string_view{} : line_.substr (pos + 1);

	auto const it = std::lower_bound (std::begin (s_verbs),
	    std::end (s_verbs),
	    verb,
	    [] (FtpVerb const &lhs_, std::string const &rhs_) { return lhs_.verb < rhs_; });

	if (it == std::end (s_verbs) || it->verb != verb)
		return cmd::Malformed{verb, "Command not implemented", true};

	auto command = it->parse (args);
	if (auto const bad = std::get_if<cmd::Malformed> (&command))
		bad->verb = verb;

	return command;
}

std::string_view commandName (FtpCommand const &command_)
{
	if (auto const bad = std::get_if<cmd::Malformed> (&command_))
		return bad->verb;

	return s_names[command_.index ()];
}

std::string encodePath (std::string_view const path_, bool const quotes_)
{
	std::string path;
	path.reserve (path_.size ());

	for (auto const c : path_)
	{
		if (c == '\n')
			path.push_back ('\0');
		else if (quotes_ && c == '"')
			path.append (2, '"');
		else
			path.push_back (c);
	}

	return path;
}

std::string decodePath (std::string_view const path_)
{
	std::string path (path_);
	std::replace (std::begin (path), std::end (path), '\0', '\n');
	return path;
}

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

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

TEST (FtpCommandTest, VerbTableIsSorted)
{
	auto const verbs = ftpVerbs ();
	EXPECT_TRUE (std::is_sorted (std::begin (verbs),
	    std::end (verbs),
	    [] (FtpVerb const &lhs_, FtpVerb const &rhs_) { return lhs_.verb < rhs_.verb; }));
}

TEST (FtpCommandTest, VerbsAreCaseInsensitive)
{
	auto const command = parseCommand ("user anon");
	auto const user    = std::get_if<cmd::User> (&command);
	ASSERT_NE (user, nullptr);
	EXPECT_EQ (user->name, "anon");
	EXPECT_EQ (commandName (command), "USER");
}

TEST (FtpCommandTest, UnknownVerbIsFlagged)
{
	auto const command = parseCommand ("FOOBAR x y");
	auto const bad     = std::get_if<cmd::Malformed> (&command);
	ASSERT_NE (bad, nullptr);
	EXPECT_TRUE (bad->unknown);
	EXPECT_EQ (bad->verb, "FOOBAR");
}

TEST (FtpCommandTest, RestIsNotImplemented)
{
	auto const command = parseCommand ("REST 100");
	auto const bad     = std::get_if<cmd::Malformed> (&command);
	ASSERT_NE (bad, nullptr);
	EXPECT_TRUE (bad->unknown);
}

TEST (FtpCommandTest, PassWithoutArgumentIsEmpty)
{
	for (auto const line : {"PASS", "PASS "})
	{
		auto const command = parseCommand (line);
		auto const pass    = std::get_if<cmd::Pass> (&command);
		ASSERT_NE (pass, nullptr) << line;
		EXPECT_TRUE (pass->password.empty ());
	}
}

TEST (FtpCommandTest, PassKeepsSpaces)
{
	auto const command = parseCommand ("PASS two words");
	auto const pass    = std::get_if<cmd::Pass> (&command);
	ASSERT_NE (pass, nullptr);
	EXPECT_EQ (pass->password, "two words");
}

TEST (FtpCommandTest, UserRequiresName)
{
	auto const command = parseCommand ("USER");
	auto const bad     = std::get_if<cmd::Malformed> (&command);
	ASSERT_NE (bad, nullptr);
	EXPECT_FALSE (bad->unknown);
	EXPECT_EQ (bad->verb, "USER");
}

TEST (FtpCommandTest, PathRequired)
{
	for (auto const line : {"RETR", "STOR", "CWD", "DELE", "RNFR", "MKD", "SIZE"})
	{
		auto const command = parseCommand (line);
		auto const bad     = std::get_if<cmd::Malformed> (&command);
		ASSERT_NE (bad, nullptr) << line;
		EXPECT_FALSE (bad->unknown) << line;
	}
}

TEST (FtpCommandTest, PathKeepsSpaces)
{
	auto const command = parseCommand ("RETR my file.txt");
	auto const retr    = std::get_if<cmd::Retr> (&command);
	ASSERT_NE (retr, nullptr);
	EXPECT_EQ (retr->path, "my file.txt");
}

TEST (FtpCommandTest, AliasesMapToSameCommand)
{
	EXPECT_TRUE (std::holds_alternative<cmd::Pwd> (parseCommand ("XPWD")));
	EXPECT_TRUE (std::holds_alternative<cmd::Cdup> (parseCommand ("XCUP")));
	EXPECT_TRUE (std::holds_alternative<cmd::Cwd> (parseCommand ("XCWD dir")));
	EXPECT_TRUE (std::holds_alternative<cmd::Mkd> (parseCommand ("XMKD dir")));
	EXPECT_TRUE (std::holds_alternative<cmd::Rmd> (parseCommand ("XRMD dir")));
}

TEST (FtpCommandTest, ListDropsFlags)
{
	auto command = parseCommand ("LIST -la");
	auto list    = std::get_if<cmd::List> (&command);
	ASSERT_NE (list, nullptr);
	EXPECT_TRUE (list->path.empty ());

	command = parseCommand ("LIST -a -l sub");
	list    = std::get_if<cmd::List> (&command);
	ASSERT_NE (list, nullptr);
	EXPECT_EQ (list->path, "sub");

	auto const nlst = parseCommand ("NLST");
	ASSERT_TRUE (std::holds_alternative<cmd::Nlst> (nlst));
	EXPECT_TRUE (std::get<cmd::Nlst> (nlst).path.empty ());
}

TEST (FtpCommandTest, TypeShapes)
{
	auto const typeOf = [] (char const *line_) {
		auto const command = parseCommand (line_);
		auto const type    = std::get_if<cmd::Type> (&command);
		EXPECT_NE (type, nullptr) << line_;
		return type ? type->type : TransferType::Binary;
	};

	EXPECT_EQ (typeOf ("TYPE A"), TransferType::Ascii);
	EXPECT_EQ (typeOf ("TYPE a n"), TransferType::Ascii);
	EXPECT_EQ (typeOf ("TYPE I"), TransferType::Binary);
	EXPECT_EQ (typeOf ("TYPE L 8"), TransferType::Binary);

	EXPECT_TRUE (std::holds_alternative<cmd::Malformed> (parseCommand ("TYPE E")));
	EXPECT_TRUE (std::holds_alternative<cmd::Malformed> (parseCommand ("TYPE")));
	EXPECT_TRUE (std::holds_alternative<cmd::Malformed> (parseCommand ("TYPE L 7")));
}

TEST (FtpCommandTest, ModeAndStru)
{
	auto const mode = parseCommand ("MODE s");
	ASSERT_TRUE (std::holds_alternative<cmd::Mode> (mode));
	EXPECT_EQ (std::get<cmd::Mode> (mode).mode, 'S');

	auto const stru = parseCommand ("STRU r");
	ASSERT_TRUE (std::holds_alternative<cmd::Stru> (stru));
	EXPECT_EQ (std::get<cmd::Stru> (stru).structure, 'R');

	EXPECT_TRUE (std::holds_alternative<cmd::Malformed> (parseCommand ("MODE")));
	EXPECT_TRUE (std::holds_alternative<cmd::Malformed> (parseCommand ("STRU FR")));
}

TEST (FtpCommandTest, PortParsesAddress)
{
	auto const command = parseCommand ("PORT 127,0,0,1,195,80");
	auto const port    = std::get_if<cmd::Port> (&command);
	ASSERT_NE (port, nullptr);
	EXPECT_EQ (port->addr.family (), AF_INET);
	EXPECT_STREQ (port->addr.name (), "127.0.0.1");
	EXPECT_EQ (port->addr.port (), 195 * 256 + 80);
}

TEST (FtpCommandTest, PortRejectsBadShapes)
{
	for (auto const line : {"PORT",
	         "PORT 127,0,0,1,195",
	         "PORT 127,0,0,1,195,80,1",
	         "PORT 256,0,0,1,1,1",
	         "PORT 127,0,0,1,0,0",
	         "PORT a,b,c,d,e,f",
	         "PORT 127,0,0,1,-1,80"})
	{
		auto const command = parseCommand (line);
		auto const bad     = std::get_if<cmd::Malformed> (&command);
		ASSERT_NE (bad, nullptr) << line;
		EXPECT_FALSE (bad->unknown) << line;
	}
}

TEST (FtpCommandTest, NoArgumentVerbsIgnoreArguments)
{
	EXPECT_TRUE (std::holds_alternative<cmd::Noop> (parseCommand ("NOOP extra")));
	EXPECT_TRUE (std::holds_alternative<cmd::Allo> (parseCommand ("ALLO 1024")));
	EXPECT_TRUE (std::holds_alternative<cmd::Help> (parseCommand ("HELP RETR")));
}

TEST (FtpCommandTest, PathEncoding)
{
	EXPECT_EQ (encodePath ("a\nb"), std::string ("a\0b", 3));
	EXPECT_EQ (encodePath ("say \"hi\"", true), "say \"\"hi\"\"");
	EXPECT_EQ (encodePath ("say \"hi\""), "say \"hi\"");
	EXPECT_EQ (decodePath (std::string ("a\0b", 3)), "a\nb");
}

TEST (FtpCommandTest, FeaturesAdvertised)
{
	std::vector<std::string_view> features;
	for (auto const &verb : ftpVerbs ())
	{
		if (!verb.feature.empty ())
			features.emplace_back (verb.feature);
	}

	EXPECT_NE (std::find (std::begin (features), std::end (features), "PASV"), std::end (features));
	EXPECT_NE (std::find (std::begin (features), std::end (features), "SIZE"), std::end (features));
	EXPECT_NE (std::find (std::begin (features), std::end (features), "MDTM"), std::end (features));
}

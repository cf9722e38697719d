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

#include "fs.h"

#include "testUtil.h"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <string>

TEST (SandboxTest, Normalize)
{
	EXPECT_EQ (fs::Sandbox::normalize ("/", "a/b"), "/a/b");
	EXPECT_EQ (fs::Sandbox::normalize ("/a", "b"), "/a/b");
	EXPECT_EQ (fs::Sandbox::normalize ("/a/b", "/c/./d/"), "/c/d");
	EXPECT_EQ (fs::Sandbox::normalize ("/a", ""), "/a");
	EXPECT_EQ (fs::Sandbox::normalize ("/a/b", ".."), "/a");
	EXPECT_EQ (fs::Sandbox::normalize ("/a", "../../.."), "/");
	EXPECT_EQ (fs::Sandbox::normalize ("/", "//x//y"), "/x/y");
}

TEST (SandboxTest, CreateRequiresDirectory)
{
	TempDir dir;
	ASSERT_TRUE (writeFile (dir.entry ("file"), "x"));

	EXPECT_EQ (fs::Sandbox::create (dir.entry ("missing").c_str ()), nullptr);
	EXPECT_EQ (fs::Sandbox::create (dir.entry ("file").c_str ()), nullptr);
	EXPECT_NE (fs::Sandbox::create (dir.path ().c_str ()), nullptr);
}

class SandboxResolveTest : public ::testing::Test
{
protected:
	void SetUp () override
	{
		ASSERT_FALSE (m_dir.path ().empty ());
		ASSERT_EQ (::mkdir (m_dir.entry ("root").c_str (), 0755), 0);
		ASSERT_EQ (::mkdir (m_dir.entry ("root/sub").c_str (), 0755), 0);
		ASSERT_EQ (::mkdir (m_dir.entry ("rootother").c_str (), 0755), 0);
		ASSERT_TRUE (writeFile (m_dir.entry ("root/file.txt"), "data"));
		ASSERT_TRUE (writeFile (m_dir.entry ("rootother/secret"), "secret"));

		m_sandbox = fs::Sandbox::create (m_dir.entry ("root").c_str ());
		ASSERT_NE (m_sandbox, nullptr);
	}

	TempDir m_dir;
	fs::UniqueSandbox m_sandbox;
};

TEST_F (SandboxResolveTest, ExistingFile)
{
	auto const path = m_sandbox->resolve ("/", "file.txt", true);
	ASSERT_TRUE (path);
	EXPECT_TRUE (path.exists);
	EXPECT_EQ (path.path, "/file.txt");
	EXPECT_EQ (path.hostPath, m_sandbox->root () + "/file.txt");
	EXPECT_TRUE (S_ISREG (path.st.st_mode));
	EXPECT_EQ (path.st.st_size, 4);
}

TEST_F (SandboxResolveTest, RootMapsToSandboxRoot)
{
	auto const path = m_sandbox->resolve ("/sub", "..", true);
	ASSERT_TRUE (path);
	EXPECT_EQ (path.path, "/");
	EXPECT_EQ (path.hostPath, m_sandbox->root ());
	EXPECT_TRUE (S_ISDIR (path.st.st_mode));
}

TEST_F (SandboxResolveTest, DotDotIsClampedAtRoot)
{
	auto const path = m_sandbox->resolve ("/", "../rootother/secret", true);
	EXPECT_FALSE (path);
	EXPECT_EQ (path.error, ENOENT);
	EXPECT_EQ (path.path, "/rootother/secret");
}

TEST_F (SandboxResolveTest, MissingFile)
{
	auto const path = m_sandbox->resolve ("/", "nope", true);
	EXPECT_EQ (path.error, ENOENT);
}

TEST_F (SandboxResolveTest, NewFileInExistingDirectory)
{
	auto const path = m_sandbox->resolve ("/sub", "new.bin", false);
	ASSERT_TRUE (path);
	EXPECT_FALSE (path.exists);
	EXPECT_EQ (path.path, "/sub/new.bin");
	EXPECT_EQ (path.hostPath, m_sandbox->root () + "/sub/new.bin");
}

TEST_F (SandboxResolveTest, NewFileNeedsParent)
{
	EXPECT_EQ (m_sandbox->resolve ("/", "missing/new.bin", false).error, ENOENT);
	EXPECT_EQ (m_sandbox->resolve ("/", "file.txt/new.bin", false).error, ENOTDIR);
}

TEST_F (SandboxResolveTest, SymlinkEscapeIsRefused)
{
	ASSERT_EQ (::symlink ("/", m_dir.entry ("root/escape").c_str ()), 0);

	EXPECT_EQ (m_sandbox->resolve ("/", "escape", true).error, EPERM);
	EXPECT_EQ (m_sandbox->resolve ("/", "escape/tmp", true).error, EPERM);
	EXPECT_EQ (m_sandbox->resolve ("/", "escape/new.bin", false).error, EPERM);
}

TEST_F (SandboxResolveTest, DanglingSymlinkIsRefused)
{
	auto const outside = m_dir.entry ("rootother/created.bin");
	ASSERT_EQ (::symlink (outside.c_str (), m_dir.entry ("root/dangling").c_str ()), 0);
	ASSERT_EQ (::symlink ("nothing-here", m_dir.entry ("root/sub/broken").c_str ()), 0);

	EXPECT_EQ (m_sandbox->resolve ("/", "dangling", false).error, EPERM);
	EXPECT_EQ (m_sandbox->resolve ("/sub", "broken", false).error, EPERM);
	EXPECT_EQ (m_sandbox->resolve ("/", "dangling", true).error, ENOENT);

	struct stat st;
	EXPECT_NE (::lstat (outside.c_str (), &st), 0);
}

TEST_F (SandboxResolveTest, SiblingWithSharedPrefixIsOutside)
{
	ASSERT_EQ (::symlink ("../rootother", m_dir.entry ("root/other").c_str ()), 0);

	EXPECT_EQ (m_sandbox->resolve ("/", "other/secret", true).error, EPERM);
}

TEST_F (SandboxResolveTest, SymlinkInsideIsFollowed)
{
	ASSERT_EQ (::symlink ("sub", m_dir.entry ("root/link").c_str ()), 0);

	auto const path = m_sandbox->resolve ("/", "link", true);
	ASSERT_TRUE (path);
	EXPECT_TRUE (S_ISDIR (path.st.st_mode));
	EXPECT_EQ (path.path, "/link");
}

TEST (FileTest, WriteThenReadLines)
{
	TempDir dir;
	auto const path = dir.entry ("lines.txt");

	fs::File out;
	ASSERT_TRUE (out.open (path.c_str (), "wb"));
	ASSERT_TRUE (out.writeAll ("one\r\n\ntwo\n", 10));
	ASSERT_TRUE (out.flush ());
	ASSERT_TRUE (out.close ());
	EXPECT_FALSE (out);

	fs::File in;
	ASSERT_TRUE (in.open (path.c_str ()));
	EXPECT_EQ (in.readLine (), "one");
	EXPECT_EQ (in.readLine (), "two");
	EXPECT_TRUE (in.readLine ().empty ());
}

TEST (FileTest, MoveKeepsHandle)
{
	TempDir dir;
	auto const path = dir.entry ("move.txt");
	ASSERT_TRUE (writeFile (path, "abc\n"));

	fs::File first;
	ASSERT_TRUE (first.open (path.c_str ()));
	EXPECT_EQ (first.readLine (), "abc");

	fs::File second (std::move (first));
	EXPECT_TRUE (second);
	EXPECT_TRUE (second.readLine ().empty ());
}

TEST (DirTest, ReadsEntries)
{
	TempDir dir;
	ASSERT_TRUE (writeFile (dir.entry ("a"), ""));
	ASSERT_TRUE (writeFile (dir.entry ("b"), ""));

	fs::Dir d;
	ASSERT_TRUE (d.open (dir.path ().c_str ()));

	std::size_t count = 0;
	while (auto const dent = d.read ())
	{
		std::string const name = dent->d_name;
		if (name != "." && name != "..")
			++count;
	}

	EXPECT_EQ (count, 2u);
}

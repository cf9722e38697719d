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

#include "ioBuffer.h"

#include <gsl/gsl>

#include <dirent.h>

#include <sys/stat.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs
{
/// \brief Client path resolved against the sandbox
struct SandboxedPath
{
	/// \brief Whether resolution succeeded
	explicit operator bool () const
	{
		return error == 0;
	}

	/// \brief Normalized virtual path, always absolute
	std::string path;

	/// \brief Path on the host filesystem
	std::string hostPath;

	/// \brief 0, EPERM (outside sandbox), ENOENT, EACCES or ENOTDIR
	int error = 0;

	/// \brief Whether the target exists
	bool exists = false;

	/// \brief Target status, valid when exists
	struct stat st = {};
};

/// \brief Filesystem subtree served to clients
class Sandbox
{
public:
	~Sandbox ();

	/// \brief Create sandbox
	/// \param root_ Directory to serve
	/// \returns nullptr if root_ is not an accessible directory
	static std::unique_ptr<Sandbox> create (gsl::not_null<gsl::czstring> root_);

	/// \brief Canonical host path of the root
	std::string const &root () const;

	/// \brief Lexically combine a virtual working directory and a client path
	/// \param cwd_ Current virtual directory
	/// \param path_ Client path, absolute or relative
	/// \note ".." never climbs above "/"
	static std::string normalize (std::string_view cwd_, std::string_view path_);

	/// \brief Resolve a client path to a host path inside the sandbox
	/// \param cwd_ Current virtual directory
	/// \param path_ Client path
	/// \param mustExist_ Whether a missing target is an error
	/// \note A missing target still requires its parent to exist inside the sandbox
	SandboxedPath resolve (std::string_view cwd_, std::string_view path_, bool mustExist_) const;

private:
	/// \brief Parameterized constructor
	/// \param root_ Canonical root
	explicit Sandbox (std::string root_);

	/// \brief Whether a canonical host path lies within the root
	/// \param path_ Canonical host path
	bool contains (std::string_view path_) const;

	/// \brief Canonical host path of the root
	std::string const m_root;
};

using UniqueSandbox = std::unique_ptr<Sandbox>;

/// \brief File I/O object
class File
{
public:
	~File ();

	File ();

	File (File const &that_) = delete;

	/// \brief Move constructor
	/// \param that_ Object to move from
	File (File &&that_);

	File &operator= (File const &that_) = delete;

	/// \brief Move assignment
	/// \param that_ Object to move from
	File &operator= (File &&that_);

	/// \brief bool cast operator
	explicit operator bool () const;

	/// \brief std::FILE* cast operator
	operator std::FILE * () const;

	/// \brief Set buffer size
	/// \param size_ Buffer size
	void setBufferSize (std::size_t size_);

	/// \brief Open file
	/// \param path_ Path to open
	/// \param mode_ Access mode (\sa std::fopen)
	bool open (gsl::not_null<gsl::czstring> path_, gsl::not_null<gsl::czstring> mode_ = "rb");

	/// \brief Close file
	/// \returns false if buffered data could not be written
	bool close ();

	/// \brief Flush buffered writes
	bool flush ();

	/// \brief Read data
	/// \param buffer_ Output buffer
	/// \param size_ Size to read
	/// \note Can return partial reads
	std::make_signed_t<std::size_t> read (gsl::not_null<void *> buffer_, std::size_t size_);

	/// \brief Read data
	/// \param buffer_ Output buffer
	/// \note Can return partial reads
	std::make_signed_t<std::size_t> read (IOBuffer &buffer_);

	/// \brief Read line
	std::string_view readLine ();

	/// \brief Write data
	/// \param buffer_ Input data
	/// \param size_ Size to write
	/// \note Can return partial writes
	std::make_signed_t<std::size_t> write (gsl::not_null<void const *> buffer_, std::size_t size_);

	/// \brief Write data
	/// \param buffer_ Input data
	/// \note Can return partial writes
	std::make_signed_t<std::size_t> write (IOBuffer &buffer_);

	/// \brief Write data
	/// \param buffer_ Input data
	/// \param size_ Size to write
	/// \note Fails on partials writes and errors
	bool writeAll (gsl::not_null<void const *> buffer_, std::size_t size_);

private:
	/// \brief Underlying std::FILE*
	std::unique_ptr<std::FILE, int (*) (std::FILE *)> m_fp{nullptr, nullptr};

	/// \brief Buffer
	std::vector<char> m_buffer;

	/// \brief Line buffer
	gsl::owner<char *> m_lineBuffer = nullptr;

	/// \brief Line buffer size
	std::size_t m_lineBufferSize = 0;
};

/// Directory object
class Dir
{
public:
	~Dir ();

	Dir ();

	Dir (Dir const &that_) = delete;

	/// \brief Move constructor
	/// \param that_ Object to move from
	Dir (Dir &&that_);

	Dir &operator= (Dir const &that_) = delete;

	/// \brief Move assignment
	/// \param that_ Object to move from
	Dir &operator= (Dir &&that_);

	/// \brief bool cast operator
	explicit operator bool () const;

	/// \brief Open directory
	/// \param path_ Path to open
	bool open (gsl::not_null<gsl::czstring> path_);

	/// \brief Read a directory entry
	/// \note Returns nullptr on end-of-directory or error; check errno
	dirent *read ();

private:
	/// \brief Underlying DIR*
	std::unique_ptr<DIR, int (*) (DIR *)> m_dp{nullptr, nullptr};
};
}

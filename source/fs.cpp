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
#include "ioBuffer.h"

#include <gsl/pointers>
#include <gsl/util>

#include <cassert>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace
{
/// \brief Canonicalize a host path
/// \param path_ Path to canonicalize
/// \param[out] out_ Canonical path
bool canonical (std::string const &path_, std::string &out_)
{
	auto const rc = std::unique_ptr<char, void (*) (void *)> (
	    ::realpath (path_.c_str (), nullptr), std::free);
	if (!rc)
		return false;

	out_ = rc.get ();
	return true;
}
}

///////////////////////////////////////////////////////////////////////////
fs::Sandbox::~Sandbox () = default;

fs::Sandbox::Sandbox (std::string root_) : m_root (std::move (root_))
{
}

std::unique_ptr<fs::Sandbox> fs::Sandbox::create (gsl::not_null<gsl::czstring> const root_)
{
	std::string root;
	if (!canonical (root_.get (), root))
		return nullptr;

	struct stat st;
	if (::stat (root.c_str (), &st) != 0)
		return nullptr;

	if (!S_ISDIR (st.st_mode))
	{
		errno = ENOTDIR;
		return nullptr;
	}

	return std::unique_ptr<Sandbox> (new Sandbox (std::move (root)));
}

std::string const &fs::Sandbox::root () const
{
	return m_root;
}

std::string fs::Sandbox::normalize (std::string_view const cwd_, std::string_view const path_)
{
	std::vector<std::string_view> components;

	auto const split = [&components] (std::string_view in_) {
		while (!in_.empty ())
		{
			auto const pos       = in_.find ('/');
			auto const component = in_.substr (0, pos);
			in_.remove_prefix (pos == std::string_view::npos ? in_.size () : pos + 1);

			if (component.empty () || component == ".")
				continue;

			if (component == "..")
			{
				// clamp at root
				if (!components.empty ())
					components.pop_back ();
				continue;
			}

			components.emplace_back (component);
		}
	};

	if (path_.empty () || path_.front () != '/')
		split (cwd_);
	split (path_);

	if (components.empty ())
		return "/";

	std::string out;
	for (auto const &component : components)
	{
		out.push_back ('/');
		out.append (component);
	}

	return out;
}

bool fs::Sandbox::contains (std::string_view const path_) const
{
	if (path_.size () < m_root.size () || path_.substr (0, m_root.size ()) != m_root)
		return false;

	// "/srv/ftp" must not admit "/srv/ftpother"
	return path_.size () == m_root.size () || m_root == "/" || path_[m_root.size ()] == '/';
}

fs::SandboxedPath fs::Sandbox::resolve (std::string_view const cwd_,
    std::string_view const path_,
    bool const mustExist_) const
{
	SandboxedPath result;
	result.path     = normalize (cwd_, path_);
	result.hostPath = result.path == "/" ? m_root : (m_root == "/" ? "" : m_root) + result.path;

	std::string real;
	if (canonical (result.hostPath, real))
	{
		// symlinks may point anywhere
		if (!contains (real))
		{
			result.error = EPERM;
			return result;
		}

		if (::stat (real.c_str (), &result.st) != 0)
		{
			result.error = errno;
			return result;
		}

		result.exists = true;
		return result;
	}

	if (errno != ENOENT || mustExist_)
	{
		result.error = errno;
		return result;
	}

	// target does not exist yet; its parent must
	auto const slash  = result.hostPath.find_last_of ('/');
	auto const parent = slash == 0 ? std::string ("/") : result.hostPath.substr (0, slash);
	if (!canonical (parent, real))
	{
		result.error = errno;
		return result;
	}

	if (!contains (real))
	{
		result.error = EPERM;
		return result;
	}

	struct stat st;
	if (::stat (real.c_str (), &st) != 0)
	{
		result.error = errno;
		return result;
	}

	if (!S_ISDIR (st.st_mode))
	{
		result.error = ENOTDIR;
		return result;
	}

	// a dangling symlink would be followed on create
	if (::lstat (result.hostPath.c_str (), &st) == 0 || errno != ENOENT)
	{
		result.error = EPERM;
		return result;
	}

	result.hostPath = (real == "/" ? "" : real) + result.hostPath.substr (slash);
	return result;
}

///////////////////////////////////////////////////////////////////////////
fs::File::~File ()
{
	std::free (m_lineBuffer);
}

fs::File::File () = default;

fs::File::File (File &&that_)
    : m_fp (std::move (that_.m_fp)),
      m_buffer (std::move (that_.m_buffer)),
      m_lineBuffer (std::exchange (that_.m_lineBuffer, nullptr)),
      m_lineBufferSize (std::exchange (that_.m_lineBufferSize, 0))
{
}

fs::File &fs::File::operator= (File &&that_)
{
	std::swap (m_fp, that_.m_fp);
	std::swap (m_buffer, that_.m_buffer);
	std::swap (m_lineBuffer, that_.m_lineBuffer);
	std::swap (m_lineBufferSize, that_.m_lineBufferSize);
	return *this;
}

fs::File::operator bool () const
{
	return static_cast<bool> (m_fp);
}

fs::File::operator FILE * () const
{
	return m_fp.get ();
}

void fs::File::setBufferSize (std::size_t const size_)
{
	if (m_buffer.size () != size_)
		m_buffer.resize (size_);

	if (m_fp)
		(void)std::setvbuf (m_fp.get (), m_buffer.data (), _IOFBF, m_buffer.size ());
}

bool fs::File::open (gsl::not_null<gsl::czstring> const path_,
    gsl::not_null<gsl::czstring> const mode_)
{
	gsl::owner<FILE *> fp = std::fopen (path_, mode_);
	if (!fp)
		return false;

	m_fp = std::unique_ptr<std::FILE, int (*) (std::FILE *)> (fp, &std::fclose);

	if (!m_buffer.empty ())
		(void)std::setvbuf (m_fp.get (), m_buffer.data (), _IOFBF, m_buffer.size ());

	return true;
}

bool fs::File::close ()
{
	gsl::owner<FILE *> fp = m_fp.release ();
	if (!fp)
		return true;

	return std::fclose (fp) == 0;
}

bool fs::File::flush ()
{
	return std::fflush (m_fp.get ()) == 0;
}

std::make_signed_t<std::size_t> fs::File::read (gsl::not_null<void *> const buffer_,
    std::size_t const size_)
{
	assert (size_ > 0);

	auto const rc = std::fread (buffer_, 1, size_, m_fp.get ());
	if (rc == 0)
	{
		if (std::feof (m_fp.get ()))
			return 0;
		return -1;
	}

	return gsl::narrow_cast<std::make_signed_t<std::size_t>> (rc);
}

std::make_signed_t<std::size_t> fs::File::read (IOBuffer &buffer_)
{
	assert (buffer_.freeSize () > 0);

	auto const rc = read (buffer_.freeArea (), buffer_.freeSize ());
	if (rc > 0)
		buffer_.markUsed (rc);

	return rc;
}

std::string_view fs::File::readLine ()
{
	while (true)
	{
		auto rc = ::getline (&m_lineBuffer, &m_lineBufferSize, m_fp.get ());
		if (rc < 0)
			return {};

		while (rc > 0)
		{
			if (m_lineBuffer[rc - 1] != '\r' && m_lineBuffer[rc - 1] != '\n')
				break;

			m_lineBuffer[--rc] = 0;
		}

		if (rc > 0)
			return {m_lineBuffer, gsl::narrow_cast<std::size_t> (rc)};
	}
}

std::make_signed_t<std::size_t> fs::File::write (gsl::not_null<void const *> const buffer_,
    std::size_t const size_)
{
	assert (size_ > 0);

	auto const rc = std::fwrite (buffer_, 1, size_, m_fp.get ());
	if (rc == 0)
		return -1;

	return gsl::narrow_cast<std::make_signed_t<std::size_t>> (rc);
}

std::make_signed_t<std::size_t> fs::File::write (IOBuffer &buffer_)
{
	assert (buffer_.usedSize () > 0);

	auto const rc = write (buffer_.usedArea (), buffer_.usedSize ());
	if (rc > 0)
		buffer_.markFree (rc);

	return rc;
}

bool fs::File::writeAll (gsl::not_null<void const *> const buffer_, std::size_t const size_)
{
	assert (size_ > 0);

	auto const p = static_cast<char const *> (buffer_.get ());

	std::size_t bytes = 0;
	while (bytes < size_)
	{
		auto const rc = write (p + bytes, size_ - bytes);
		if (rc <= 0)
			return false;

		bytes += rc;
	}

	return true;
}

///////////////////////////////////////////////////////////////////////////
fs::Dir::~Dir () = default;

fs::Dir::Dir () = default;

fs::Dir::Dir (Dir &&that_) = default;

fs::Dir &fs::Dir::operator= (Dir &&that_) = default;

fs::Dir::operator bool () const
{
	return static_cast<bool> (m_dp);
}

bool fs::Dir::open (gsl::not_null<gsl::czstring> const path_)
{
	auto const dp = ::opendir (path_);
	if (!dp)
		return false;

	m_dp = std::unique_ptr<DIR, int (*) (DIR *)> (dp, &::closedir);
	return true;
}

dirent *fs::Dir::read ()
{
	errno = 0;
	return ::readdir (m_dp.get ());
}

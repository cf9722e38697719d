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

#include "ftpTransfer.h"

#include "log.h"

#include <dirent.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace
{
/// \brief Transfer buffer size
constexpr std::size_t XFER_BUFFERSIZE = 65536;

/// \brief Entry type character for LIST
/// \param mode_ File mode
char typeChar (mode_t const mode_)
{
	// clang-format off
	return S_ISREG (mode_)  ? '-' :
	       S_ISDIR (mode_)  ? 'd' :
	       S_ISLNK (mode_)  ? 'l' :
	       S_ISCHR (mode_)  ? 'c' :
	       S_ISBLK (mode_)  ? 'b' :
	       S_ISFIFO (mode_) ? 'p' :
	       S_ISSOCK (mode_) ? 's' :
	       '?';
	// clang-format on
}

/// \brief Entry type fact for MLSD/MLST
/// \param mode_ File mode
char const *typeFact (mode_t const mode_)
{
	// clang-format off
	return S_ISREG (mode_)  ? "file" :
	       S_ISDIR (mode_)  ? "dir" :
	       S_ISLNK (mode_)  ? "os.unix=symlink" :
	       S_ISCHR (mode_)  ? "os.unix=character" :
	       S_ISBLK (mode_)  ? "os.unix=block" :
	       S_ISFIFO (mode_) ? "os.unix=fifo" :
	       S_ISSOCK (mode_) ? "os.unix=socket" :
	       "???";
	// clang-format on
}

/// \brief Format a timestamp in UTC
/// \param time_ Timestamp
/// \param fmt_ strftime format
std::string formatTime (std::time_t const time_, char const *const fmt_)
{
	struct tm tm;
	if (!::gmtime_r (&time_, &tm))
		return {};

	char buffer[64];
	auto const rc = std::strftime (buffer, sizeof (buffer), fmt_, &tm);
	return std::string (buffer, rc);
}
}

std::string formatListLine (struct stat const &st_, std::string_view const name_)
{
	char prefix[128];
	std::snprintf (prefix,
	    sizeof (prefix),
	    "%c%s 1 ftp ftp %llu ",
	    typeChar (st_.st_mode),
	    S_ISDIR (st_.st_mode) ? "rwxr-xr-x" : "rw-r--r--",
	    static_cast<unsigned long long> (st_.st_size));

	std::string line = prefix;
	line += formatTime (st_.st_mtime, "%d %b %Y %H:%M");
	line.push_back (' ');
	line += encodePath (name_);
	return line;
}

std::string formatFacts (struct stat const &st_)
{
	auto const mode = st_.st_mode;

	std::string perm;
	if (S_ISREG (mode) && (mode & S_IWUSR))
		perm.push_back ('a');
	if (S_ISDIR (mode) && (mode & S_IWUSR))
		perm.push_back ('c');
	perm.push_back ('d');
	if (S_ISDIR (mode) && (mode & S_IXUSR))
		perm.push_back ('e');
	perm.push_back ('f');
	if (S_ISDIR (mode) && (mode & S_IRUSR))
		perm.push_back ('l');
	if (S_ISDIR (mode) && (mode & S_IWUSR))
		perm += "mp";
	if (S_ISREG (mode) && (mode & S_IRUSR))
		perm.push_back ('r');
	if (S_ISREG (mode) && (mode & S_IWUSR))
		perm.push_back ('w');

	char facts[128];
	std::snprintf (facts,
	    sizeof (facts),
	    "type=%s;size=%llu;modify=%s;perm=%s;",
	    typeFact (mode),
	    static_cast<unsigned long long> (st_.st_size),
	    formatTime (st_.st_mtime, "%Y%m%d%H%M%S").c_str (),
	    perm.c_str ());

	return facts;
}

std::string formatEntry (ListFormat const format_,
    struct stat const &st_,
    std::string_view const name_)
{
	switch (format_)
	{
	case ListFormat::Long:
		return formatListLine (st_, name_);

	case ListFormat::Names:
		return encodePath (name_);

	case ListFormat::Facts:
		return formatFacts (st_) + " " + encodePath (name_);
	}

	return encodePath (name_);
}

///////////////////////////////////////////////////////////////////////////
bool AsciiEncoder::convert (std::string_view const in_, IOBuffer &out_)
{
	if (out_.freeSize () < 2 * in_.size ())
		return false;

	auto const start = out_.freeArea ();
	auto p           = start;
	for (auto const c : in_)
	{
		// existing CRLF pairs pass through untouched
		if (c == '\n' && !m_lastCr)
			*p++ = '\r';

		*p++     = c;
		m_lastCr = c == '\r';
	}

	out_.markUsed (p - start);
	return true;
}

bool AsciiDecoder::convert (std::string_view const in_, IOBuffer &out_)
{
	if (out_.freeSize () < in_.size () + 1)
		return false;

	auto const start = out_.freeArea ();
	auto p           = start;
	for (auto const c : in_)
	{
		if (m_pendingCr)
		{
			m_pendingCr = false;

			// a lone CR is data
			if (c != '\n')
				*p++ = '\r';
		}

		if (c == '\r')
			m_pendingCr = true;
		else
			*p++ = c;
	}

	out_.markUsed (p - start);
	return true;
}

bool AsciiDecoder::finish (IOBuffer &out_)
{
	if (!m_pendingCr)
		return true;

	if (!out_.append ("\r"))
		return false;

	m_pendingCr = false;
	return true;
}

///////////////////////////////////////////////////////////////////////////
FtpTransfer::~FtpTransfer () = default;

FtpTransfer::FtpTransfer (DataChannel &channel_,
    CancelToken const &cancel_,
    std::chrono::milliseconds const timeout_)
    : m_channel (channel_),
      m_cancel (cancel_),
      m_timeout (timeout_),
      m_buffer (XFER_BUFFERSIZE),
      m_convertBuffer (2 * XFER_BUFFERSIZE + 1)
{
}

FtpReply FtpTransfer::aborted () const
{
	auto const err = m_cancel.cancelled () ? ECANCELED : errno;
	return FtpReply::format (426, "Transfer aborted: %s", std::strerror (err));
}

bool FtpTransfer::flush ()
{
	if (m_buffer.empty ())
		return true;

	if (!m_channel.writeAll (m_buffer, m_cancel, m_timeout))
		return false;

	m_buffer.clear ();
	return true;
}

bool FtpTransfer::push (std::string_view const line_)
{
	if (m_buffer.freeSize () < line_.size () + 2)
	{
		if (!flush ())
			return false;
	}

	// an oversized entry still goes out whole
	if (m_buffer.freeSize () < line_.size () + 2)
	{
		IOBuffer big (line_.size () + 2);
		big.append (line_);
		big.append ("\r\n");
		return m_channel.writeAll (big, m_cancel, m_timeout);
	}

	m_buffer.append (line_);
	m_buffer.append ("\r\n");
	return true;
}

FtpReply FtpTransfer::complete ()
{
	if (!m_channel.finish (m_cancel, m_timeout))
		return aborted ();

	return FtpReply::format (226, "Transfer complete");
}

FtpReply FtpTransfer::retrieve (fs::File &file_, TransferType const type_)
{
	AsciiEncoder encoder;

	while (true)
	{
		if (m_cancel.cancelled ())
			return aborted ();

		m_buffer.clear ();
		auto const rc = file_.read (m_buffer);
		if (rc < 0)
		{
			auto const err = errno;
			error ("fread: %s\n", std::strerror (err));
			return FtpReply::format (451, "Local error: %s", std::strerror (err));
		}

		if (rc == 0)
			break;

		auto &out = type_ == TransferType::Ascii ? m_convertBuffer : m_buffer;
		if (type_ == TransferType::Ascii)
		{
			m_convertBuffer.clear ();
			encoder.convert (m_buffer.usedView (), m_convertBuffer);
		}

		if (!m_channel.writeAll (out, m_cancel, m_timeout))
			return aborted ();
	}

	m_buffer.clear ();
	return complete ();
}

FtpReply FtpTransfer::store (fs::File &file_, TransferType const type_)
{
	AsciiDecoder decoder;

	auto const writeOut = [&file_] (IOBuffer &buffer_) {
		if (buffer_.empty ())
			return true;

		if (!file_.writeAll (buffer_.usedArea (), buffer_.usedSize ()))
			return false;

		buffer_.clear ();
		return true;
	};

	auto const localError = [] () {
		auto const err = errno;
		error ("fwrite: %s\n", std::strerror (err));
		return FtpReply::format (451, "Local error: %s", std::strerror (err));
	};

	while (true)
	{
		if (m_cancel.cancelled ())
			return aborted ();

		m_buffer.clear ();
		auto const rc = m_channel.read (m_buffer, m_cancel, m_timeout);
		if (rc < 0)
			return aborted ();

		if (rc == 0)
			break;

		auto &out = type_ == TransferType::Ascii ? m_convertBuffer : m_buffer;
		if (type_ == TransferType::Ascii)
		{
			m_convertBuffer.clear ();
			decoder.convert (m_buffer.usedView (), m_convertBuffer);
		}

		if (!writeOut (out))
			return localError ();
	}

	// peer finished sending; nothing more to drain
	m_channel.close ();

	m_convertBuffer.clear ();
	decoder.finish (m_convertBuffer);
	if (!writeOut (m_convertBuffer))
		return localError ();

	if (!file_.flush () || !file_.close ())
		return localError ();

	return FtpReply::format (226, "Transfer complete");
}

FtpReply FtpTransfer::list (ListFormat const format_,
    fs::SandboxedPath const &target_,
    fs::Dir &dir_)
{
	m_buffer.clear ();

	if (!dir_)
	{
		// listing a single non-directory entry
		auto const pos  = target_.path.find_last_of ('/');
		auto const name = target_.path.substr (pos + 1);
		if (!push (formatEntry (format_, target_.st, name)))
			return aborted ();

		if (!flush ())
			return aborted ();

		return complete ();
	}

	while (true)
	{
		if (m_cancel.cancelled ())
			return aborted ();

		auto const dent = dir_.read ();
		if (!dent)
		{
			if (errno != 0)
			{
				auto const err = errno;
				error ("readdir: %s\n", std::strerror (err));
				return FtpReply::format (451, "Local error: %s", std::strerror (err));
			}
			break;
		}

		std::string_view const name = dent->d_name;
		if (name == "." || name == "..")
			continue;

		auto const path = target_.hostPath + "/" + std::string (name);

		struct stat st;
		if (::lstat (path.c_str (), &st) != 0)
		{
			// entry vanished while listing
			debug ("lstat(%s): %s\n", path.c_str (), std::strerror (errno));
			continue;
		}

		if (!push (formatEntry (format_, st, name)))
			return aborted ();
	}

	if (!flush ())
		return aborted ();

	return complete ();
}

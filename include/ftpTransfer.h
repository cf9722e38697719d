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

#include "cancel.h"
#include "dataChannel.h"
#include "fs.h"
#include "ftpCommand.h"
#include "ftpReply.h"
#include "ioBuffer.h"

#include <sys/stat.h>

#include <chrono>
#include <string>
#include <string_view>

/// \brief Directory listing format
enum class ListFormat
{
	/// \brief LIST, ls -l style
	Long,
	/// \brief NLST, names only
	Names,
	/// \brief MLSD, RFC 3659 facts
	Facts,
};

/// \brief Format one LIST line without its delimiter
/// \param st_ Entry status
/// \param name_ Entry name
std::string formatListLine (struct stat const &st_, std::string_view name_);

/// \brief Format RFC 3659 facts, e.g. "type=file;size=3;modify=20240101000000;perm=adfrw;"
/// \param st_ Entry status
std::string formatFacts (struct stat const &st_);

/// \brief Format one listing line without its delimiter
/// \param format_ Listing format
/// \param st_ Entry status
/// \param name_ Entry name
std::string formatEntry (ListFormat format_, struct stat const &st_, std::string_view name_);

/// \brief Bare LF to CRLF, for ASCII retrieval
class AsciiEncoder
{
public:
	/// \brief Convert a chunk
	/// \param in_ Input chunk
	/// \param out_ Output; needs room for twice the input
	bool convert (std::string_view in_, IOBuffer &out_);

private:
	/// \brief Whether the previous chunk ended in CR
	bool m_lastCr = false;
};

/// \brief CRLF to LF, for ASCII storage
class AsciiDecoder
{
public:
	/// \brief Convert a chunk
	/// \param in_ Input chunk
	/// \param out_ Output; needs room for the input plus one byte
	/// \note A trailing CR is held back until the next chunk
	bool convert (std::string_view in_, IOBuffer &out_);

	/// \brief Emit a CR held back at end of stream
	/// \param out_ Output
	bool finish (IOBuffer &out_);

private:
	/// \brief Whether a CR is held back
	bool m_pendingCr = false;
};

/// \brief Streams one transfer over an established data channel
class FtpTransfer
{
public:
	~FtpTransfer ();

	/// \brief Parameterized constructor
	/// \param channel_ Established data channel
	/// \param cancel_ Session cancellation token
	/// \param timeout_ Stall timeout for data channel I/O
	FtpTransfer (DataChannel &channel_,
	    CancelToken const &cancel_,
	    std::chrono::milliseconds timeout_);

	FtpTransfer (FtpTransfer const &that_) = delete;

	FtpTransfer &operator= (FtpTransfer const &that_) = delete;

	/// \brief Send a file (RETR)
	/// \param file_ Open source file
	/// \param type_ Representation type
	/// \returns 226, 426 or 451 reply
	FtpReply retrieve (fs::File &file_, TransferType type_);

	/// \brief Receive a file (STOR/APPE)
	/// \param file_ Open destination file; closed on return
	/// \param type_ Representation type
	/// \returns 226, 426 or 451 reply
	FtpReply store (fs::File &file_, TransferType type_);

	/// \brief Send a directory listing (LIST/NLST/MLSD)
	/// \param format_ Listing format
	/// \param target_ Resolved listing target
	/// \param dir_ Open directory, or closed if target_ is not a directory
	/// \returns 226, 426 or 451 reply
	FtpReply list (ListFormat format_, fs::SandboxedPath const &target_, fs::Dir &dir_);

private:
	/// \brief Reply for a failed data channel operation
	FtpReply aborted () const;

	/// \brief Flush transfer buffer to the data channel
	bool flush ();

	/// \brief Append one listing line, flushing as needed
	/// \param line_ Line without delimiter
	bool push (std::string_view line_);

	/// \brief Half-close and collect the final reply
	FtpReply complete ();

	/// \brief Data channel
	DataChannel &m_channel;

	/// \brief Cancellation token
	CancelToken const &m_cancel;

	/// \brief Stall timeout
	std::chrono::milliseconds const m_timeout;

	/// \brief Transfer buffer
	IOBuffer m_buffer;

	/// \brief ASCII conversion buffer
	IOBuffer m_convertBuffer;
};

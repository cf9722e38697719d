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

#include "ftpEvents.h"
#include "platform.h"
#include "sockAddr.h"
#include "socket.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

/// \brief Scratch directory, removed with its contents on destruction
class TempDir
{
public:
	~TempDir ();

	TempDir ();

	TempDir (TempDir const &that_) = delete;

	TempDir &operator= (TempDir const &that_) = delete;

	/// \brief Host path of the directory
	std::string const &path () const;

	/// \brief Host path of an entry inside the directory
	/// \param name_ Relative entry name
	std::string entry (std::string_view name_) const;

private:
	/// \brief Host path
	std::string m_path;
};

/// \brief Write a whole file
/// \param path_ Host path
/// \param data_ File contents
bool writeFile (std::string const &path_, std::string_view data_);

/// \brief Read a whole file
/// \param path_ Host path
std::string readFile (std::string const &path_);

/// \brief Deterministic pseudo-random payload
/// \param size_ Payload size
/// \param seed_ Generator seed
std::string makePayload (std::size_t size_, unsigned seed_);

/// \brief Send all of data_
/// \param socket_ Connected socket
/// \param data_ Data to send
bool sendAll (Socket &socket_, std::string_view data_);

/// \brief Receive until the peer closes
/// \param socket_ Connected socket
std::string recvAll (Socket &socket_);

/// \brief One reply as seen by a client
struct ClientReply
{
	/// \brief Reply code; 0 on timeout or disconnect
	unsigned code = 0;

	/// \brief Raw reply text including delimiters
	std::string text;
};

/// \brief Minimal blocking FTP client for driving a server in tests
class FtpClient
{
public:
	/// \brief Reply wait limit
	constexpr static auto REPLY_TIMEOUT = std::chrono::seconds (10);

	/// \brief Connect to a server and consume its greeting
	/// \param addr_ Server address
	/// \param[out] greeting_ Greeting reply
	bool connect (SockAddr const &addr_, ClientReply *greeting_ = nullptr);

	/// \brief Send a line without waiting for the reply
	/// \param line_ Command line without delimiter
	bool sendLine (std::string_view line_);

	/// \brief Send raw bytes
	/// \param data_ Data to send
	bool sendRaw (std::string_view data_);

	/// \brief Read one complete reply
	ClientReply readReply ();

	/// \brief Send a command and read its reply
	/// \param line_ Command line without delimiter
	ClientReply command (std::string_view line_);

	/// \brief USER and PASS
	/// \param user_ User name
	/// \param pass_ Password
	/// \returns Reply to PASS
	ClientReply login (std::string_view user_, std::string_view pass_);

	/// \brief Enter passive mode and connect the data socket
	/// \param[out] port_ Port announced by the server
	UniqueSocket passive (std::uint16_t *port_ = nullptr);

	/// \brief Run a download-style command and collect its data
	/// \param line_ Command line
	/// \param[out] data_ Received data
	/// \returns Final reply
	ClientReply download (std::string_view line_, std::string &data_);

	/// \brief Run an upload-style command
	/// \param line_ Command line
	/// \param data_ Data to send
	/// \returns Final reply
	ClientReply upload (std::string_view line_, std::string_view data_);

	/// \brief Whether the server closed the control connection
	bool closedByPeer ();

	/// \brief Local name of the control connection
	SockAddr const &sockName () const;

private:
	/// \brief Read one line of reply text
	/// \param[out] line_ Line including delimiter
	bool readLine (std::string &line_);

	/// \brief Control socket
	UniqueSocket m_socket;

	/// \brief Received but unconsumed text
	std::string m_pending;
};

/// \brief Event sink that remembers what it saw
class RecordingEventSink : public FtpEventSink
{
public:
	void connectionOpened (SessionId id_, SockAddr const &peer_) override;

	void connectionClosed (SessionId id_) override;

	void commandReceived (SessionId id_, std::string_view line_) override;

	void error (SessionId id_, std::string_view message_) override;

	/// \brief Number of opened connections
	std::size_t opened () const;

	/// \brief Number of closed connections
	std::size_t closed () const;

	/// \brief Received command lines
	std::vector<std::string> commands () const;

private:
	/// \brief Mutex
	mutable platform::Mutex m_lock;

	/// \brief Opened connections
	std::size_t m_opened = 0;

	/// \brief Closed connections
	std::size_t m_closed = 0;

	/// \brief Received command lines
	std::vector<std::string> m_commands;
};

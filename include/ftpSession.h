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
#include "ftpConfig.h"
#include "ftpDispatcher.h"
#include "ftpEvents.h"
#include "ioBuffer.h"
#include "socket.h"

#include <atomic>
#include <memory>
#include <string>
#include <string_view>

class FtpSession;
using UniqueFtpSession = std::unique_ptr<FtpSession>;

/// \brief FTP control session
/// \note All protocol state is owned by the thread running run ()
class FtpSession
{
public:
	~FtpSession ();

	/// \brief Run the command loop until the session closes
	void run ();

	/// \brief Whether run () has finished
	bool dead () const;

	/// \brief Session id
	SessionId id () const;

	/// \brief Peer address
	SockAddr const &peerName () const;

	/// \brief Cancel token observed by this session
	SharedCancelToken const &cancelToken () const;

	/// \brief Control socket
	SharedSocket const &commandSocket () const;

	/// \brief Create session
	/// \param id_ Session id
	/// \param config_ FTP config
	/// \param sandbox_ Served filesystem
	/// \param commandSocket_ Command socket
	static UniqueFtpSession create (SessionId id_,
	    FtpConfig const &config_,
	    fs::Sandbox const &sandbox_,
	    UniqueSocket commandSocket_);

private:
	/// \brief Command buffer size
	constexpr static auto COMMAND_BUFFERSIZE = 4096;

	/// \brief File buffersize
	constexpr static auto FILE_BUFFERSIZE = 4 * 65536;

	/// \brief Parameterized constructor
	/// \param id_ Session id
	/// \param config_ FTP config
	/// \param sandbox_ Served filesystem
	/// \param commandSocket_ Command socket
	FtpSession (SessionId id_,
	    FtpConfig const &config_,
	    fs::Sandbox const &sandbox_,
	    SharedSocket commandSocket_);

	FtpSession (FtpSession const &that_) = delete;

	FtpSession &operator= (FtpSession const &that_) = delete;

	/// \brief Read one command line
	/// \param[out] line_ Line without its delimiter
	/// \returns false if the session must end
	bool readCommand (std::string &line_);

	/// \brief Parse, dispatch and answer one command line
	/// \param line_ Command line
	void handleCommand (std::string_view line_);

	/// \brief Send a reply
	/// \param reply_ Reply to send
	/// \returns false on control I/O failure
	bool sendReply (FtpReply const &reply_);

	/// \brief Open a passive listener and announce it
	void enterPassive ();

	/// \brief Bring the data channel in line with the pending configuration
	void syncChannel ();

	/// \brief Run a data transfer
	/// \param transfer_ Transfer to run
	void transfer (directive::Transfer const &transfer_);

	/// \brief Close command socket
	void closeCommand ();

	/// \brief Session id
	SessionId const m_id;

	/// \brief FTP config
	FtpConfig const &m_config;

	/// \brief Served filesystem
	fs::Sandbox const &m_sandbox;

	/// \brief Command dispatcher
	FtpDispatcher const m_dispatcher;

	/// \brief Event sink
	SharedFtpEventSink const m_events;

	/// \brief Command socket
	SharedSocket m_commandSocket;

	/// \brief Peer address
	SockAddr const m_peerName;

	/// \brief Cancel token
	SharedCancelToken const m_cancel;

	/// \brief Protocol state
	SessionState m_state;

	/// \brief Data channel for the next transfer
	UniqueDataChannel m_dataChannel;

	/// \brief Command buffer
	IOBuffer m_commandBuffer;

	/// \brief Whether run () has finished
	std::atomic<bool> m_dead = false;
};

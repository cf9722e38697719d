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

#include "ftpSession.h"

#include "ftpTransfer.h"
#include "log.h"
#include "platform.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace
{
/// \brief Token for waits that must complete even while shutting down
CancelToken const s_uncancelled;

/// \brief Whether two addresses name the same endpoint
bool sameAddress (SockAddr const &lhs_, SockAddr const &rhs_)
{
	return lhs_.family () == rhs_.family () && lhs_.str () == rhs_.str ();
}

/// \brief Whether an upload target could be created or overwritten
/// \param path_ Resolved target
bool writable (fs::SandboxedPath const &path_)
{
	if (path_.exists)
		return ::access (path_.hostPath.c_str (), W_OK) == 0;

	auto const slash  = path_.hostPath.find_last_of ('/');
	auto const parent = slash == 0 ? std::string ("/") : path_.hostPath.substr (0, slash);
	return ::access (parent.c_str (), W_OK | X_OK) == 0;
}
}

///////////////////////////////////////////////////////////////////////////
FtpSession::~FtpSession ()
{
	closeCommand ();
}

FtpSession::FtpSession (SessionId const id_,
    FtpConfig const &config_,
    fs::Sandbox const &sandbox_,
    SharedSocket commandSocket_)
    : m_id (id_),
      m_config (config_),
      m_sandbox (sandbox_),
      m_dispatcher (config_, sandbox_),
      m_events (config_.eventSink ()),
      m_commandSocket (std::move (commandSocket_)),
      m_peerName (m_commandSocket->peerName ()),
      m_cancel (CancelToken::create ()),
      m_commandBuffer (COMMAND_BUFFERSIZE)
{
}

UniqueFtpSession FtpSession::create (SessionId const id_,
    FtpConfig const &config_,
    fs::Sandbox const &sandbox_,
    UniqueSocket commandSocket_)
{
	if (!commandSocket_ || !commandSocket_->setNonBlocking ())
		return nullptr;

	return UniqueFtpSession (new FtpSession (id_, config_, sandbox_, std::move (commandSocket_)));
}

bool FtpSession::dead () const
{
	return m_dead;
}

SessionId FtpSession::id () const
{
	return m_id;
}

SockAddr const &FtpSession::peerName () const
{
	return m_peerName;
}

SharedCancelToken const &FtpSession::cancelToken () const
{
	return m_cancel;
}

SharedSocket const &FtpSession::commandSocket () const
{
	return m_commandSocket;
}

void FtpSession::run ()
{
	if (sendReply (FtpReply::format (220, "Service ready for new user")))
	{
		std::string line;
		while (m_state.lifecycle == Lifecycle::Open)
		{
			if (m_cancel->cancelled ())
			{
				sendReply (FtpReply::format (421, "Server shutting down"));
				break;
			}

			if (!readCommand (line))
				break;

			handleCommand (line);
		}
	}

	m_dataChannel.reset ();
	closeCommand ();
	m_dead = true;
}

bool FtpSession::readCommand (std::string &line_)
{
	while (true)
	{
		auto const view = m_commandBuffer.usedView ();
		auto const pos  = view.find ('\n');
		if (pos != std::string_view::npos)
		{
			auto line = view.substr (0, pos);
			if (!line.empty () && line.back () == '\r')
				line.remove_suffix (1);

			line_ = decodePath (line);
			m_commandBuffer.markFree (pos + 1);
			m_commandBuffer.coalesce ();
			return true;
		}

		m_commandBuffer.coalesce ();
		if (m_commandBuffer.freeSize () == 0)
		{
			error ("Exceeded command buffer size\n");
			m_events->error (m_id, "Command line too long");
			sendReply (FtpReply::format (500, "Command line too long"));
			return false;
		}

		// the control connection has no idle limit; only cancellation ends the wait
		auto const rc = waitSocket (*m_commandSocket, POLLIN, *m_cancel, m_config.dataTimeout ());
		switch (rc)
		{
		case WaitResult::TimedOut:
			continue;

		case WaitResult::Cancelled:
			sendReply (FtpReply::format (421, "Server shutting down"));
			return false;

		case WaitResult::Failed:
			m_events->error (m_id, "Control connection lost");
			return false;

		case WaitResult::Ready:
			break;
		}

		auto const bytes = m_commandSocket->read (m_commandBuffer);
		if (bytes < 0)
		{
			if (errno == EWOULDBLOCK || errno == EAGAIN)
				continue;

			m_events->error (m_id, std::strerror (errno));
			return false;
		}

		if (bytes == 0)
		{
			// peer closed connection
			info ("Peer %s closed connection\n", m_peerName.str ().c_str ());
			return false;
		}
	}
}

void FtpSession::handleCommand (std::string_view const line_)
{
	auto const command = parseCommand (line_);

	if (std::holds_alternative<cmd::Pass> (command))
		m_events->commandReceived (m_id, "PASS ******");
	else
		m_events->commandReceived (m_id, line_);

	auto outcome = m_dispatcher.dispatch (std::move (m_state), command);
	m_state      = std::move (outcome.state);

	syncChannel ();

	if (outcome.reply && !sendReply (outcome.reply))
		return;

	if (!outcome.directive)
		return;

	std::visit (
	    [this] (auto const &directive_) {
		    using T = std::decay_t<decltype (directive_)>;
		    if constexpr (std::is_same_v<T, directive::EnterPassive>)
			    enterPassive ();
		    else
			    transfer (directive_);
	    },
	    *outcome.directive);
}

bool FtpSession::sendReply (FtpReply const &reply_)
{
	if (!m_commandSocket)
		return false;

	auto const text = reply_.encode ();
	addLog (RESPONSE, text);

	IOBuffer buffer (text.size ());
	buffer.append (text);

	while (!buffer.empty ())
	{
		// replies are owed even while shutting down
		auto const rc = waitSocket (*m_commandSocket, POLLOUT, s_uncancelled, m_config.dataTimeout ());
		if (rc != WaitResult::Ready)
		{
			error ("Failed to send reply to %s\n", m_peerName.str ().c_str ());
			m_state.lifecycle = Lifecycle::Closing;
			return false;
		}

		auto const bytes = m_commandSocket->write (buffer);
		if (bytes < 0 && errno != EWOULDBLOCK && errno != EAGAIN)
		{
			m_events->error (m_id, std::strerror (errno));
			m_state.lifecycle = Lifecycle::Closing;
			return false;
		}
	}

	return true;
}

void FtpSession::enterPassive ()
{
	// a new PASV replaces whatever was pending
	m_dataChannel.reset ();
	m_state.pending = channel::None{};

	auto addr = m_commandSocket->sockName ();
	if (addr.isWildcard () && !platform::networkAddress (addr))
	{
		sendReply (FtpReply::format (425, "Can't open data connection"));
		return;
	}

	auto channel = DataChannel::listen (addr);
	if (!channel)
	{
		auto const err = errno;
		m_events->error (m_id, std::strerror (err));
		sendReply (FtpReply::format (425, "Can't open data connection: %s", std::strerror (err)));
		return;
	}

	auto const &bound = channel->address ();
	auto const octets = bound.octets ();
	auto const port   = bound.port ();

	m_state.pending = channel::PassiveListening{bound};
	m_dataChannel   = std::move (channel);

	sendReply (FtpReply::format (227,
	    "Entering Passive Mode (%u,%u,%u,%u,%u,%u).",
	    octets[0],
	    octets[1],
	    octets[2],
	    octets[3],
	    port >> 8,
	    port & 0xFF));
}

void FtpSession::syncChannel ()
{
	if (std::holds_alternative<channel::None> (m_state.pending))
	{
		m_dataChannel.reset ();
		return;
	}

	auto const active = std::get_if<channel::ActiveTarget> (&m_state.pending);
	if (!active)
		return;

	if (m_dataChannel && m_dataChannel->mode () == DataChannel::Mode::Active &&
	    sameAddress (m_dataChannel->address (), active->addr))
		return;

	// PORT replaces a prior passive listener
	m_dataChannel = DataChannel::target (active->addr);
	if (!m_dataChannel)
		m_state.pending = channel::None{};
}

void FtpSession::transfer (directive::Transfer const &transfer_)
{
	auto const &path = transfer_.path;

	// open the local side first; a failure here keeps the pending channel
	fs::File file;
	fs::Dir dir;
	bool opened = true;
	switch (transfer_.kind)
	{
	case TransferKind::Retrieve:
		opened = file.open (path.hostPath.c_str (), "rb");
		break;

	case TransferKind::Store:
		// truncation waits for the data connection
		opened = writable (path);
		break;

	case TransferKind::Append:
		opened = file.open (path.hostPath.c_str (), "ab");
		break;

	case TransferKind::List:
	case TransferKind::NameList:
	case TransferKind::MachineList:
		if (S_ISDIR (path.st.st_mode))
			opened = dir.open (path.hostPath.c_str ());
		break;
	}

	if (!opened)
	{
		sendReply (FtpReply::format (550, "%s", std::strerror (errno)));
		return;
	}

	// the channel serves exactly this transfer
	auto channel    = std::move (m_dataChannel);
	m_state.pending = channel::None{};

	if (!channel || !channel->establish (*m_cancel, m_config.dataTimeout ()))
	{
		auto const err = channel ? errno : ENOTCONN;
		m_events->error (m_id, std::strerror (err));
		sendReply (FtpReply::format (425, "Can't open data connection: %s", std::strerror (err)));
		return;
	}

	if (transfer_.kind == TransferKind::Store && !file.open (path.hostPath.c_str (), "wb"))
	{
		auto const err = errno;
		channel->close ();
		sendReply (FtpReply::format (550, "%s", std::strerror (err)));
		return;
	}

	if (file)
		file.setBufferSize (FILE_BUFFERSIZE);

	if (!sendReply (FtpReply::format (150, "File status okay; about to open data connection")))
		return;

	FtpTransfer xfer (*channel, *m_cancel, m_config.dataTimeout ());

	FtpReply reply;
	switch (transfer_.kind)
	{
	case TransferKind::Retrieve:
		reply = xfer.retrieve (file, m_state.type);
		break;

	case TransferKind::Store:
	case TransferKind::Append:
		reply = xfer.store (file, m_state.type);
		break;

	case TransferKind::List:
		reply = xfer.list (ListFormat::Long, path, dir);
		break;

	case TransferKind::NameList:
		reply = xfer.list (ListFormat::Names, path, dir);
		break;

	case TransferKind::MachineList:
		reply = xfer.list (ListFormat::Facts, path, dir);
		break;
	}

	channel->close ();

	if (reply.code != 226)
		m_events->error (m_id, reply.lines.empty () ? "Transfer failed" : reply.lines.front ());

	sendReply (reply);
}

void FtpSession::closeCommand ()
{
	if (!m_commandSocket)
		return;

	m_commandSocket->shutdown (SHUT_WR);
	m_commandSocket.reset ();
}

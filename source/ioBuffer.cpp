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

#include "ioBuffer.h"

#include <cassert>
#include <cstring>

///////////////////////////////////////////////////////////////////////////
IOBuffer::~IOBuffer () = default;

IOBuffer::IOBuffer (std::size_t const size_)
    : m_buffer (std::make_unique<char[]> (size_)), m_size (size_)
{
	assert (size_ > 0);
}

char *IOBuffer::freeArea () const
{
	assert (m_end <= m_size);
	return m_buffer.get () + m_end;
}

std::size_t IOBuffer::freeSize () const
{
	return m_size - m_end;
}

char *IOBuffer::usedArea () const
{
	return m_buffer.get () + m_start;
}

std::size_t IOBuffer::usedSize () const
{
	assert (m_end >= m_start);
	return m_end - m_start;
}

std::string_view IOBuffer::usedView () const
{
	return {usedArea (), usedSize ()};
}

void IOBuffer::markFree (std::size_t const size_)
{
	assert (usedSize () >= size_);
	m_start += size_;

	// fully drained; rewind so the next fill gets the whole buffer
	if (m_start == m_end)
		clear ();
}

void IOBuffer::markUsed (std::size_t const size_)
{
	assert (freeSize () >= size_);
	m_end += size_;
}

bool IOBuffer::append (std::string_view const data_)
{
	if (data_.size () > freeSize ())
		return false;

	if (!data_.empty ())
		std::memcpy (freeArea (), data_.data (), data_.size ());
	markUsed (data_.size ());
	return true;
}

bool IOBuffer::empty () const
{
	return m_end == m_start;
}

std::size_t IOBuffer::capacity () const
{
	return m_size;
}

void IOBuffer::clear ()
{
	m_start = 0;
	m_end   = 0;
}

void IOBuffer::coalesce ()
{
	auto const size = usedSize ();
	if (size != 0 && m_start != 0)
		std::memmove (m_buffer.get (), usedArea (), size);

	m_start = 0;
	m_end   = size;
}

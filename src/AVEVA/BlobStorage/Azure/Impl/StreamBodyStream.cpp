// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/StreamBodyStream.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"

#include <stdexcept>
namespace AVEVA::BlobStorage::Azure::Impl
{
    StreamBodyStream::StreamBodyStream(std::istream& stream)
        : m_stream(stream),
        m_start(),
        m_length(0)
    {
        // A stream that was read up to its end still uploads, with zero bytes.
        m_stream.clear(m_stream.rdstate() & ~std::ios::eofbit);
        m_start = m_stream.tellg();
        if (m_start == std::istream::pos_type(-1))
        {
            throw Core::InvalidArgumentError("Content stream must be seekable", "content");
        }

        m_stream.seekg(0, std::ios::end);
        const auto end = m_stream.tellg();
        m_stream.seekg(m_start);
        if (end == std::istream::pos_type(-1) || !m_stream)
        {
            throw Core::InvalidArgumentError("Unable to determine the length of the content stream", "content");
        }

        m_length = static_cast<int64_t>(end - m_start);
    }

    int64_t StreamBodyStream::Length() const
    {
        return m_length;
    }

    void StreamBodyStream::Rewind()
    {
        m_stream.clear();
        m_stream.seekg(m_start);
        if (!m_stream)
        {
            throw std::runtime_error("Unable to rewind the content stream");
        }
    }

    size_t StreamBodyStream::OnRead(uint8_t* buffer, size_t count, const ::Azure::Core::Context& context)
    {
        context.ThrowIfCancelled();
        m_stream.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(count));
        if (m_stream.bad())
        {
            throw std::runtime_error("Unable to read from the content stream");
        }

        const auto bytesRead = m_stream.gcount();
        if (bytesRead < 0)
        {
            throw std::runtime_error("Invalid stream read. Received negative number of bytes read.");
        }

        return static_cast<size_t>(bytesRead);
    }
}

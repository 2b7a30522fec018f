// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <azure/core/io/body_stream.hpp>

#include <cstdint>
#include <istream>
namespace AVEVA::BlobStorage::Azure::Impl
{
    /// <summary>
    /// Exposes the rest of a seekable std::istream as an SDK body stream.
    /// Rewind returns to the position the stream had on construction so the SDK can retry the request.
    /// </summary>
    class StreamBodyStream final : public ::Azure::Core::IO::BodyStream
    {
        std::istream& m_stream;
        std::istream::pos_type m_start;
        int64_t m_length;

        size_t OnRead(uint8_t* buffer, size_t count, const ::Azure::Core::Context& context) override;
    public:
        explicit StreamBodyStream(std::istream& stream);
        int64_t Length() const override;
        void Rewind() override;
    };
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <stdexcept>
namespace AVEVA::BlobStorage::Core
{
    BlobDescriptor::BlobDescriptor(std::string name,
        const int64_t size,
        std::optional<std::chrono::system_clock::time_point> lastModified,
        std::optional<std::string> contentType,
        std::optional<std::string> etag)
        : m_name(std::move(name)),
        m_size(size),
        m_lastModified(std::move(lastModified)),
        m_contentType(std::move(contentType)),
        m_etag(std::move(etag))
    {
        if (m_size < 0)
        {
            throw std::out_of_range("Blob size cannot be negative");
        }
    }

    const std::string& BlobDescriptor::GetName() const noexcept
    {
        return m_name;
    }

    int64_t BlobDescriptor::GetSize() const noexcept
    {
        return m_size;
    }

    const std::optional<std::chrono::system_clock::time_point>& BlobDescriptor::GetLastModified() const noexcept
    {
        return m_lastModified;
    }

    const std::optional<std::string>& BlobDescriptor::GetContentType() const noexcept
    {
        return m_contentType;
    }

    const std::optional<std::string>& BlobDescriptor::GetETag() const noexcept
    {
        return m_etag;
    }
}

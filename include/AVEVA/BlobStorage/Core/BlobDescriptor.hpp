// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
namespace AVEVA::BlobStorage::Core
{
    /// <summary>
    /// Read-only description of a blob as reported by the storage service.
    /// </summary>
    class BlobDescriptor
    {
        std::string m_name;
        int64_t m_size;
        std::optional<std::chrono::system_clock::time_point> m_lastModified;
        std::optional<std::string> m_contentType;
        std::optional<std::string> m_etag;

    public:
        BlobDescriptor(std::string name,
            int64_t size,
            std::optional<std::chrono::system_clock::time_point> lastModified = {},
            std::optional<std::string> contentType = {},
            std::optional<std::string> etag = {});

        [[nodiscard]] const std::string& GetName() const noexcept;
        [[nodiscard]] int64_t GetSize() const noexcept;
        [[nodiscard]] const std::optional<std::chrono::system_clock::time_point>& GetLastModified() const noexcept;
        [[nodiscard]] const std::optional<std::string>& GetContentType() const noexcept;
        [[nodiscard]] const std::optional<std::string>& GetETag() const noexcept;

        bool operator==(const BlobDescriptor& other) const = default;
    };
}

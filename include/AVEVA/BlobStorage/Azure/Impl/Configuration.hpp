// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <string_view>
namespace AVEVA::BlobStorage::Azure::Impl
{
    struct Configuration
    {
        static const constexpr std::string_view StorageDomain = "blob.core.windows.net";
        static const constexpr std::string_view EndpointScheme = "https://";
        static const constexpr int MaxClientRetries = 8;
        static const constexpr int32_t ListPageSizeHint = 5000;
        static const constexpr int64_t StreamChunkSize = static_cast<int64_t>(4) * 1024 * 1024; // 4MB
    };
}

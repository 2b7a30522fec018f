// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/BlobClient.hpp"
#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
namespace AVEVA::BlobStorage::Core
{
    struct BlobPage
    {
        std::vector<BlobDescriptor> Blobs;

        /// <summary>
        /// Token for the next page. Empty when this is the last page.
        /// </summary>
        std::optional<std::string> NextPageToken;
    };

    class ContainerClient
    {
    public:
        ContainerClient() = default;
        virtual ~ContainerClient() = default;

        virtual std::unique_ptr<BlobClient> GetBlobClient(const std::string& name) = 0;
        virtual BlobPage ListBlobs(const std::optional<std::string>& prefix,
            const std::optional<std::string>& continuationToken,
            std::stop_token stopToken) = 0;
    };
}

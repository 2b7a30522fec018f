// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <vector>
namespace AVEVA::BlobStorage::Core
{
    /// <summary>
    /// A handle to a single named blob inside the bound container.
    /// Every call is exactly one remote operation.
    /// </summary>
    class BlobClient
    {
    public:
        virtual ~BlobClient() = default;

        /// <summary>
        /// Uploads the remaining content of the stream, replacing any existing blob.
        /// </summary>
        /// <param name="content">A readable, seekable stream positioned at the first byte to upload.</param>
        /// <param name="contentType">The content type header to store with the blob, if any.</param>
        /// <param name="stopToken">Cancels the transfer when a stop is requested.</param>
        virtual void Upload(std::istream& content, const std::optional<std::string>& contentType, std::stop_token stopToken) = 0;

        /// <summary>
        /// Streams the full content of the blob into the destination.
        /// </summary>
        /// <param name="destination">The sink that receives the blob content.</param>
        /// <param name="stopToken">Cancels the transfer when a stop is requested.</param>
        virtual void DownloadTo(std::ostream& destination, std::stop_token stopToken) = 0;

        /// <summary>
        /// Downloads the full content of the blob into memory.
        /// </summary>
        /// <returns>The blob content.</returns>
        virtual std::vector<uint8_t> DownloadContent(std::stop_token stopToken) = 0;

        /// <summary>
        /// Fetches the blob properties.
        /// </summary>
        /// <returns>The blob properties or an empty optional if the blob does not exist.</returns>
        virtual std::optional<BlobDescriptor> GetProperties(std::stop_token stopToken) = 0;

        virtual bool Exists(std::stop_token stopToken) = 0;

        /// <returns>True if a blob was deleted, false if there was nothing to delete.</returns>
        virtual bool DeleteIfExists(std::stop_token stopToken) = 0;
    };
}

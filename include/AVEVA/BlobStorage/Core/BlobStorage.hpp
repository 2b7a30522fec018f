// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <stop_token>
#include <string>
#include <vector>
namespace AVEVA::BlobStorage::Core
{
    /// <summary>
    /// Blob operations against a single container.
    ///
    /// Blank names or paths fail with InvalidArgumentError before any remote call is made.
    /// A stop requested on the token fails the operation with OperationCancelledError.
    /// Remote failures are passed through as reported by the storage client.
    /// </summary>
    class BlobStorage
    {
    public:
        virtual ~BlobStorage() = default;

        /// <summary>
        /// Uploads a blob from a stream, overwriting any existing blob with the same name.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="content">Seekable stream holding the blob content, read from its current position.</param>
        /// <param name="contentType">Optional content type.</param>
        /// <param name="stopToken">Cancellation token.</param>
        virtual void Upload(const std::string& blobName,
            std::istream& content,
            const std::optional<std::string>& contentType = {},
            std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Uploads a file from the local file system.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="filePath">Path to the file to upload.</param>
        /// <param name="contentType">Optional content type.</param>
        /// <param name="stopToken">Cancellation token.</param>
        virtual void UploadFromPath(const std::string& blobName,
            const std::filesystem::path& filePath,
            const std::optional<std::string>& contentType = {},
            std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Downloads a blob into a stream.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="destination">Stream to write the blob content to.</param>
        /// <param name="stopToken">Cancellation token.</param>
        virtual void Download(const std::string& blobName, std::ostream& destination, std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Downloads a blob to a local file, creating parent directories as required.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="filePath">Path where the file will be saved.</param>
        /// <param name="stopToken">Cancellation token.</param>
        virtual void DownloadToPath(const std::string& blobName, const std::filesystem::path& filePath, std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Downloads a blob and returns its content.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="stopToken">Cancellation token.</param>
        /// <returns>The blob content.</returns>
        [[nodiscard]] virtual std::vector<uint8_t> DownloadBytes(const std::string& blobName, std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Gets information about a blob.
        /// </summary>
        /// <param name="blobName">Name of the blob.</param>
        /// <param name="stopToken">Cancellation token.</param>
        /// <returns>The blob information, or an empty optional if the blob does not exist.</returns>
        [[nodiscard]] virtual std::optional<BlobDescriptor> GetInfo(const std::string& blobName, std::stop_token stopToken = {}) = 0;

        /// <returns>True if the blob exists, false otherwise.</returns>
        [[nodiscard]] virtual bool Exists(const std::string& blobName, std::stop_token stopToken = {}) = 0;

        /// <returns>True if the blob was deleted, false if it didn't exist.</returns>
        virtual bool Delete(const std::string& blobName, std::stop_token stopToken = {}) = 0;

        /// <summary>
        /// Lists the blobs in the container.
        /// </summary>
        /// <param name="prefix">Optional prefix to filter blobs.</param>
        /// <param name="stopToken">Cancellation token.</param>
        /// <returns>Every matching blob, in the order reported by the service.</returns>
        [[nodiscard]] virtual std::vector<BlobDescriptor> List(const std::optional<std::string>& prefix = {}, std::stop_token stopToken = {}) = 0;
    };
}

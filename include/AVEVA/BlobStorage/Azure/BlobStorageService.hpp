// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/BlobStorage.hpp"
#include "AVEVA/BlobStorage/Core/ContainerClient.hpp"
#include "AVEVA/BlobStorage/Core/Filesystem.hpp"
#include "AVEVA/BlobStorage/Azure/IdentityProvider.hpp"
#include "AVEVA/BlobStorage/Azure/Models/StorageOptions.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
namespace AVEVA::BlobStorage::Azure
{
    /// <summary>
    /// Blob operations on one container, authenticated with a managed identity.
    ///
    /// The container binding is resolved once on construction and shared by every call.
    /// The instance holds no mutable state and can be used from several threads at once.
    /// </summary>
    class BlobStorageService final : public Core::BlobStorage
    {
        std::shared_ptr<Core::ContainerClient> m_container;
        std::shared_ptr<Core::Filesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        BlobStorageService(const Models::StorageOptions& options,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        BlobStorageService(const Models::StorageOptions& options,
            const std::shared_ptr<IdentityProvider>& identityProvider,
            std::shared_ptr<Core::Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        BlobStorageService(std::shared_ptr<Core::ContainerClient> container,
            std::shared_ptr<Core::Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);

        virtual void Upload(const std::string& blobName,
            std::istream& content,
            const std::optional<std::string>& contentType = {},
            std::stop_token stopToken = {}) override;
        virtual void UploadFromPath(const std::string& blobName,
            const std::filesystem::path& filePath,
            const std::optional<std::string>& contentType = {},
            std::stop_token stopToken = {}) override;
        virtual void Download(const std::string& blobName, std::ostream& destination, std::stop_token stopToken = {}) override;
        virtual void DownloadToPath(const std::string& blobName, const std::filesystem::path& filePath, std::stop_token stopToken = {}) override;
        [[nodiscard]] virtual std::vector<uint8_t> DownloadBytes(const std::string& blobName, std::stop_token stopToken = {}) override;
        [[nodiscard]] virtual std::optional<Core::BlobDescriptor> GetInfo(const std::string& blobName, std::stop_token stopToken = {}) override;
        [[nodiscard]] virtual bool Exists(const std::string& blobName, std::stop_token stopToken = {}) override;
        virtual bool Delete(const std::string& blobName, std::stop_token stopToken = {}) override;
        [[nodiscard]] virtual std::vector<Core::BlobDescriptor> List(const std::optional<std::string>& prefix = {}, std::stop_token stopToken = {}) override;

    private:
        static std::shared_ptr<Core::ContainerClient> CreateContainerClient(const Models::StorageOptions& options,
            IdentityProvider& identityProvider,
            boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>& logger);
    };
}

#pragma once
#include "AVEVA/BlobStorage/Core/ContainerClient.hpp"

#include <azure/storage/blobs.hpp>
namespace AVEVA::BlobStorage::Azure::Impl
{
    class AzureContainerClient final : public Core::ContainerClient
    {
        ::Azure::Storage::Blobs::BlobContainerClient m_client;

    public:
        explicit AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client);
        virtual std::unique_ptr<Core::BlobClient> GetBlobClient(const std::string& name) override;
        virtual Core::BlobPage ListBlobs(const std::optional<std::string>& prefix,
            const std::optional<std::string>& continuationToken,
            std::stop_token stopToken) override;
    };
}

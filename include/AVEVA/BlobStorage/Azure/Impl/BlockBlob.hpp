// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/BlobClient.hpp"
#include <azure/storage/blobs/block_blob_client.hpp>
namespace AVEVA::BlobStorage::Azure::Impl
{
    class BlockBlob final : public Core::BlobClient
    {
        std::string m_name;
        ::Azure::Storage::Blobs::BlockBlobClient m_client;

    public:
        BlockBlob(std::string name, ::Azure::Storage::Blobs::BlockBlobClient client);

        virtual void Upload(std::istream& content, const std::optional<std::string>& contentType, std::stop_token stopToken) override;
        virtual void DownloadTo(std::ostream& destination, std::stop_token stopToken) override;
        virtual std::vector<uint8_t> DownloadContent(std::stop_token stopToken) override;
        virtual std::optional<Core::BlobDescriptor> GetProperties(std::stop_token stopToken) override;
        virtual bool Exists(std::stop_token stopToken) override;
        virtual bool DeleteIfExists(std::stop_token stopToken) override;
    };
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/AzureContainerClient.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/BlockBlob.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/BlobHelpers.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/Configuration.hpp"
#include "AVEVA/BlobStorage/Azure/AzureErrorTranslator.hpp"
namespace AVEVA::BlobStorage::Azure::Impl
{
    AzureContainerClient::AzureContainerClient(::Azure::Storage::Blobs::BlobContainerClient client)
        : m_client(std::move(client))
    {
    }

    std::unique_ptr<Core::BlobClient> AzureContainerClient::GetBlobClient(const std::string& name)
    {
        return std::make_unique<BlockBlob>(name, m_client.GetBlockBlobClient(name));
    }

    Core::BlobPage AzureContainerClient::ListBlobs(const std::optional<std::string>& prefix,
        const std::optional<std::string>& continuationToken,
        std::stop_token stopToken)
    {
        return AzureErrorTranslator::Invoke("Listing of blobs", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            {
                ::Azure::Storage::Blobs::ListBlobsOptions opts;
                opts.PageSizeHint = Configuration::ListPageSizeHint;
                if (prefix)
                {
                    opts.Prefix = *prefix;
                }

                if (continuationToken)
                {
                    opts.ContinuationToken = *continuationToken;
                }

                const auto blobs = m_client.ListBlobs(opts, context);

                Core::BlobPage page;
                page.Blobs.reserve(blobs.Blobs.size());
                for (const auto& blob : blobs.Blobs)
                {
                    page.Blobs.push_back(BlobHelpers::ToBlobDescriptor(blob));
                }

                if (blobs.NextPageToken.HasValue() && !blobs.NextPageToken.Value().empty())
                {
                    page.NextPageToken = blobs.NextPageToken.Value();
                }

                return page;
            });
    }
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/BlobHelpers.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/Configuration.hpp"

#include <chrono>
namespace AVEVA::BlobStorage::Azure::Impl
{
    static std::optional<std::string> ContentTypeOrEmpty(const std::string& contentType)
    {
        if (contentType.empty())
        {
            return std::nullopt;
        }

        return contentType;
    }

    static std::optional<std::string> ETagOrEmpty(const ::Azure::ETag& etag)
    {
        if (!etag.HasValue())
        {
            return std::nullopt;
        }

        return etag.ToString();
    }

    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions()
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Core::Credentials::TokenCredentialOptions BlobHelpers::CreateTokenCredentialOptions()
    {
        auto opts = ::Azure::Core::Credentials::TokenCredentialOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Identity::WorkloadIdentityCredentialOptions BlobHelpers::CreateWorkloadIdentityCredentialOptions(const std::optional<std::string>& tenantId,
        const std::optional<std::string>& clientId)
    {
        auto opts = ::Azure::Identity::WorkloadIdentityCredentialOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;

        // Unset values keep the defaults read from AZURE_TENANT_ID and AZURE_CLIENT_ID.
        if (tenantId)
        {
            opts.TenantId = *tenantId;
        }

        if (clientId)
        {
            opts.ClientId = *clientId;
        }

        return opts;
    }

    ::Azure::Identity::AzureCliCredentialOptions BlobHelpers::CreateAzureCliCredentialOptions(const std::optional<std::string>& tenantId)
    {
        auto opts = ::Azure::Identity::AzureCliCredentialOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        if (tenantId)
        {
            opts.TenantId = *tenantId;
        }

        return opts;
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const std::string& serviceEndpoint,
        std::shared_ptr<::Azure::Core::Credentials::TokenCredential> credential)
    {
        auto blobOptions = CreateBlobClientOptions();
        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            serviceEndpoint,
            std::move(credential),
            blobOptions
        };
    }

    Core::BlobDescriptor BlobHelpers::ToBlobDescriptor(const ::Azure::Storage::Blobs::Models::BlobItem& blob)
    {
        return Core::BlobDescriptor
        {
            blob.Name,
            blob.BlobSize,
            std::chrono::system_clock::time_point{ blob.Details.LastModified },
            ContentTypeOrEmpty(blob.Details.HttpHeaders.ContentType),
            ETagOrEmpty(blob.Details.ETag)
        };
    }

    Core::BlobDescriptor BlobHelpers::ToBlobDescriptor(const std::string& name, const ::Azure::Storage::Blobs::Models::BlobProperties& properties)
    {
        return Core::BlobDescriptor
        {
            name,
            properties.BlobSize,
            std::chrono::system_clock::time_point{ properties.LastModified },
            ContentTypeOrEmpty(properties.HttpHeaders.ContentType),
            ETagOrEmpty(properties.ETag)
        };
    }
}

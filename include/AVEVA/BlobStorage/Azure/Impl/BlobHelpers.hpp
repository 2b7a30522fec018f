#pragma once
#include "AVEVA/BlobStorage/Core/BlobDescriptor.hpp"

#include <azure/core/credentials/token_credential_options.hpp>
#include <azure/identity/azure_cli_credential.hpp>
#include <azure/identity/workload_identity_credential.hpp>
#include <azure/storage/blobs/blob_service_client.hpp>
#include <azure/storage/blobs/blob_container_client.hpp>

#include <memory>
#include <optional>
#include <string>
namespace AVEVA::BlobStorage::Azure::Impl
{
    struct BlobHelpers
    {
        static ::Azure::Storage::Blobs::BlobClientOptions CreateBlobClientOptions();
        static ::Azure::Core::Credentials::TokenCredentialOptions CreateTokenCredentialOptions();
        static ::Azure::Identity::WorkloadIdentityCredentialOptions CreateWorkloadIdentityCredentialOptions(const std::optional<std::string>& tenantId,
            const std::optional<std::string>& clientId);
        static ::Azure::Identity::AzureCliCredentialOptions CreateAzureCliCredentialOptions(const std::optional<std::string>& tenantId);
        static ::Azure::Storage::Blobs::BlobServiceClient CreateServiceClient(const std::string& serviceEndpoint,
            std::shared_ptr<::Azure::Core::Credentials::TokenCredential> credential);
        static Core::BlobDescriptor ToBlobDescriptor(const ::Azure::Storage::Blobs::Models::BlobItem& blob);
        static Core::BlobDescriptor ToBlobDescriptor(const std::string& name, const ::Azure::Storage::Blobs::Models::BlobProperties& properties);
    };
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/AzureIdentityProvider.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/BlobHelpers.hpp"

#include <azure/identity/azure_cli_credential.hpp>
#include <azure/identity/chained_token_credential.hpp>
#include <azure/identity/default_azure_credential.hpp>
#include <azure/identity/environment_credential.hpp>
#include <azure/identity/managed_identity_credential.hpp>
#include <azure/identity/workload_identity_credential.hpp>
namespace AVEVA::BlobStorage::Azure::Impl
{
    using namespace boost::log::trivial;
    AzureIdentityProvider::AzureIdentityProvider(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_logger(std::move(logger))
    {
    }

    std::shared_ptr<::Azure::Core::Credentials::TokenCredential> AzureIdentityProvider::GetCredential(const Models::CredentialRequest& request)
    {
        const auto tokenOptions = BlobHelpers::CreateTokenCredentialOptions();
        if (request.IdentityMode == Models::CredentialRequest::Mode::UserAssigned)
        {
            const auto& clientId = request.ClientId.value();
            if (!request.TenantId)
            {
                BOOST_LOG_SEV(*m_logger, debug) << "Using user-assigned managed identity '" << clientId << "'";
                return std::make_shared<::Azure::Identity::ManagedIdentityCredential>(clientId, tokenOptions);
            }

            // Workload identity with tenant and client pinned, then the managed identity endpoint.
            BOOST_LOG_SEV(*m_logger, debug) << "Using user-assigned identity '" << clientId << "' in tenant '" << *request.TenantId << "'";
            ::Azure::Identity::ChainedTokenCredential::Sources credSources;
            credSources.push_back(std::make_shared<::Azure::Identity::WorkloadIdentityCredential>(
                BlobHelpers::CreateWorkloadIdentityCredentialOptions(request.TenantId, request.ClientId)));
            credSources.push_back(std::make_shared<::Azure::Identity::ManagedIdentityCredential>(clientId, tokenOptions));
            return std::make_shared<::Azure::Identity::ChainedTokenCredential>(credSources);
        }

        if (!request.TenantId)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Using the default identity chain";
            return std::make_shared<::Azure::Identity::DefaultAzureCredential>(tokenOptions);
        }

        BOOST_LOG_SEV(*m_logger, debug) << "Using the default identity chain in tenant '" << *request.TenantId << "'";
        ::Azure::Identity::ChainedTokenCredential::Sources credSources;

        // EnvironmentCredential reads its tenant from AZURE_TENANT_ID like every other environment value.
        credSources.push_back(std::make_shared<::Azure::Identity::EnvironmentCredential>(tokenOptions));
        credSources.push_back(std::make_shared<::Azure::Identity::WorkloadIdentityCredential>(
            BlobHelpers::CreateWorkloadIdentityCredentialOptions(request.TenantId, std::nullopt)));

        // System-assigned
        credSources.push_back(std::make_shared<::Azure::Identity::ManagedIdentityCredential>(std::string(), tokenOptions));
        credSources.push_back(std::make_shared<::Azure::Identity::AzureCliCredential>(
            BlobHelpers::CreateAzureCliCredentialOptions(request.TenantId)));
        return std::make_shared<::Azure::Identity::ChainedTokenCredential>(credSources);
    }
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/CredentialResolver.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"
#include "AVEVA/BlobStorage/Core/Validation.hpp"
namespace AVEVA::BlobStorage::Azure::Impl
{
    void CredentialResolver::Validate(const Models::StorageOptions& options)
    {
        if (Core::Validation::IsBlank(options.GetAccountName()))
        {
            throw Core::InvalidConfigurationError("AccountName is required");
        }

        if (Core::Validation::IsBlank(options.GetContainerName()))
        {
            throw Core::InvalidConfigurationError("ContainerName is required");
        }
    }

    Models::CredentialRequest CredentialResolver::Resolve(const Models::StorageOptions& options)
    {
        Models::CredentialRequest request;
        request.TenantId = Core::Validation::NonBlankOrEmpty(options.GetTenantId());
        request.ClientId = Core::Validation::NonBlankOrEmpty(options.GetClientId());
        request.IdentityMode = request.ClientId
            ? Models::CredentialRequest::Mode::UserAssigned
            : Models::CredentialRequest::Mode::DefaultChain;
        return request;
    }
}

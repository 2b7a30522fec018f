// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Azure/Models/CredentialRequest.hpp"

#include <azure/core/credentials/credentials.hpp>

#include <memory>
namespace AVEVA::BlobStorage::Azure
{
    /// <summary>
    /// Turns a credential request into a token credential.
    /// Token acquisition and refresh belong to the returned credential.
    /// </summary>
    class IdentityProvider
    {
    public:
        virtual ~IdentityProvider() = default;

        virtual std::shared_ptr<::Azure::Core::Credentials::TokenCredential> GetCredential(const Models::CredentialRequest& request) = 0;
    };
}

// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <optional>
#include <string>
namespace AVEVA::BlobStorage::Azure::Models
{
    /// <summary>
    /// The identity requested from the identity provider.
    /// </summary>
    struct CredentialRequest
    {
        enum class Mode
        {
            DefaultChain = 0,
            UserAssigned = 1,
        };

        Mode IdentityMode = Mode::DefaultChain;
        std::optional<std::string> TenantId;

        // Only set for Mode::UserAssigned
        std::optional<std::string> ClientId;

        bool operator==(const CredentialRequest& other) const = default;
    };
}

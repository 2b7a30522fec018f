// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <optional>
#include <string>
namespace AVEVA::BlobStorage::Azure::Models
{
    /// <summary>
    /// Connection options for a storage container accessed with a managed identity.
    /// </summary>
    class StorageOptions
    {
        std::string m_accountName;
        std::string m_containerName;
        std::optional<std::string> m_tenantId;
        std::optional<std::string> m_clientId;
    public:
        /// <param name="accountName">The storage account name.</param>
        /// <param name="containerName">The blob container name.</param>
        /// <param name="tenantId">Tenant to authenticate against. The identity provider's default tenant when empty.</param>
        /// <param name="clientId">Client id of a user-assigned managed identity. The default identity chain when empty.</param>
        StorageOptions(std::string accountName,
            std::string containerName,
            std::optional<std::string> tenantId = {},
            std::optional<std::string> clientId = {});

        const std::string& GetAccountName() const noexcept;
        const std::string& GetContainerName() const noexcept;
        const std::optional<std::string>& GetTenantId() const noexcept;
        const std::optional<std::string>& GetClientId() const noexcept;
    };
}

#include "AVEVA/BlobStorage/Azure/Models/StorageOptions.hpp"
namespace AVEVA::BlobStorage::Azure::Models
{
    StorageOptions::StorageOptions(std::string accountName,
        std::string containerName,
        std::optional<std::string> tenantId,
        std::optional<std::string> clientId)
        : m_accountName(std::move(accountName)),
        m_containerName(std::move(containerName)),
        m_tenantId(std::move(tenantId)),
        m_clientId(std::move(clientId))
    {
    }

    const std::string& StorageOptions::GetAccountName() const noexcept
    {
        return m_accountName;
    }

    const std::string& StorageOptions::GetContainerName() const noexcept
    {
        return m_containerName;
    }

    const std::optional<std::string>& StorageOptions::GetTenantId() const noexcept
    {
        return m_tenantId;
    }

    const std::optional<std::string>& StorageOptions::GetClientId() const noexcept
    {
        return m_clientId;
    }
}

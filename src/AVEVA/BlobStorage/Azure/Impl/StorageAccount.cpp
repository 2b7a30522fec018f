// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/StorageAccount.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/Configuration.hpp"
namespace AVEVA::BlobStorage::Azure::Impl
{
    static const constexpr char g_domainSeparator = '.';
    std::string StorageAccount::ServiceEndpoint(std::string_view accountName)
    {
        // NOTE: Sovereign clouds and custom endpoints are not supported.
        std::string endpoint;
        endpoint.reserve(Configuration::EndpointScheme.size() + accountName.size() + 1 + Configuration::StorageDomain.size());
        endpoint.append(Configuration::EndpointScheme);
        endpoint.append(accountName);
        endpoint.push_back(g_domainSeparator);
        endpoint.append(Configuration::StorageDomain);
        return endpoint;
    }
}

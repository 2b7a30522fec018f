#pragma once
#include <string>
#include <string_view>
namespace AVEVA::BlobStorage::Azure::Impl
{
    struct StorageAccount
    {
        /// <summary>
        /// https://{accountName}.blob.core.windows.net
        /// </summary>
        [[nodiscard]] static std::string ServiceEndpoint(std::string_view accountName);
    };
}

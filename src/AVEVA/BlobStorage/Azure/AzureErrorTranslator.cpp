// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/AzureErrorTranslator.hpp"

#include <azure/core/http/http_status_code.hpp>
namespace AVEVA::BlobStorage::Azure
{
    bool AzureErrorTranslator::IsNotFound(const ::Azure::Core::RequestFailedException& ex) noexcept
    {
        return ex.StatusCode == ::Azure::Core::Http::HttpStatusCode::NotFound;
    }
}

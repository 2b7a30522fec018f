// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Azure/Models/StorageOptions.hpp"
#include "AVEVA/BlobStorage/Azure/Models/CredentialRequest.hpp"
namespace AVEVA::BlobStorage::Azure::Impl
{
    struct CredentialResolver
    {
        /// <summary>
        /// Throws InvalidConfigurationError if the account or container name is blank.
        /// </summary>
        static void Validate(const Models::StorageOptions& options);

        /// <summary>
        /// Selects the identity to request from the set optional fields.
        ///
        /// | tenant | client | request                                  |
        /// |--------|--------|------------------------------------------|
        /// |   -    |   -    | default chain                            |
        /// |   x    |   -    | default chain scoped to tenant           |
        /// |   -    |   x    | user-assigned identity                   |
        /// |   x    |   x    | user-assigned identity scoped to tenant  |
        /// </summary>
        [[nodiscard]] static Models::CredentialRequest Resolve(const Models::StorageOptions& options);
    };
}

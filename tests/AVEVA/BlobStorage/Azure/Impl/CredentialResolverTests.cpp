// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/CredentialResolver.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"

#include <gtest/gtest.h>
using AVEVA::BlobStorage::Azure::Impl::CredentialResolver;
using AVEVA::BlobStorage::Azure::Models::CredentialRequest;
using AVEVA::BlobStorage::Azure::Models::StorageOptions;
using AVEVA::BlobStorage::Core::InvalidConfigurationError;

TEST(CredentialResolverTests, Resolve_NoTenantNoClient_DefaultChain)
{
    // Act
    const auto request = CredentialResolver::Resolve(StorageOptions("account", "container"));

    // Assert
    ASSERT_EQ(CredentialRequest::Mode::DefaultChain, request.IdentityMode);
    ASSERT_FALSE(request.TenantId.has_value());
    ASSERT_FALSE(request.ClientId.has_value());
}

TEST(CredentialResolverTests, Resolve_TenantOnly_DefaultChainScopedToTenant)
{
    // Act
    const auto request = CredentialResolver::Resolve(StorageOptions("account", "container", "tenant-1"));

    // Assert
    ASSERT_EQ(CredentialRequest::Mode::DefaultChain, request.IdentityMode);
    ASSERT_EQ(std::optional<std::string>("tenant-1"), request.TenantId);
    ASSERT_FALSE(request.ClientId.has_value());
}

TEST(CredentialResolverTests, Resolve_ClientOnly_UserAssigned)
{
    // Act
    const auto request = CredentialResolver::Resolve(StorageOptions("account", "container", std::nullopt, "client-1"));

    // Assert
    ASSERT_EQ(CredentialRequest::Mode::UserAssigned, request.IdentityMode);
    ASSERT_FALSE(request.TenantId.has_value());
    ASSERT_EQ(std::optional<std::string>("client-1"), request.ClientId);
}

TEST(CredentialResolverTests, Resolve_TenantAndClient_UserAssignedScopedToTenant)
{
    // Act
    const auto request = CredentialResolver::Resolve(StorageOptions("account", "container", "tenant-1", "client-1"));

    // Assert
    const CredentialRequest expected{ CredentialRequest::Mode::UserAssigned, "tenant-1", "client-1" };
    ASSERT_EQ(expected, request);
}

TEST(CredentialResolverTests, Resolve_BlankOptionalFields_TreatedAsAbsent)
{
    // Act
    const auto request = CredentialResolver::Resolve(StorageOptions("account", "container", "  ", ""));

    // Assert
    ASSERT_EQ(CredentialRequest{}, request);
}

TEST(CredentialResolverTests, Validate_CompleteOptions_DoesNotThrow)
{
    // Act & Assert
    ASSERT_NO_THROW(CredentialResolver::Validate(StorageOptions("account", "container")));
}

TEST(CredentialResolverTests, Validate_BlankAccount_Throws)
{
    // Act & Assert
    ASSERT_THROW(CredentialResolver::Validate(StorageOptions("", "container")), InvalidConfigurationError);
    ASSERT_THROW(CredentialResolver::Validate(StorageOptions(" \t", "container")), InvalidConfigurationError);
}

TEST(CredentialResolverTests, Validate_BlankContainer_Throws)
{
    // Act & Assert
    ASSERT_THROW(CredentialResolver::Validate(StorageOptions("account", "")), InvalidConfigurationError);
    ASSERT_THROW(CredentialResolver::Validate(StorageOptions("account", "   ")), InvalidConfigurationError);
}

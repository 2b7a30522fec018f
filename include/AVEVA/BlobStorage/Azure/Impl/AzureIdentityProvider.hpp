// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Azure/IdentityProvider.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
namespace AVEVA::BlobStorage::Azure::Impl
{
    class AzureIdentityProvider final : public IdentityProvider
    {
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        explicit AzureIdentityProvider(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        virtual std::shared_ptr<::Azure::Core::Credentials::TokenCredential> GetCredential(const Models::CredentialRequest& request) override;
    };
}

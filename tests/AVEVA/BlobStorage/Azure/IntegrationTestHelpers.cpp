// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "IntegrationTestHelpers.hpp"

#include <azure/core/credentials/credentials.hpp>
#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <cstdlib>
#include <random>
using namespace boost::log::trivial;

namespace AVEVA::BlobStorage::Azure::Testing
{
    static std::optional<std::string> GetEnvironment(const char* name)
    {
        const char* value = std::getenv(name);
        if (!value || !*value)
        {
            return std::nullopt;
        }

        return std::string(value);
    }

    std::optional<Models::StorageOptions> LoadStorageOptionsFromEnvironment()
    {
        const auto accountName = GetEnvironment("AZURE_STORAGE_ACCOUNT_NAME");
        if (!accountName)
        {
            return std::nullopt;
        }

        return Models::StorageOptions(*accountName,
            GetEnvironment("AZURE_TEST_CONTAINER").value_or("aveva-blobstorage-integration-tests"),
            GetEnvironment("AZURE_TENANT_ID"),
            GetEnvironment("AZURE_CLIENT_ID"));
    }

    std::string GenerateRandomBlobName(const std::string& prefix)
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(100000, 999999);
        return prefix + "-" + std::to_string(dis(gen)) + ".blob";
    }

    bool IsAuthenticationError(const std::exception& e)
    {
        std::string errorMsg = e.what();
        return errorMsg.find("AADSTS") != std::string::npos ||
            errorMsg.find("Unauthorized") != std::string::npos ||
            errorMsg.find("ManagedIdentityCredential") != std::string::npos ||
            errorMsg.find("expired") != std::string::npos;
    }

    void AzureIntegrationTestBase::SetUp()
    {
        m_options = LoadStorageOptionsFromEnvironment();
        if (!m_options)
        {
            GTEST_SKIP() << "Azure storage account not found in environment variables. "
                << "Set AZURE_STORAGE_ACCOUNT_NAME to run integration tests.";
        }

        m_logger = std::make_shared<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>();
        m_service = std::make_unique<BlobStorageService>(*m_options, m_logger);
        EnsureReachable();
    }

    void AzureIntegrationTestBase::TearDown()
    {
        if (!m_service)
        {
            return;
        }

        for (const auto& name : m_createdBlobs)
        {
            try
            {
                m_service->Delete(name);
            }
            catch (const std::exception& e)
            {
                BOOST_LOG_SEV(*m_logger, error) << "Failed to remove test blob '" << name << "'. Error: " << e.what();
            }
        }
    }

    std::string AzureIntegrationTestBase::Track(const std::string& prefix)
    {
        auto name = GenerateRandomBlobName(prefix);
        m_createdBlobs.push_back(name);
        return name;
    }

    void AzureIntegrationTestBase::EnsureReachable()
    {
        try
        {
            (void)m_service->Exists(GenerateRandomBlobName("probe"));
        }
        catch (const ::Azure::Core::Credentials::AuthenticationException& e)
        {
            GTEST_SKIP() << "Azure authentication failed: " << e.what();
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            if (e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Unauthorized ||
                e.StatusCode == ::Azure::Core::Http::HttpStatusCode::Forbidden)
            {
                GTEST_SKIP() << "Azure authentication failed: " << e.what();
            }

            GTEST_SKIP() << "Failed to connect to Azure: " << e.what();
        }
        catch (const std::exception& e)
        {
            if (IsAuthenticationError(e))
            {
                GTEST_SKIP() << "Azure authentication failed: " << e.what()
                    << ". Please check that a managed identity is available to this host.";
            }

            GTEST_SKIP() << "Failed to connect to Azure: " << e.what();
        }
    }
}

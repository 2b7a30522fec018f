// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/BlobStorageService.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/AzureContainerClient.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/AzureIdentityProvider.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/BlobHelpers.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/CredentialResolver.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/StorageAccount.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"
#include "AVEVA/BlobStorage/Core/LocalFilesystem.hpp"
#include "AVEVA/BlobStorage/Core/Validation.hpp"

#include <iterator>
namespace AVEVA::BlobStorage::Azure
{
    using namespace boost::log::trivial;
    static void ThrowIfCancelled(const std::stop_token& stopToken, std::string_view operation)
    {
        if (stopToken.stop_requested())
        {
            throw Core::OperationCancelledError(std::string(operation) + " was cancelled");
        }
    }

    BlobStorageService::BlobStorageService(const Models::StorageOptions& options,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : BlobStorageService(options,
            std::make_shared<Impl::AzureIdentityProvider>(logger),
            std::make_shared<Core::LocalFilesystem>(logger),
            logger)
    {
    }

    BlobStorageService::BlobStorageService(const Models::StorageOptions& options,
        const std::shared_ptr<IdentityProvider>& identityProvider,
        std::shared_ptr<Core::Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : BlobStorageService(CreateContainerClient(options, *identityProvider, *logger),
            std::move(filesystem),
            logger)
    {
    }

    BlobStorageService::BlobStorageService(std::shared_ptr<Core::ContainerClient> container,
        std::shared_ptr<Core::Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_container(std::move(container)),
        m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger))
    {
    }

    std::shared_ptr<Core::ContainerClient> BlobStorageService::CreateContainerClient(const Models::StorageOptions& options,
        IdentityProvider& identityProvider,
        boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>& logger)
    {
        Impl::CredentialResolver::Validate(options);

        const auto endpoint = Impl::StorageAccount::ServiceEndpoint(options.GetAccountName());
        BOOST_LOG_SEV(logger, debug) << "Binding container '" << options.GetContainerName() << "' at '" << endpoint << "'";

        auto credential = identityProvider.GetCredential(Impl::CredentialResolver::Resolve(options));
        auto serviceClient = Impl::BlobHelpers::CreateServiceClient(endpoint, std::move(credential));

        // The container is not created or probed here, a missing container surfaces on the first operation.
        return std::make_shared<Impl::AzureContainerClient>(serviceClient.GetBlobContainerClient(options.GetContainerName()));
    }

    void BlobStorageService::Upload(const std::string& blobName,
        std::istream& content,
        const std::optional<std::string>& contentType,
        std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        if (!content)
        {
            throw Core::InvalidArgumentError("Content stream is not readable", "content");
        }

        ThrowIfCancelled(stopToken, "Upload");

        BOOST_LOG_SEV(*m_logger, debug) << "Uploading blob '" << blobName << "'";
        auto client = m_container->GetBlobClient(blobName);
        client->Upload(content, Core::Validation::NonBlankOrEmpty(contentType), std::move(stopToken));
    }

    void BlobStorageService::UploadFromPath(const std::string& blobName,
        const std::filesystem::path& filePath,
        const std::optional<std::string>& contentType,
        std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        Core::Validation::RequireArgument(filePath.string(), "filePath", "File path cannot be empty");
        ThrowIfCancelled(stopToken, "Upload");

        if (!m_filesystem->FileExists(filePath))
        {
            throw Core::LocalFileNotFoundError(filePath);
        }

        auto file = m_filesystem->OpenRead(filePath);
        Upload(blobName, *file, contentType, std::move(stopToken));
    }

    void BlobStorageService::Download(const std::string& blobName, std::ostream& destination, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        if (!destination)
        {
            throw Core::InvalidArgumentError("Destination stream is not writable", "destination");
        }

        ThrowIfCancelled(stopToken, "Download");

        BOOST_LOG_SEV(*m_logger, debug) << "Downloading blob '" << blobName << "'";
        auto client = m_container->GetBlobClient(blobName);
        client->DownloadTo(destination, std::move(stopToken));
    }

    void BlobStorageService::DownloadToPath(const std::string& blobName, const std::filesystem::path& filePath, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        Core::Validation::RequireArgument(filePath.string(), "filePath", "File path cannot be empty");
        ThrowIfCancelled(stopToken, "Download");

        const auto directory = filePath.parent_path();
        if (!directory.empty() && !m_filesystem->CreateDir(directory))
        {
            throw Core::LocalFileError("Unable to create directory", directory);
        }

        auto file = m_filesystem->OpenWrite(filePath);
        try
        {
            Download(blobName, *file, std::move(stopToken));
        }
        catch (...)
        {
            const auto writeFailed = file->fail();

            // Close before removing, the handle must not outlive the call.
            file.reset();
            BOOST_LOG_SEV(*m_logger, warning) << "Download of blob '" << blobName << "' failed. Removing partial file '" << filePath.string() << "'";
            m_filesystem->DeleteFile(filePath);
            if (writeFailed)
            {
                throw Core::LocalFileError("Unable to write file", filePath);
            }

            throw;
        }
    }

    std::vector<uint8_t> BlobStorageService::DownloadBytes(const std::string& blobName, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        ThrowIfCancelled(stopToken, "Download");

        BOOST_LOG_SEV(*m_logger, debug) << "Downloading blob '" << blobName << "' into memory";
        auto client = m_container->GetBlobClient(blobName);
        return client->DownloadContent(std::move(stopToken));
    }

    std::optional<Core::BlobDescriptor> BlobStorageService::GetInfo(const std::string& blobName, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        ThrowIfCancelled(stopToken, "Property fetch");

        auto client = m_container->GetBlobClient(blobName);
        return client->GetProperties(std::move(stopToken));
    }

    bool BlobStorageService::Exists(const std::string& blobName, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        ThrowIfCancelled(stopToken, "Existence check");

        auto client = m_container->GetBlobClient(blobName);
        return client->Exists(std::move(stopToken));
    }

    bool BlobStorageService::Delete(const std::string& blobName, std::stop_token stopToken)
    {
        Core::Validation::RequireArgument(blobName, "blobName", "Blob name cannot be empty");
        ThrowIfCancelled(stopToken, "Delete");

        auto client = m_container->GetBlobClient(blobName);
        const auto deleted = client->DeleteIfExists(std::move(stopToken));
        BOOST_LOG_SEV(*m_logger, debug) << "Delete of blob '" << blobName << "' " << (deleted ? "removed it" : "found nothing to remove");
        return deleted;
    }

    std::vector<Core::BlobDescriptor> BlobStorageService::List(const std::optional<std::string>& prefix, std::stop_token stopToken)
    {
        ThrowIfCancelled(stopToken, "Listing of blobs");

        // An empty prefix matches everything, same as no prefix.
        std::optional<std::string> effectivePrefix;
        if (prefix && !prefix->empty())
        {
            effectivePrefix = prefix;
        }

        std::vector<Core::BlobDescriptor> blobs;
        std::optional<std::string> continuationToken;
        do
        {
            auto page = m_container->ListBlobs(effectivePrefix, continuationToken, stopToken);
            blobs.insert(blobs.end(),
                std::make_move_iterator(page.Blobs.begin()),
                std::make_move_iterator(page.Blobs.end()));
            continuationToken = std::move(page.NextPageToken);
        } while (continuationToken);

        BOOST_LOG_SEV(*m_logger, debug) << "Listed " << blobs.size() << " blobs with prefix '" << effectivePrefix.value_or("") << "'";
        return blobs;
    }
}

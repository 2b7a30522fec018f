// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Azure/Impl/BlockBlob.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/BlobHelpers.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/Configuration.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/StreamBodyStream.hpp"
#include "AVEVA/BlobStorage/Azure/AzureErrorTranslator.hpp"

#include <azure/storage/common/storage_exception.hpp>

#include <stdexcept>
namespace AVEVA::BlobStorage::Azure::Impl
{
    BlockBlob::BlockBlob(std::string name, ::Azure::Storage::Blobs::BlockBlobClient client)
        : m_name(std::move(name)), m_client(std::move(client))
    {
    }

    void BlockBlob::Upload(std::istream& content, const std::optional<std::string>& contentType, std::stop_token stopToken)
    {
        AzureErrorTranslator::Invoke("Upload of '" + m_name + "'", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            {
                StreamBodyStream body(content);
                ::Azure::Storage::Blobs::UploadBlockBlobOptions options;
                if (contentType)
                {
                    options.HttpHeaders.ContentType = *contentType;
                }

                m_client.Upload(body, options, context);
            });
    }

    void BlockBlob::DownloadTo(std::ostream& destination, std::stop_token stopToken)
    {
        AzureErrorTranslator::Invoke("Download of '" + m_name + "'", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            {
                auto response = m_client.Download(::Azure::Storage::Blobs::DownloadBlobOptions(), context);
                auto& body = *response.Value.BodyStream;

                std::vector<uint8_t> buffer(static_cast<size_t>(Configuration::StreamChunkSize));
                while (true)
                {
                    const auto bytesRead = body.Read(buffer.data(), buffer.size(), context);
                    if (bytesRead == 0)
                    {
                        break;
                    }

                    destination.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(bytesRead));
                    if (!destination)
                    {
                        throw std::runtime_error("Unable to write blob '" + m_name + "' to the destination stream");
                    }
                }

                destination.flush();
            });
    }

    std::vector<uint8_t> BlockBlob::DownloadContent(std::stop_token stopToken)
    {
        return AzureErrorTranslator::Invoke("Download of '" + m_name + "'", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            {
                auto response = m_client.Download(::Azure::Storage::Blobs::DownloadBlobOptions(), context);
                return response.Value.BodyStream->ReadToEnd(context);
            });
    }

    std::optional<Core::BlobDescriptor> BlockBlob::GetProperties(std::stop_token stopToken)
    {
        return AzureErrorTranslator::Invoke("Property fetch of '" + m_name + "'", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            -> std::optional<Core::BlobDescriptor>
            {
                try
                {
                    const auto props = m_client.GetProperties(::Azure::Storage::Blobs::GetBlobPropertiesOptions(), context);
                    return BlobHelpers::ToBlobDescriptor(m_name, props.Value);
                }
                catch (const ::Azure::Storage::StorageException& ex)
                {
                    if (AzureErrorTranslator::IsNotFound(ex))
                    {
                        return std::nullopt;
                    }

                    throw;
                }
            });
    }

    bool BlockBlob::Exists(std::stop_token stopToken)
    {
        return GetProperties(std::move(stopToken)).has_value();
    }

    bool BlockBlob::DeleteIfExists(std::stop_token stopToken)
    {
        return AzureErrorTranslator::Invoke("Delete of '" + m_name + "'", std::move(stopToken), [&](const ::Azure::Core::Context& context)
            {
                const auto res = m_client.DeleteIfExists(::Azure::Storage::Blobs::DeleteBlobOptions(), context);
                return res.Value.Deleted;
            });
    }
}

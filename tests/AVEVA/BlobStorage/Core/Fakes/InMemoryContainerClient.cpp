// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/Fakes/InMemoryContainerClient.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"

#include <azure/core/http/http_status_code.hpp>
#include <azure/storage/common/storage_exception.hpp>

#include <iterator>
#include <stdexcept>
namespace AVEVA::BlobStorage::Core::Fakes
{
    namespace
    {
        void ThrowIfStopped(const std::stop_token& stopToken)
        {
            if (stopToken.stop_requested())
            {
                throw OperationCancelledError("In-memory operation was cancelled");
            }
        }

        BlobDescriptor Describe(const std::string& name, const InMemoryContainerClient::StoredBlob& blob)
        {
            return BlobDescriptor(name,
                static_cast<int64_t>(blob.Content.size()),
                blob.LastModified,
                blob.ContentType,
                "\"0x" + std::to_string(blob.Version) + "\"");
        }

        class InMemoryBlobClient final : public BlobClient
        {
            std::string m_name;
            std::shared_ptr<InMemoryContainerClient::State> m_state;

        public:
            InMemoryBlobClient(std::string name, std::shared_ptr<InMemoryContainerClient::State> state)
                : m_name(std::move(name)), m_state(std::move(state))
            {
            }

            void Upload(std::istream& content, const std::optional<std::string>& contentType, std::stop_token stopToken) override
            {
                ThrowIfStopped(stopToken);
                std::vector<uint8_t> bytes{ std::istreambuf_iterator<char>(content), std::istreambuf_iterator<char>() };

                std::lock_guard lock(m_state->Mutex);
                auto& blob = m_state->Blobs[m_name];
                blob.Content = std::move(bytes);
                blob.ContentType = contentType;
                blob.LastModified = std::chrono::system_clock::now();
                blob.Version = m_state->NextVersion++;
            }

            void DownloadTo(std::ostream& destination, std::stop_token stopToken) override
            {
                const auto content = DownloadContent(std::move(stopToken));
                destination.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
                if (!destination)
                {
                    throw std::runtime_error("Unable to write blob '" + m_name + "' to the destination stream");
                }
            }

            std::vector<uint8_t> DownloadContent(std::stop_token stopToken) override
            {
                ThrowIfStopped(stopToken);
                std::lock_guard lock(m_state->Mutex);
                const auto it = m_state->Blobs.find(m_name);
                if (it == m_state->Blobs.end())
                {
                    ::Azure::Storage::StorageException ex("The specified blob does not exist: '" + m_name + "'");
                    ex.StatusCode = ::Azure::Core::Http::HttpStatusCode::NotFound;
                    ex.ErrorCode = "BlobNotFound";
                    throw ex;
                }

                return it->second.Content;
            }

            std::optional<BlobDescriptor> GetProperties(std::stop_token stopToken) override
            {
                ThrowIfStopped(stopToken);
                std::lock_guard lock(m_state->Mutex);
                const auto it = m_state->Blobs.find(m_name);
                if (it == m_state->Blobs.end())
                {
                    return std::nullopt;
                }

                return Describe(m_name, it->second);
            }

            bool Exists(std::stop_token stopToken) override
            {
                return GetProperties(std::move(stopToken)).has_value();
            }

            bool DeleteIfExists(std::stop_token stopToken) override
            {
                ThrowIfStopped(stopToken);
                std::lock_guard lock(m_state->Mutex);
                return m_state->Blobs.erase(m_name) > 0;
            }
        };
    }

    InMemoryContainerClient::InMemoryContainerClient(const size_t pageSize)
        : m_state(std::make_shared<State>()), m_pageSize(pageSize)
    {
        if (m_pageSize == 0)
        {
            throw std::invalid_argument("Page size must be positive");
        }
    }

    std::unique_ptr<BlobClient> InMemoryContainerClient::GetBlobClient(const std::string& name)
    {
        return std::make_unique<InMemoryBlobClient>(name, m_state);
    }

    BlobPage InMemoryContainerClient::ListBlobs(const std::optional<std::string>& prefix,
        const std::optional<std::string>& continuationToken,
        std::stop_token stopToken)
    {
        ThrowIfStopped(stopToken);
        std::lock_guard lock(m_state->Mutex);
        ++m_state->ListCalls;

        // The token is the last name of the previous page.
        auto it = continuationToken ? m_state->Blobs.upper_bound(*continuationToken) : m_state->Blobs.begin();

        BlobPage page;
        for (; it != m_state->Blobs.end(); ++it)
        {
            if (prefix && it->first.rfind(*prefix, 0) != 0)
            {
                continue;
            }

            if (page.Blobs.size() == m_pageSize)
            {
                page.NextPageToken = page.Blobs.back().GetName();
                break;
            }

            page.Blobs.push_back(Describe(it->first, it->second));
        }

        return page;
    }

    size_t InMemoryContainerClient::BlobCount() const
    {
        std::lock_guard lock(m_state->Mutex);
        return m_state->Blobs.size();
    }

    size_t InMemoryContainerClient::ListCalls() const
    {
        std::lock_guard lock(m_state->Mutex);
        return m_state->ListCalls;
    }
}

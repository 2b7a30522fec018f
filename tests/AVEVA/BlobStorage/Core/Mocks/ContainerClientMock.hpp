// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/ContainerClient.hpp"
#include <gmock/gmock.h>

namespace AVEVA::BlobStorage::Core::Mocks
{
    class ContainerClientMock : public ContainerClient
    {
    public:
        ContainerClientMock();
        virtual ~ContainerClientMock();

        MOCK_METHOD(std::unique_ptr<BlobClient>, GetBlobClient, (const std::string& name), (override));
        MOCK_METHOD(BlobPage, ListBlobs, (const std::optional<std::string>& prefix, const std::optional<std::string>& continuationToken, std::stop_token stopToken), (override));
    };
}

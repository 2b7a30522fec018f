// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/Mocks/BlobClientMock.hpp"
#include "AVEVA/BlobStorage/Core/Mocks/ContainerClientMock.hpp"
#include "AVEVA/BlobStorage/Core/Mocks/FilesystemMock.hpp"
namespace AVEVA::BlobStorage::Core::Mocks
{
    BlobClientMock::BlobClientMock() = default;
    BlobClientMock::~BlobClientMock() = default;

    ContainerClientMock::ContainerClientMock() = default;
    ContainerClientMock::~ContainerClientMock() = default;

    FilesystemMock::FilesystemMock() = default;
    FilesystemMock::~FilesystemMock() = default;
}

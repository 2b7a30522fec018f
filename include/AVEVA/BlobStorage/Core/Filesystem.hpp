// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <filesystem>
#include <istream>
#include <memory>
#include <ostream>
namespace AVEVA::BlobStorage::Core
{
    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual bool FileExists(const std::filesystem::path& path) = 0;
        virtual std::unique_ptr<std::istream> OpenRead(const std::filesystem::path& path) = 0;

        /// <summary>
        /// Creates the file or truncates it if it already exists.
        /// </summary>
        virtual std::unique_ptr<std::ostream> OpenWrite(const std::filesystem::path& path) = 0;
        virtual bool DeleteFile(const std::filesystem::path& path) = 0;
        virtual bool CreateDir(const std::filesystem::path& path) = 0;
    };
}

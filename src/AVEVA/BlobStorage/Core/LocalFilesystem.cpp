// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/LocalFilesystem.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"

#include <fstream>
namespace AVEVA::BlobStorage::Core
{
    using namespace boost::log::trivial;
    LocalFilesystem::LocalFilesystem(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_logger(std::move(logger))
    {
    }

    bool LocalFilesystem::FileExists(const std::filesystem::path& path)
    {
        std::error_code ec;
        const auto exists = std::filesystem::is_regular_file(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to query file '" << path.string() << "'. Error: " << ec.message();
            return false;
        }

        return exists;
    }

    std::unique_ptr<std::istream> LocalFilesystem::OpenRead(const std::filesystem::path& path)
    {
        auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
        if (!file->is_open())
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to open file '" << path.string() << "' for reading";
            throw LocalFileError("Unable to open file for reading", path);
        }

        return file;
    }

    std::unique_ptr<std::ostream> LocalFilesystem::OpenWrite(const std::filesystem::path& path)
    {
        auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!file->is_open())
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to open file '" << path.string() << "' for writing";
            throw LocalFileError("Unable to open file for writing", path);
        }

        return file;
    }

    bool LocalFilesystem::DeleteFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to remove file '" << path.string() << "'. Error: " << ec.message();
            return false;
        }

        return true;
    }

    bool LocalFilesystem::CreateDir(const std::filesystem::path& path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to create directories '" << path.string() << "'. Error: " << ec.message();
            return false;
        }

        return true;
    }
}

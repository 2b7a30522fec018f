// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
namespace AVEVA::BlobStorage::Core
{
    /// <summary>
    /// A required construction option is missing or blank.
    /// </summary>
    class InvalidConfigurationError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    /// <summary>
    /// A required call parameter is missing or blank. Raised before any remote call.
    /// </summary>
    class InvalidArgumentError : public std::invalid_argument
    {
        std::string m_parameterName;
    public:
        InvalidArgumentError(const std::string& message, std::string parameterName);
        [[nodiscard]] const std::string& GetParameterName() const noexcept;
    };

    class LocalFileNotFoundError : public std::runtime_error
    {
        std::filesystem::path m_path;
    public:
        explicit LocalFileNotFoundError(std::filesystem::path path);
        [[nodiscard]] const std::filesystem::path& GetPath() const noexcept;
    };

    /// <summary>
    /// A local file could not be opened, created or written.
    /// </summary>
    class LocalFileError : public std::runtime_error
    {
        std::filesystem::path m_path;
    public:
        LocalFileError(const std::string& message, std::filesystem::path path);
        [[nodiscard]] const std::filesystem::path& GetPath() const noexcept;
    };

    class OperationCancelledError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };
}

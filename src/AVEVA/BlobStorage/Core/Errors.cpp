// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/Errors.hpp"
namespace AVEVA::BlobStorage::Core
{
    InvalidArgumentError::InvalidArgumentError(const std::string& message, std::string parameterName)
        : std::invalid_argument(message), m_parameterName(std::move(parameterName))
    {
    }

    const std::string& InvalidArgumentError::GetParameterName() const noexcept
    {
        return m_parameterName;
    }

    LocalFileNotFoundError::LocalFileNotFoundError(std::filesystem::path path)
        : std::runtime_error("File not found: '" + path.string() + "'"), m_path(std::move(path))
    {
    }

    const std::filesystem::path& LocalFileNotFoundError::GetPath() const noexcept
    {
        return m_path;
    }

    LocalFileError::LocalFileError(const std::string& message, std::filesystem::path path)
        : std::runtime_error(message + " '" + path.string() + "'"), m_path(std::move(path))
    {
    }

    const std::filesystem::path& LocalFileError::GetPath() const noexcept
    {
        return m_path;
    }
}

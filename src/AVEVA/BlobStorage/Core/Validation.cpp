// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "AVEVA/BlobStorage/Core/Validation.hpp"
#include "AVEVA/BlobStorage/Core/Errors.hpp"

#include <algorithm>
#include <cctype>
namespace AVEVA::BlobStorage::Core
{
    bool Validation::IsBlank(std::string_view value) noexcept
    {
        return std::all_of(value.begin(), value.end(), [](const char c)
            {
                return std::isspace(static_cast<unsigned char>(c)) != 0;
            });
    }

    std::optional<std::string> Validation::NonBlankOrEmpty(const std::optional<std::string>& value)
    {
        if (!value || IsBlank(*value))
        {
            return std::nullopt;
        }

        return value;
    }

    void Validation::RequireArgument(std::string_view value, std::string_view parameterName, std::string_view message)
    {
        if (IsBlank(value))
        {
            throw InvalidArgumentError(std::string(message), std::string(parameterName));
        }
    }
}

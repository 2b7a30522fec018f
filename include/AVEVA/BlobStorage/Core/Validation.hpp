// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <optional>
#include <string>
#include <string_view>
namespace AVEVA::BlobStorage::Core
{
    struct Validation
    {
        /// <returns>True if the value is empty or contains only whitespace.</returns>
        [[nodiscard]] static bool IsBlank(std::string_view value) noexcept;

        /// <summary>
        /// Blank optional values are treated as if they were never set.
        /// </summary>
        [[nodiscard]] static std::optional<std::string> NonBlankOrEmpty(const std::optional<std::string>& value);

        /// <summary>
        /// Throws InvalidArgumentError naming the parameter when the value is blank.
        /// </summary>
        static void RequireArgument(std::string_view value, std::string_view parameterName, std::string_view message);
    };
}

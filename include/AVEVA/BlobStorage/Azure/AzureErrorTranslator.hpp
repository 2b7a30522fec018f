// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "AVEVA/BlobStorage/Core/Errors.hpp"
#include "AVEVA/BlobStorage/Azure/Impl/CancellationContext.hpp"

#include <azure/core/context.hpp>
#include <azure/core/exception.hpp>

#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
namespace AVEVA::BlobStorage::Azure
{
    struct AzureErrorTranslator
    {
        [[nodiscard]] static bool IsNotFound(const ::Azure::Core::RequestFailedException& ex) noexcept;

        /// <summary>
        /// Runs a single SDK call bound to the stop token.
        /// SDK cancellation is reported as Core::OperationCancelledError, every other failure is passed through.
        /// </summary>
        template <typename Fn>
        static auto Invoke(std::string_view context, std::stop_token stopToken, Fn&& fn)
        {
            Impl::CancellationContext cancellation(std::move(stopToken));
            try
            {
                cancellation.Get().ThrowIfCancelled();
                return std::forward<Fn>(fn)(cancellation.Get());
            }
            catch (const ::Azure::Core::OperationCancelledException&)
            {
                throw Core::OperationCancelledError(std::string(context) + " was cancelled");
            }
        }
    };
}

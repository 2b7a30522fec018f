// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <azure/core/context.hpp>

#include <stop_token>
namespace AVEVA::BlobStorage::Azure::Impl
{
    /// <summary>
    /// An SDK context that is cancelled when a stop is requested on the token.
    /// If the stop was already requested the context starts out cancelled.
    /// </summary>
    class CancellationContext
    {
        struct CancelOnStop
        {
            ::Azure::Core::Context* Target;
            void operator()() const
            {
                Target->Cancel();
            }
        };

        ::Azure::Core::Context m_context;
        std::stop_callback<CancelOnStop> m_callback;

    public:
        explicit CancellationContext(std::stop_token stopToken);
        CancellationContext(const CancellationContext&) = delete;
        CancellationContext& operator=(const CancellationContext&) = delete;
        CancellationContext(CancellationContext&&) = delete;
        CancellationContext& operator=(CancellationContext&&) = delete;

        [[nodiscard]] const ::Azure::Core::Context& Get() const noexcept;
    };
}

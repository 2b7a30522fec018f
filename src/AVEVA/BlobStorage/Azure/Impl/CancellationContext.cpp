#include "AVEVA/BlobStorage/Azure/Impl/CancellationContext.hpp"
namespace AVEVA::BlobStorage::Azure::Impl
{
    CancellationContext::CancellationContext(std::stop_token stopToken)
        : m_context(),
        m_callback(std::move(stopToken), CancelOnStop{ &m_context })
    {
    }

    const ::Azure::Core::Context& CancellationContext::Get() const noexcept
    {
        return m_context;
    }
}

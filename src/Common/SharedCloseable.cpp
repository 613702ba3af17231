#include <Common/SharedCloseable.h>

#include <Common/Exception.h>
#include <Common/logger_useful.h>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int LOGICAL_ERROR;
}

namespace detail
{

RefCountedState::RefCountedState(TidyPtr tidy_)
    : tidy(std::move(tidy_))
{
    if (!tidy)
        throw Exception(ErrorCodes::LOGICAL_ERROR, "Shared resource must have a cleanup");
}

bool RefCountedState::tryRef()
{
    Int64 current = counts.load(std::memory_order_acquire);
    while (current > 0)
    {
        if (counts.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

void RefCountedState::release()
{
    Int64 previous = counts.fetch_sub(1, std::memory_order_acq_rel);
    if (previous == 1)
        runTidy();
    else if (previous < 1)
        throw Exception(ErrorCodes::LOGICAL_ERROR, "Reference count of {} dropped below zero", tidy->name());
}

void RefCountedState::runTidy()
{
    try
    {
        tidy->tidy();
    }
    catch (...)
    {
        tryLogCurrentException(&Poco::Logger::get("SharedCloseable"), fmt::format("Cleanup of {} failed", tidy->name()));
    }
    cleaned_up.store(true, std::memory_order_release);
}

}


Ref::Ref(TidyPtr tidy)
    : state(std::make_shared<detail::RefCountedState>(std::move(tidy)))
{
}

Ref::Ref(detail::RefCountedStatePtr state_)
    : state(std::move(state_))
{
}

Ref::Ref(Ref && other) noexcept
    : state(other.state)
    , released(other.released.exchange(true, std::memory_order_acq_rel))
{
}

Ref::~Ref()
{
    try
    {
        ensureReleased();
    }
    catch (...)
    {
        tryLogCurrentException(&Poco::Logger::get("SharedCloseable"), "Cannot release reference in destructor");
    }
}

Ref Ref::ref() const
{
    auto result = tryRef();
    if (!result)
        throw Exception(ErrorCodes::LOGICAL_ERROR, "Attempted to reference {} after it was released", state->getTidy().name());
    return std::move(*result);
}

std::optional<Ref> Ref::tryRef() const
{
    if (!state->tryRef())
        return {};
    return Ref(state);
}

void Ref::release()
{
    if (released.exchange(true, std::memory_order_acq_rel))
        throw Exception(ErrorCodes::LOGICAL_ERROR, "Attempted to release reference to {} that has already been released", state->getTidy().name());
    state->release();
}

void Ref::ensureReleased()
{
    if (!released.exchange(true, std::memory_order_acq_rel))
        state->release();
}


SharedCloseable::~SharedCloseable() = default;

}

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include <boost/noncopyable.hpp>

#include <base/types.h>


namespace SSTIO
{

/** Cleanup of a shared resource.
  * tidy() is called exactly once, by whoever releases the last reference.
  * It must not throw: the releasing caller has nobody to report to, so failures are logged by the caller of tidy().
  */
class ITidy
{
public:
    virtual ~ITidy() = default;

    virtual void tidy() = 0;

    /// For log messages.
    virtual std::string name() const = 0;
};

using TidyPtr = std::unique_ptr<ITidy>;


namespace detail
{
    /// Counter of live references plus the cleanup to run when it drops to zero.
    class RefCountedState : private boost::noncopyable
    {
    public:
        explicit RefCountedState(TidyPtr tidy_);

        /// Increments the counter unless the resource was already released by everybody.
        bool tryRef();

        /// Decrements the counter. Exactly one of concurrent callers observes zero and runs the cleanup.
        void release();

        Int64 globalCount() const { return counts.load(std::memory_order_acquire); }
        bool isCleanedUp() const { return cleaned_up.load(std::memory_order_acquire); }

        ITidy & getTidy() { return *tidy; }
        const ITidy & getTidy() const { return *tidy; }

    private:
        std::atomic<Int64> counts{1};
        std::atomic<bool> cleaned_up{false};
        TidyPtr tidy;

        void runTidy();
    };

    using RefCountedStatePtr = std::shared_ptr<RefCountedState>;
}


/** One reference to a shared resource.
  * Each Ref must be released once; the last release runs the resource cleanup.
  * Ref is movable but not copyable: use ref() or tryRef() to obtain another reference.
  */
class Ref : private boost::noncopyable
{
public:
    /// Creates the first reference to a new resource.
    explicit Ref(TidyPtr tidy);

    Ref(Ref && other) noexcept;
    Ref & operator=(Ref && other) = delete;

    ~Ref();

    /// New reference to the same resource. Throws if the resource is already cleaned up.
    Ref ref() const;
    std::optional<Ref> tryRef() const;

    /// Throws if this reference was already released.
    void release();

    /// Releases this reference if it was not released yet.
    void ensureReleased();

    bool isReleased() const { return released.load(std::memory_order_acquire); }
    bool isCleanedUp() const { return state->isCleanedUp(); }

    /// Number of live references to the resource, across all Ref objects sharing it.
    Int64 globalCount() const { return state->globalCount(); }

    ITidy & getTidy() const { return state->getTidy(); }

private:
    explicit Ref(detail::RefCountedStatePtr state_);

    detail::RefCountedStatePtr state;
    std::atomic<bool> released{false};
};


/** Base for objects that share one underlying resource between copies.
  * Every copy holds its own Ref; close() releases it.
  * A copy destroyed without close() releases its reference in the destructor.
  */
class SharedCloseable
{
public:
    virtual ~SharedCloseable();

    void close() { ref.ensureReleased(); }

    bool isClosed() const { return ref.isReleased(); }
    bool isCleanedUp() const { return ref.isCleanedUp(); }

    Int64 getShareCount() const { return ref.globalCount(); }

protected:
    explicit SharedCloseable(TidyPtr tidy) : ref(std::move(tidy)) {}

    /// Shares the resource of `copy`.
    SharedCloseable(const SharedCloseable & copy) : ref(copy.ref.ref()) {}

    SharedCloseable & operator=(const SharedCloseable &) = delete;

    ITidy & getTidy() const { return ref.getTidy(); }

private:
    Ref ref;
};

}

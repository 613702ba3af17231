#include <gtest/gtest.h>

#include <Common/Exception.h>
#include <Common/SharedCloseable.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>


using namespace SSTIO;

namespace SSTIO::ErrorCodes
{
    extern const int LOGICAL_ERROR;
}

namespace
{

struct CountingTidy : public ITidy
{
    explicit CountingTidy(std::atomic<size_t> & calls_, bool throw_on_tidy_ = false)
        : calls(calls_), throw_on_tidy(throw_on_tidy_) {}

    void tidy() override
    {
        ++calls;
        if (throw_on_tidy)
            throw std::runtime_error("cannot tidy");
    }

    std::string name() const override { return "counting"; }

    std::atomic<size_t> & calls;
    bool throw_on_tidy;
};

/// A resource that can really be shared: copies hold references to the same cleanup.
class SharedResource : public SharedCloseable
{
public:
    explicit SharedResource(std::atomic<size_t> & calls) : SharedCloseable(std::make_unique<CountingTidy>(calls)) {}

    std::unique_ptr<SharedResource> sharedCopy() const { return std::unique_ptr<SharedResource>(new SharedResource(*this)); }

private:
    SharedResource(const SharedResource & copy) = default;
};

}


TEST(SharedCloseable, CleanupRunsOnLastRelease)
{
    std::atomic<size_t> calls{0};

    auto resource = std::make_unique<SharedResource>(calls);
    auto copy = resource->sharedCopy();
    EXPECT_EQ(resource->getShareCount(), 2);

    resource->close();
    EXPECT_EQ(calls, 0u);
    EXPECT_TRUE(resource->isClosed());
    EXPECT_FALSE(resource->isCleanedUp());
    EXPECT_EQ(copy->getShareCount(), 1);

    /// Closing twice is harmless.
    resource->close();
    EXPECT_EQ(copy->getShareCount(), 1);

    copy->close();
    EXPECT_EQ(calls, 1u);
    EXPECT_TRUE(copy->isCleanedUp());
    EXPECT_TRUE(resource->isCleanedUp());

    resource.reset();
    copy.reset();
    EXPECT_EQ(calls, 1u);
}

TEST(SharedCloseable, DestructorReleases)
{
    std::atomic<size_t> calls{0};
    {
        SharedResource resource(calls);
        auto copy = resource.sharedCopy();
        copy.reset();
        EXPECT_EQ(calls, 0u);
    }
    EXPECT_EQ(calls, 1u);
}

TEST(SharedCloseable, ConcurrentReleaseRunsCleanupOnce)
{
    constexpr size_t num_threads = 16;
    constexpr size_t copies_per_thread = 64;

    for (size_t iteration = 0; iteration < 20; ++iteration)
    {
        std::atomic<size_t> calls{0};
        SharedResource resource(calls);

        std::vector<std::vector<std::unique_ptr<SharedResource>>> copies(num_threads);
        for (auto & thread_copies : copies)
            for (size_t i = 0; i < copies_per_thread; ++i)
                thread_copies.push_back(resource.sharedCopy());

        resource.close();

        std::vector<std::thread> threads;
        for (auto & thread_copies : copies)
            threads.emplace_back([&thread_copies]
            {
                for (auto & copy : thread_copies)
                    copy->close();
            });
        for (auto & thread : threads)
            thread.join();

        EXPECT_EQ(calls, 1u);
        EXPECT_TRUE(resource.isCleanedUp());
    }
}

TEST(SharedCloseable, CopyAfterCleanupThrows)
{
    std::atomic<size_t> calls{0};
    SharedResource resource(calls);
    resource.close();

    try
    {
        auto copy = resource.sharedCopy();
        FAIL() << "copy of a cleaned up resource must throw";
    }
    catch (const Exception & e)
    {
        EXPECT_EQ(e.code(), ErrorCodes::LOGICAL_ERROR);
    }
    EXPECT_EQ(calls, 1u);
}

TEST(SharedCloseable, CleanupExceptionIsNotThrown)
{
    std::atomic<size_t> calls{0};
    Ref ref(std::make_unique<CountingTidy>(calls, true));

    EXPECT_NO_THROW(ref.release());
    EXPECT_EQ(calls, 1u);
    EXPECT_TRUE(ref.isCleanedUp());
}

TEST(SharedCloseable, RefDoubleReleaseThrows)
{
    std::atomic<size_t> calls{0};
    Ref ref(std::make_unique<CountingTidy>(calls));
    auto other = ref.ref();
    EXPECT_EQ(ref.globalCount(), 2);

    other.release();
    EXPECT_THROW(other.release(), Exception);
    EXPECT_EQ(ref.globalCount(), 1);
    EXPECT_EQ(calls, 0u);

    ref.ensureReleased();
    ref.ensureReleased();
    EXPECT_EQ(calls, 1u);
    EXPECT_FALSE(ref.tryRef().has_value());
}

TEST(SharedCloseable, MovedRefKeepsReference)
{
    std::atomic<size_t> calls{0};
    auto ref = std::make_unique<Ref>(std::make_unique<CountingTidy>(calls));
    Ref moved(std::move(*ref));

    EXPECT_TRUE(ref->isReleased());
    ref.reset();
    EXPECT_EQ(calls, 0u);
    EXPECT_EQ(moved.globalCount(), 1);

    moved.release();
    EXPECT_EQ(calls, 1u);
}

TEST(SharedCloseable, EmptyCleanupIsRejected)
{
    EXPECT_THROW({ Ref ref{TidyPtr{}}; }, Exception);
}

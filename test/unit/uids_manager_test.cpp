#include <gtest/gtest.h>
#include <daemon/classes/uids_manager.hpp>
#include <daemon/backend/exceptions.hpp>
#include <global/exceptions.hpp>

#include <algorithm>
#include <cerrno>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace dyna;
using namespace dyna::backend;

namespace {

// counts the creation attempts reaching the store
class CountingKeyStore : public MemoryKeyStore {
public:
    std::atomic<unsigned long> create_calls{0};

    bool create(const std::string& key) override {
        ++create_calls;
        return MemoryKeyStore::create(key);
    }
};

class FailingKeyStore : public MemoryKeyStore {
public:
    std::atomic<unsigned long> create_calls{0};

    bool create(const std::string&) override {
        ++create_calls;
        throw StorageException(ENOSPC, "disk full");
    }
};

} // namespace

TEST(UidsManagerTest, RejectsInvalidRange) {
    auto store = std::make_shared<MemoryKeyStore>();
    EXPECT_THROW(UidsManager(store, 10, 9), error::ConfigurationException);
    EXPECT_THROW(UidsManager(store, -1, 9), error::ConfigurationException);
    EXPECT_THROW(UidsManager(nullptr, 0, 9), std::invalid_argument);
    EXPECT_NO_THROW(UidsManager(store, 5, 5));
}

TEST(UidsManagerTest, RetryBudgetIsFiveTimesInterval) {
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 100, 199);
    EXPECT_EQ(uids.interval(), 100u);
    EXPECT_EQ(uids.max_retries(), 500u);
}

TEST(UidsManagerTest, ReservesWithinRange) {
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 3000, 3099);
    std::set<UID> seen;
    for (int i = 0; i < 10; ++i) {
        auto uid = uids.reserve();
        EXPECT_GE(uid, 3000);
        EXPECT_LE(uid, 3099);
        EXPECT_TRUE(seen.insert(uid).second) << "uid " << uid << " handed out twice";
        EXPECT_TRUE(uids.is_reserved(uid));
    }
    EXPECT_EQ(uids.reserved().size(), 10u);
}

TEST(UidsManagerTest, ExhaustionWithinBoundedAttempts) {
    auto store = std::make_shared<CountingKeyStore>();
    UidsManager uids(store, 7, 7);
    EXPECT_EQ(uids.reserve(), 7);
    store->create_calls = 0;

    try {
        uids.reserve();
        FAIL() << "reservation in a full range must fail";
    } catch (const CapacityExhaustedException& e) {
        EXPECT_NE(std::string(e.what()).find("memory"), std::string::npos);
    }
    EXPECT_EQ(store->create_calls.load(), 5u);
}

TEST(UidsManagerTest, StorageFailureIsNotRetried) {
    auto store = std::make_shared<FailingKeyStore>();
    UidsManager uids(store, 0, 99);
    EXPECT_THROW(uids.reserve(), StorageException);
    EXPECT_EQ(store->create_calls.load(), 1u);
}

TEST(UidsManagerTest, ReuseAfterFree) {
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 0, 15);
    auto victim = uids.reserve();
    uids.free(victim);
    EXPECT_FALSE(uids.is_reserved(victim));

    // keep drawing until the freed uid comes up again, it must be claimable
    bool reclaimed = false;
    for (int i = 0; i < 10000 && !reclaimed; ++i) {
        auto uid = uids.reserve();
        reclaimed = (uid == victim);
        if (!reclaimed) {
            uids.free(uid);
        }
    }
    EXPECT_TRUE(reclaimed);
    EXPECT_TRUE(uids.is_reserved(victim));
}

TEST(UidsManagerTest, SingleFreeSlotIsFoundAfterFree) {
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 42, 42);
    EXPECT_EQ(uids.reserve(), 42);
    EXPECT_THROW(uids.reserve(), CapacityExhaustedException);
    uids.free(42);
    EXPECT_EQ(uids.reserve(), 42);
}

TEST(UidsManagerTest, FreeUnreservedIsError) {
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 10, 20);
    EXPECT_THROW(uids.free(15), NotReservedException);
    EXPECT_THROW(uids.free(9), NotReservedException);
    EXPECT_THROW(uids.free(21), NotReservedException);

    auto uid = uids.reserve();
    uids.free(uid);
    EXPECT_THROW(uids.free(uid), NotReservedException);
}

TEST(UidsManagerTest, ReservedIgnoresForeignKeys) {
    auto store = std::make_shared<MemoryKeyStore>();
    UidsManager uids(store, 10, 20);
    store->create("12");
    store->create("11");
    store->create("lost+found");
    store->create("9");
    store->create("21");
    store->create("012x");
    store->create("99999999999");
    EXPECT_EQ(uids.reserved(), (std::vector<UID>{11, 12}));
}

TEST(UidsManagerTest, ConcurrentReservationsAreUnique) {
    constexpr int threads_num = 8;
    constexpr int per_thread = 25;
    // twice the demand, so that running out of draws is practically impossible
    UidsManager uids(std::make_shared<MemoryKeyStore>(), 1, 2 * threads_num * per_thread);

    std::mutex results_mutex;
    std::vector<UID> results;
    std::vector<std::thread> threads;
    for (int t = 0; t < threads_num; ++t) {
        threads.emplace_back([&]() {
            std::vector<UID> mine;
            for (int i = 0; i < per_thread; ++i) {
                mine.push_back(uids.reserve());
            }
            std::lock_guard<std::mutex> lock(results_mutex);
            results.insert(results.end(), mine.begin(), mine.end());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_EQ(results.size(), static_cast<size_t>(threads_num * per_thread));
    std::sort(results.begin(), results.end());
    EXPECT_EQ(std::adjacent_find(results.begin(), results.end()), results.end());
}

#include <gtest/gtest.h>
#include <stdexec/execution.hpp>
#include <exec/static_thread_pool.hpp>
#include <algorithm>
#include <atomic>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "relay/signal.hpp"

using namespace relay;

using Signal   = relay::signal<std::string>;
using Listener = Signal::listener_type;

// --- Test Fixture ---
class ConcurrencyTest : public ::testing::Test {
protected:
    exec::static_thread_pool pool_{4};
    decltype(pool_.get_scheduler()) sch_ = pool_.get_scheduler();

    Signal signal_{"concurrent"};

    template <typename Fn>
    auto on_pool(Fn fn) {
        return stdexec::schedule(sch_) | stdexec::then(std::move(fn));
    }
};

// 1. Concurrent Registration
TEST_F(ConcurrencyTest, ParallelAddsYieldUniqueOrderedSlots) {
    constexpr int per_worker = 250;

    auto worker = [this](int w) {
        return on_pool([this, w] {
            for (int i = 0; i < per_worker; ++i) {
                signal_.add([](const Listener&) {}, (w * per_worker + i) % 7);
            }
        });
    };

    auto result = stdexec::sync_wait(stdexec::when_all(worker(0), worker(1), worker(2), worker(3)));
    ASSERT_TRUE(result.has_value());

    auto slots = signal_.slots();
    ASSERT_EQ(slots.size(), 4u * per_worker);
    EXPECT_TRUE(std::is_sorted(slots.begin(), slots.end()));

    std::set<Signal::id_type> ids;
    for (const auto& s : slots) {
        ids.insert(s.id());
    }
    EXPECT_EQ(ids.size(), slots.size());
    EXPECT_EQ(*ids.rbegin(), 4u * per_worker - 1);
}

// 2. Concurrent Removal
TEST_F(ConcurrencyTest, EachSlotIsRemovedExactlyOnce) {
    constexpr int total = 400;
    std::vector<Signal::id_type> ids;
    for (int i = 0; i < total; ++i) {
        ids.push_back(signal_.add([](const Listener&) {}, i % 3).id());
    }

    std::atomic<int> removed{0};
    auto worker = [&](int w) {
        return on_pool([&, w] {
            for (int i = 0; i < total; ++i) {
                if (signal_.remove(ids[(i + w * 97) % total])) {
                    removed.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    };

    auto result = stdexec::sync_wait(stdexec::when_all(worker(0), worker(1), worker(2), worker(3)));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(removed.load(), total);
    EXPECT_TRUE(signal_.empty());
}

// 3. Dispatch Racing with Writers
// Every dispatch must see one consistent sequence: sorted by priority, no
// slot twice, and every stable slot exactly once.
TEST_F(ConcurrencyTest, DispatchSeesConsistentSnapshots) {
    constexpr int stable = 50;
    constexpr int rounds = 300;

    static thread_local std::vector<std::pair<int, int>> trace;

    for (int i = 0; i < stable; ++i) {
        signal_.add([i](const Listener&) { trace.emplace_back(2 * i, i); }, 2 * i);
    }

    std::atomic<bool> writer_done{false};
    std::atomic<int>  violations{0};

    auto writer = on_pool([&] {
        for (int r = 0; r < rounds; ++r) {
            const int tag = stable + r;
            const int priority = 2 * (r % stable) + 1;
            auto s = signal_.add([tag, priority](const Listener&) { trace.emplace_back(priority, tag); }, priority);
            if (r % 2 == 0 && !signal_.remove(s)) {
                violations.fetch_add(1, std::memory_order_relaxed);
            }
        }
        writer_done.store(true, std::memory_order_release);
    });

    auto reader = [&] {
        return on_pool([&] {
            do {
                trace.clear();
                signal_.call(any);

                bool ordered = std::is_sorted(trace.begin(), trace.end(),
                    [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

                std::set<int> tags;
                int stable_seen = 0;
                for (const auto& [priority, tag] : trace) {
                    tags.insert(tag);
                    if (tag < stable) {
                        ++stable_seen;
                    }
                }

                if (!ordered || tags.size() != trace.size() || stable_seen != stable) {
                    violations.fetch_add(1, std::memory_order_relaxed);
                }
            } while (!writer_done.load(std::memory_order_acquire));
        });
    };

    auto result = stdexec::sync_wait(stdexec::when_all(std::move(writer), reader(), reader()));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(violations.load(), 0);
    EXPECT_EQ(signal_.size(), static_cast<std::size_t>(stable + rounds / 2));
}

// 4. Parallel Dispatch
TEST_F(ConcurrencyTest, ParallelCallsInvokeEverySlot) {
    std::atomic<int> hits{0};
    signal_.add([&hits](const Listener&) { hits.fetch_add(1, std::memory_order_relaxed); }, 0, "x");
    signal_.add([&hits](const Listener&) { hits.fetch_add(1, std::memory_order_relaxed); }, 1, any);

    auto caller = [&](std::string sender) {
        return on_pool([&, sender = std::move(sender)] {
            for (int i = 0; i < 1000; ++i) {
                signal_.call(sender);
            }
        });
    };

    auto result = stdexec::sync_wait(stdexec::when_all(caller("x"), caller("y"), caller("x"), caller("y")));
    ASSERT_TRUE(result.has_value());

    // "x" reaches both slots, "y" only the `any` one.
    EXPECT_EQ(hits.load(), 2 * 1000 * 2 + 2 * 1000 * 1);
}

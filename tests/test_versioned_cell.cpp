#include <gtest/gtest.h>
#include <butterfly/versioned_cell.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace butterfly;

namespace {

// Every field carries the same stamp; a torn read would show mixed stamps
struct Stamped {
    std::uint64_t a = 0;
    std::uint64_t b = 0;
    std::uint64_t c = 0;
    std::vector<std::uint64_t> tail;
};

} // namespace

TEST(VersionedCellTest, StartsAtVersionZeroWithDefaultValue) {
    VersionedCell<int> cell;
    EXPECT_EQ(cell.version(), 0u);
    EXPECT_EQ(*cell.load(), 0);
}

TEST(VersionedCellTest, PublishBumpsVersion) {
    VersionedCell<int> cell(5);
    cell.publish(6);
    cell.publish(7);

    auto [value, version] = cell.load_versioned();
    EXPECT_EQ(*value, 7);
    EXPECT_EQ(version, 2u);
}

TEST(VersionedCellTest, OldReadersKeepTheirValue) {
    VersionedCell<int> cell(1);
    auto held = cell.load();
    cell.publish(2);
    EXPECT_EQ(*held, 1);
    EXPECT_EQ(*cell.load(), 2);
}

TEST(VersionedCellTest, ConcurrentReadersNeverSeeTornValues) {
    VersionedCell<Stamped> cell;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::thread writer([&]() {
        for (std::uint64_t i = 1; i <= 20000; ++i) {
            Stamped s;
            s.a = s.b = s.c = i;
            s.tail.assign(8, i);
            cell.publish(std::move(s));
        }
        done.store(true);
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 3; ++r) {
        readers.emplace_back([&]() {
            std::uint64_t last = 0;
            while (!done.load()) {
                auto v = cell.load();
                if (v->a != v->b || v->b != v->c) torn.fetch_add(1);
                for (auto t : v->tail) {
                    if (t != v->a) torn.fetch_add(1);
                }
                // Values only move forward
                if (v->a < last) torn.fetch_add(1);
                last = v->a;
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(cell.version(), 20000u);
}

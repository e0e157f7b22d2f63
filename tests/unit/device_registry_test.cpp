#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "registry/device_registry.hpp"

using namespace devscout;
using namespace testing;

namespace {

discovery::DeviceRecord make_record(const std::string &id, const std::string &ip) {
    discovery::DeviceRecord record;
    record.id = id;
    record.ip = ip;
    record.attributes = {{"id", id}, {"kind", "sensor"}};
    return record;
}

// Helper: map of `count` devices whose ids all carry the same tag
discovery::DeviceMap make_generation(const std::string &tag, int count) {
    discovery::DeviceMap devices;
    for (int i = 0; i < count; ++i) {
        std::string id = "dev" + std::to_string(i);
        auto record = make_record(id, "10.0.0." + std::to_string(i));
        record.attributes["tag"] = tag;
        devices[id] = record;
    }
    return devices;
}

}  // namespace

class DeviceRegistryTest : public Test {
protected:
    void SetUp() override { registry = std::make_unique<registry::DeviceRegistry>(); }

    std::unique_ptr<registry::DeviceRegistry> registry;
};

TEST_F(DeviceRegistryTest, StartsEmpty) {
    EXPECT_EQ(registry->device_count(), 0);
    EXPECT_TRUE(registry->get_all()->empty());
    EXPECT_FALSE(registry->get("dev-A").has_value());
    EXPECT_EQ(registry->generation(), 0);
}

TEST_F(DeviceRegistryTest, ReplaceDropsDevicesAbsentFromNewMap) {
    discovery::DeviceMap first;
    first["dev-A"] = make_record("dev-A", "192.168.1.5");
    first["dev-B"] = make_record("dev-B", "192.168.1.9");
    registry->replace(first);
    EXPECT_EQ(registry->device_count(), 2);

    discovery::DeviceMap second;
    second["dev-B"] = make_record("dev-B", "192.168.1.9");
    registry->replace(second);

    EXPECT_EQ(registry->device_count(), 1);
    EXPECT_FALSE(registry->get("dev-A").has_value());
    ASSERT_TRUE(registry->get("dev-B").has_value());
    EXPECT_EQ(registry->get("dev-B")->ip, "192.168.1.9");
    EXPECT_EQ(registry->generation(), 2);
}

TEST_F(DeviceRegistryTest, UpsertKeepsOtherRecords) {
    discovery::DeviceMap initial;
    initial["dev-A"] = make_record("dev-A", "192.168.1.5");
    initial["dev-B"] = make_record("dev-B", "192.168.1.9");
    registry->replace(initial);

    auto updated = make_record("dev-A", "192.168.1.5");
    updated.attributes["firmware"] = "2.1";
    ASSERT_TRUE(registry->upsert(updated));

    EXPECT_EQ(registry->device_count(), 2);
    EXPECT_EQ(registry->get("dev-A")->attributes["firmware"], "2.1");
    EXPECT_EQ(registry->get("dev-B")->ip, "192.168.1.9");
}

TEST_F(DeviceRegistryTest, UpsertRejectsEmptyId) {
    EXPECT_FALSE(registry->upsert(make_record("", "192.168.1.7")));
    EXPECT_EQ(registry->device_count(), 0);
    EXPECT_EQ(registry->generation(), 0);
}

TEST_F(DeviceRegistryTest, SnapshotSurvivesLaterReplace) {
    discovery::DeviceMap initial;
    initial["dev-A"] = make_record("dev-A", "192.168.1.5");
    registry->replace(initial);

    auto snapshot = registry->get_all();
    registry->replace(discovery::DeviceMap{});

    ASSERT_EQ(snapshot->size(), 1);
    EXPECT_EQ(snapshot->at("dev-A").ip, "192.168.1.5");
    EXPECT_EQ(registry->device_count(), 0);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

// Test: Readers during repeated replaces only ever see one complete generation
// Ensures: No mixed pre/post-sweep state is observable
TEST_F(DeviceRegistryTest, ReadersNeverObserveMixedGenerations) {
    constexpr int kDevices = 20;
    registry->replace(make_generation("gen0", kDevices));

    std::atomic<bool> stop_reading{false};
    std::atomic<size_t> snapshots{0};
    std::atomic<size_t> mixed{0};
    std::vector<std::thread> readers;

    for (int i = 0; i < 20; ++i) {
        readers.emplace_back([&]() {
            while (!stop_reading.load()) {
                auto all = registry->get_all();
                if (all->size() != kDevices) {
                    ++mixed;
                    continue;
                }
                const auto tag = all->begin()->second.attributes.at("tag");
                for (const auto &entry : *all) {
                    if (entry.second.attributes.at("tag") != tag) {
                        ++mixed;
                        break;
                    }
                }
                ++snapshots;
                std::this_thread::yield();
            }
        });
    }

    for (int gen = 1; gen <= 50; ++gen) {
        registry->replace(make_generation("gen" + std::to_string(gen), kDevices));
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    stop_reading.store(true);
    for (auto &t : readers) {
        t.join();
    }

    EXPECT_GT(snapshots.load(), 0);
    EXPECT_EQ(mixed.load(), 0);
}

// Test: Concurrent upserts of distinct ids are all retained
// Ensures: Copy-on-write does not lose writes
TEST_F(DeviceRegistryTest, ConcurrentUpsertsAreAllKept) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 25;
    std::vector<std::thread> writers;

    for (int t = 0; t < kThreads; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                std::string id = "dev-" + std::to_string(t) + "-" + std::to_string(i);
                registry->upsert(make_record(id, "10.0." + std::to_string(t) + "." + std::to_string(i)));
            }
        });
    }

    for (auto &t : writers) {
        t.join();
    }

    EXPECT_EQ(registry->device_count(), kThreads * kPerThread);
    EXPECT_EQ(registry->generation(), static_cast<uint64_t>(kThreads * kPerThread));
}

// Test: Mixed get/get_all/upsert/replace under load
// Ensures: No deadlocks or crashes
TEST_F(DeviceRegistryTest, MixedOperationsStress) {
    registry->replace(make_generation("gen0", 5));

    std::atomic<bool> stop_test{false};
    std::atomic<size_t> lookups{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() {
            while (!stop_test.load()) {
                auto device = registry->get("dev1");
                if (device.has_value()) {
                    ++lookups;
                    EXPECT_EQ(device->id, "dev1");
                }
                std::this_thread::yield();
            }
        });
    }

    threads.emplace_back([&]() {
        for (int i = 0; i < 50 && !stop_test.load(); ++i) {
            registry->upsert(make_record("extra", "10.0.1.1"));
            std::this_thread::yield();
        }
    });

    threads.emplace_back([&]() {
        for (int i = 0; i < 20 && !stop_test.load(); ++i) {
            registry->replace(make_generation("gen" + std::to_string(i), 5));
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    stop_test.store(true);
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_GT(lookups.load(), 0);
}

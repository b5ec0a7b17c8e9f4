#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "core/cache/dynamic/DynamicCache.hpp"
#include "core/common/Clock.hpp"

using cachepilot::core::cache::DynamicCache;
using cachepilot::core::common::ManualClock;

void smokeTestDynamicCache() {
    std::cout << "Testing DynamicCache basic operations...\n";

    auto clock = std::make_shared<ManualClock>();
    DynamicCache<std::string, std::vector<uint8_t>> cache(4, clock);

    cache.put("a", {1});
    cache.put("b", {2});
    cache.put("c", {3});
    cache.put("d", {4});
    assert(cache.size() == 4);

    // "a" самый старый, вытесняется
    cache.put("e", {5});
    assert(cache.size() == 4);
    auto v = cache.get("e");
    assert(v && (*v)[0] == 5);
    assert(!cache.get("a"));
    assert(cache.evictionCount() == 1);

    assert(cache.remove("e"));
    assert(!cache.get("e"));
    assert(!cache.remove("e"));

    cache.clear();
    assert(cache.size() == 0);

    std::cout << "[OK] DynamicCache smoke test\n";
}

void testDynamicCacheLruOrder() {
    std::cout << "Testing DynamicCache LRU order...\n";

    auto clock = std::make_shared<ManualClock>();
    DynamicCache<std::string, int> cache(3, clock);
    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);

    // Чтение "a" делает его свежим, вытесняется "b"
    assert(cache.get("a"));
    cache.put("d", 4);
    assert(cache.contains("a"));
    assert(!cache.contains("b"));

    // peek не трогает порядок
    assert(cache.peek("c"));
    auto order = cache.keysLeastRecentFirst();
    assert(order.size() == 3);
    assert(order.front() == "c");
    assert(order.back() == "d");

    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const std::string& key, const int&) { evicted.push_back(key); });
    cache.resize(1);
    assert(cache.size() == 1);
    assert(evicted.size() == 2);
    assert(cache.contains("d"));

    std::cout << "[OK] DynamicCache LRU order test\n";
}

void stressTestDynamicCache() {
    std::cout << "Testing DynamicCache stress operations...\n";

    DynamicCache<std::string, std::vector<uint8_t>> cache(128, std::make_shared<ManualClock>());
    for (int i = 0; i < 1000; ++i) {
        cache.put(std::to_string(i), {static_cast<uint8_t>(i % 256)});
    }
    assert(cache.size() <= 128);
    for (int i = 0; i < 1000; ++i) {
        cache.remove(std::to_string(i));
    }
    assert(cache.size() == 0);

    std::cout << "[OK] DynamicCache stress test\n";
}

void testDynamicCacheTTL() {
    std::cout << "Testing DynamicCache TTL functionality...\n";

    auto clock = std::make_shared<ManualClock>();
    DynamicCache<std::string, std::vector<uint8_t>> cache(10, clock, 5000);

    cache.put("ttl_test", {42}, 1000);
    cache.put("default_ttl", {7});
    auto v = cache.get("ttl_test");
    assert(v && (*v)[0] == 42);

    clock->advance(999);
    assert(cache.get("ttl_test"));

    // Граница TTL включительно
    clock->advance(1);
    assert(!cache.get("ttl_test"));
    assert(cache.contains("default_ttl"));

    clock->advance(4000);
    assert(!cache.contains("default_ttl"));
    assert(cache.removeExpired() == 1);
    assert(cache.size() == 0);

    // take отдаёт запись и после истечения TTL
    cache.put("stale", {9}, 100);
    clock->advance(100);
    assert(!cache.peek("stale"));
    auto taken = cache.take("stale");
    assert(taken && (*taken)[0] == 9);
    assert(!cache.take("stale"));

    // restore возвращает запись с прежним временем записи и TTL
    cache.put("fresh", {5}, 1000);
    clock->advance(600);
    auto entry = cache.takeEntry("fresh");
    assert(entry && entry->ttlMs == 1000);
    assert(!cache.contains("fresh"));
    cache.restore("fresh", *entry);
    assert(cache.contains("fresh"));
    clock->advance(400);
    assert(!cache.contains("fresh"));

    std::cout << "[OK] DynamicCache TTL test\n";
}

void testDynamicCacheExport() {
    std::cout << "Testing DynamicCache export...\n";

    auto clock = std::make_shared<ManualClock>();
    DynamicCache<std::string, int> cache(10, clock);
    cache.batchPut({{"x", 1}, {"y", 2}});
    cache.put("z", 3, 100);
    clock->advance(200);

    auto all = cache.exportAll();
    assert(all.size() == 2);
    assert(all.at("x") == 1);
    assert(all.count("z") == 0);

    std::cout << "[OK] DynamicCache export test\n";
}

int main() {
    try {
        smokeTestDynamicCache();
        testDynamicCacheLruOrder();
        stressTestDynamicCache();
        testDynamicCacheTTL();
        testDynamicCacheExport();
        std::cout << "All DynamicCache tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

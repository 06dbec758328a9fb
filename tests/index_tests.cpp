#include "index.h"

#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static void test_insert_get_remove() {
    std::cout << "[T] insert_get_remove\n";
    Index idx;
    assert(idx.empty());
    idx.insert("a", "1");
    idx.insert("b", "2");
    assert(idx.size() == 2);
    assert(idx.get("a") == std::string("1"));
    assert(idx.contains("b"));
    assert(!idx.get("c").has_value());

    assert(idx.remove("a"));
    assert(!idx.remove("a"));
    assert(!idx.contains("a"));
    assert(idx.size() == 1);

    idx.clear();
    assert(idx.empty());
}

static void test_overwrite() {
    std::cout << "[T] overwrite\n";
    Index idx;
    idx.insert("k", "v1");
    idx.insert("k", "v2");
    assert(idx.size() == 1);
    assert(idx.get("k") == std::string("v2"));
}

static void test_snapshot_ordered() {
    std::cout << "[T] snapshot_ordered\n";
    Index idx;
    idx.insert("c", "3");
    idx.insert("a", "1");
    idx.insert("b", "2");
    auto snap = idx.snapshot();
    std::string keys;
    for (const auto& kv : snap) keys += kv.first;
    assert(keys == "abc");
}

static void test_concurrent_readers_writers() {
    std::cout << "[T] concurrent_readers_writers\n";
    Index idx;
    constexpr int kThreads = 4;
    constexpr int kPerThread = 2000;

    std::vector<std::thread> ts;
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&idx, t] {
            for (int i = 0; i < kPerThread; ++i) {
                std::string k = "t" + std::to_string(t) + "_" + std::to_string(i);
                idx.insert(k, std::to_string(i));
                auto v = idx.get(k);
                assert(v && *v == std::to_string(i));
            }
        });
    }
    for (int t = 0; t < kThreads; ++t) {
        ts.emplace_back([&idx] {
            for (int i = 0; i < kPerThread; ++i) (void)idx.get("t0_" + std::to_string(i));
        });
    }
    for (auto& th : ts) th.join();
    assert(idx.size() == kThreads * kPerThread);
}

int main() {
    test_insert_get_remove();
    test_overwrite();
    test_snapshot_ordered();
    test_concurrent_readers_writers();

    std::cout << "All index tests passed\n";
    return 0;
}

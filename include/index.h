#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

// In-memory key -> value map. Safe to share between threads: lookups take a
// shared lock, mutations an exclusive one.
class Index {
public:
    // mutations
    void insert(std::string key, std::string value);  // overwrites
    bool remove(const std::string& key);               // false if absent

    // lookup
    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    // admin
    size_t size() const;
    bool   empty() const { return size() == 0; }
    void   clear();

    // ordered copy, for comparing states in tests and for the REPL
    std::map<std::string, std::string> snapshot() const;

private:
    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::string> kv_;
};

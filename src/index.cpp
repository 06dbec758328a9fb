#include "index.h"

#include <mutex>

void Index::insert(std::string key, std::string value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    kv_[std::move(key)] = std::move(value);
}

bool Index::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    return kv_.erase(key) > 0;
}

std::optional<std::string> Index::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = kv_.find(key);
    if (it == kv_.end()) return std::nullopt;
    return it->second;
}

bool Index::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return kv_.count(key) > 0;
}

size_t Index::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return kv_.size();
}

void Index::clear() {
    std::unique_lock<std::shared_mutex> lock(mu_);
    kv_.clear();
}

std::map<std::string, std::string> Index::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return std::map<std::string, std::string>(kv_.begin(), kv_.end());
}

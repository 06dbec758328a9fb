#include "store.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

Store::Store(std::string dir, StoreOptions opts)
    : dir_(std::move(dir))
    , opts_(std::move(opts))
{}

Store::~Store() {
    Status s = close();
    if (!s.ok()) {
        std::cerr << "store: close of " << dir_ << " failed: " << s.to_string() << "\n";
    }
}

Status Store::open(const std::string& dir, std::unique_ptr<Store>* out) {
    return open(dir, StoreOptions(), out);
}

Status Store::open(const std::string& dir, const StoreOptions& opts, std::unique_ptr<Store>* out) {
    std::unique_ptr<Store> store(new Store(dir, opts));
    RecoveryManager recovery(dir, opts);
    Status s = recovery.run(store.get());
    if (!s.ok()) return s;
    store->recovery_state_ = recovery.state();
    store->replayed_ = recovery.replayed();
    *out = std::move(store);
    return Status::OK();
}

std::string Store::log_path() const {
    return (fs::path(dir_) / opts_.log_file_name).string();
}

void Store::attach_log(std::unique_ptr<WAL> wal) {
    std::lock_guard<std::mutex> lock(write_mu_);
    wal_ = std::move(wal);
}

Status Store::release_log() {
    std::lock_guard<std::mutex> lock(write_mu_);
    if (!wal_) return Status::OK();
    Status s = wal_->close();
    wal_.reset();
    return s;
}

Status Store::append_locked(const Command& cmd) {
    if (!wal_) return Status::IOError("store is closed: " + dir_);
    return wal_->append(encode(cmd));
}

Status Store::execute(const Command& cmd, std::string* result) {
    result->clear();
    switch (cmd.type) {
        case CmdType::Get: return get(cmd.key, result);
        case CmdType::Set: return set(cmd.key, cmd.value);
        case CmdType::Rm: return remove(cmd.key);
    }
    return Status::InvalidArgument("unknown command type");
}

Status Store::get(const std::string& key, std::string* value) const {
    auto v = index_.get(key);
    if (!v) return Status::NotFound("Key not found: " + key);
    *value = std::move(*v);
    return Status::OK();
}

Status Store::set(const std::string& key, const std::string& value) {
    Status s = check_token("key", key);
    if (s.ok()) s = check_token("value", value);
    if (!s.ok()) return s;

    std::lock_guard<std::mutex> lock(write_mu_);
    s = append_locked(Command::set(key, value));
    if (!s.ok()) return s;
    index_.insert(key, value);
    return Status::OK();
}

Status Store::remove(const std::string& key) {
    Status s = check_token("key", key);
    if (!s.ok()) return s;

    std::lock_guard<std::mutex> lock(write_mu_);
    s = append_locked(Command::rm(key));
    if (!s.ok()) return s;
    if (!index_.remove(key)) return Status::NotFound("Key not found: " + key);
    return Status::OK();
}

Status Store::sync() {
    std::lock_guard<std::mutex> lock(write_mu_);
    if (!wal_) return Status::OK();
    return wal_->sync();
}

uint64_t Store::unsynced_log_bytes() {
    std::lock_guard<std::mutex> lock(write_mu_);
    return wal_ ? wal_->unsynced_bytes() : 0;
}

Status Store::close() {
    return release_log();
}

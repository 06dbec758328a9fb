#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "command.h"
#include "index.h"
#include "options.h"
#include "recovery.h"
#include "status.h"
#include "wal.h"

// Durable key-value store: an in-memory Index fed by an append-only WAL in
// `dir`. Thread-safe; mutations are serialized, reads are not.
class Store {
public:
    // Recovers whatever a previous run left in `dir` (creating it if needed).
    // On failure *out is untouched and the directory is as it was.
    static Status open(const std::string& dir, std::unique_ptr<Store>* out);
    static Status open(const std::string& dir, const StoreOptions& opts, std::unique_ptr<Store>* out);

    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // Runs one command. *result receives the value for get and is cleared
    // for set/rm. Used for live calls and for replay alike.
    Status execute(const Command& cmd, std::string* result);

    Status get(const std::string& key, std::string* value) const;
    Status set(const std::string& key, const std::string& value);
    // The rm record is logged even when the key turns out to be absent.
    Status remove(const std::string& key);

    Status sync();
    // Syncs and releases the log. Later mutations fail; reads still work.
    Status close();

    size_t size() const { return index_.size(); }
    std::map<std::string, std::string> snapshot() const { return index_.snapshot(); }
    const std::string& dir() const { return dir_; }
    std::string log_path() const;

    // How open() found the directory, and how many records it replayed.
    RecoveryManager::State recovery_state() const { return recovery_state_; }
    uint64_t replayed_records() const { return replayed_; }
    // Log bytes not yet fsync'ed; always 0 with sync_writes.
    uint64_t unsynced_log_bytes();

private:
    friend class RecoveryManager;

    Store(std::string dir, StoreOptions opts);

    void attach_log(std::unique_ptr<WAL> wal);
    Status release_log();

    // Caller holds write_mu_.
    Status append_locked(const Command& cmd);

    std::string dir_;
    StoreOptions opts_;
    Index index_;
    std::mutex write_mu_;          // spans log append + index apply
    std::unique_ptr<WAL> wal_;

    RecoveryManager::State recovery_state_ = RecoveryManager::State::NoPriorLog;
    uint64_t replayed_ = 0;
};

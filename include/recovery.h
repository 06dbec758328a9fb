#pragma once
#include <cstdint>
#include <string>

#include "options.h"
#include "status.h"

class Store;

// Startup protocol that rebuilds a Store from the log left by a previous run.
//
//   1. the active log (P) is renamed aside to the quarantine path (P')
//   2. a fresh, empty log is created at P and handed to the store
//   3. every record in P' is replayed through Store::execute, which
//      re-appends it to the fresh log and applies it to the index
//   4. success: P' is deleted. failure: P' is renamed back over P
//
// so a failed open leaves the directory as it found it.
class RecoveryManager {
public:
    enum class State { NoPriorLog, Quarantined, Replaying, Committed, RolledBack };

    RecoveryManager(std::string dir, StoreOptions opts);

    // Leaves `store` with an open active log and a rebuilt index, or fails
    // with the directory restored.
    Status run(Store* store);

    State state() const { return state_; }
    static const char* state_name(State s);

    const std::string& log_path() const { return log_path_; }
    const std::string& quarantine_path() const { return old_path_; }
    uint64_t replayed() const { return replayed_; }

    // "wal.log" -> "wal.log.old". Fails if `log_path` has no extension.
    static Status quarantine_path_for(const std::string& log_path, std::string* out);

private:
    Status replay(Store* store);
    void rollback(Store* store);

    std::string dir_;
    StoreOptions opts_;
    std::string log_path_;
    std::string old_path_;
    State state_ = State::NoPriorLog;
    uint64_t replayed_ = 0;
    bool have_crc_ = false;
    uint32_t old_crc_ = 0;
};

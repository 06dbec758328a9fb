#include "recovery.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>

#include "command.h"
#include "store.h"
#include "utils.h"
#include "wal.h"

namespace fs = std::filesystem;

namespace {
constexpr const char* kQuarantineSuffix = ".old";
}  // namespace

RecoveryManager::RecoveryManager(std::string dir, StoreOptions opts)
    : dir_(std::move(dir)), opts_(std::move(opts)) {
    log_path_ = (fs::path(dir_) / opts_.log_file_name).string();
}

const char* RecoveryManager::state_name(State s) {
    switch (s) {
        case State::NoPriorLog: return "NoPriorLog";
        case State::Quarantined: return "Quarantined";
        case State::Replaying: return "Replaying";
        case State::Committed: return "Committed";
        case State::RolledBack: return "RolledBack";
    }
    return "?";
}

Status RecoveryManager::quarantine_path_for(const std::string& log_path, std::string* out) {
    fs::path p(log_path);
    if (!p.has_extension()) {
        return Status::InvalidArgument("log file name has no extension: " + log_path,
                                       Status::Sub::InvalidLogFileName);
    }
    std::string ext = p.extension().string();
    ext += kQuarantineSuffix;
    p.replace_extension(ext);
    *out = p.string();
    return Status::OK();
}

Status RecoveryManager::run(Store* store) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return Status::IOError("failed to create store directory '" + dir_ + "': " + ec.message());

    Status s = quarantine_path_for(log_path_, &old_path_);
    if (!s.ok()) return s;

    // A leftover quarantine log means an earlier recovery never finished (or
    // could not clean up). Which of the two files is authoritative can't be
    // decided here, so don't guess.
    if (fs::exists(old_path_, ec)) {
        return Status::Recovery("stale quarantine log " + old_path_ +
                                " exists; an earlier recovery did not complete, refusing to open");
    }

    const bool prior = fs::is_regular_file(log_path_, ec);
    if (prior) {
        fs::rename(log_path_, old_path_, ec);
        if (ec) return Status::IOError("failed to quarantine log '" + log_path_ + "': " + ec.message());
        if (!fsync_dir(dir_)) std::cerr << "recovery: fsync of " << dir_ << " failed\n";
        state_ = State::Quarantined;
        have_crc_ = file_crc32(old_path_, &old_crc_);
    } else {
        state_ = State::NoPriorLog;
    }

    std::unique_ptr<WAL> wal;
    s = WAL::create_new(log_path_, opts_.sync_writes, &wal);
    if (!s.ok()) {
        if (prior) {
            rollback(store);
            return Status::Recovery(s);
        }
        return s;
    }
    if (!fsync_dir(dir_)) std::cerr << "recovery: fsync of " << dir_ << " failed\n";
    store->attach_log(std::move(wal));

    if (!prior) return Status::OK();

    state_ = State::Replaying;
    s = replay(store);
    if (!s.ok()) {
        std::cerr << "recovery: replay of " << old_path_ << " failed: " << s.to_string() << "\n";
        rollback(store);
        return Status::Recovery(s);
    }

    // The quarantined copy is the only durable history until the re-homed
    // records are on disk, whatever sync_writes says.
    s = store->sync();
    if (!s.ok()) {
        std::cerr << "recovery: sync of " << log_path_ << " failed: " << s.to_string() << "\n";
        rollback(store);
        return Status::Recovery(s);
    }

    fs::remove(old_path_, ec);
    if (ec) {
        std::cerr << "recovery: warning: could not remove " << old_path_ << ": " << ec.message()
                  << " (the next open will refuse to start until it is removed)\n";
    } else if (!fsync_dir(dir_)) {
        std::cerr << "recovery: fsync of " << dir_ << " failed\n";
    }
    state_ = State::Committed;
    return Status::OK();
}

Status RecoveryManager::replay(Store* store) {
    std::unique_ptr<WALReader> reader;
    Status s = WALReader::open_existing(old_path_, &reader);
    if (!s.ok()) return s;

    std::string line;
    std::string ignored;
    Status rs;
    while (reader->next(&line, &rs)) {
        const uint64_t lineno = reader->records_read();
        Command cmd;
        Status ds = decode(line, &cmd);
        if (!ds.ok()) {
            return Status::InvalidArgument(old_path_ + ":" + std::to_string(lineno) + ": " + ds.message(),
                                           ds.subcode());
        }
        // Reads are never logged.
        if (!cmd.mutates()) {
            return Status::InvalidArgument(old_path_ + ":" + std::to_string(lineno) + ": unexpected get record");
        }

        Status es = store->execute(cmd, &ignored);
        // A logged rm of an absent key was a miss when it first ran too.
        if (!es.ok() && !(es.is_not_found() && cmd.type == CmdType::Rm)) return es;
        ++replayed_;
    }
    return rs;
}

void RecoveryManager::rollback(Store* store) {
    Status cs = store->release_log();
    if (!cs.ok()) std::cerr << "recovery: closing fresh log failed: " << cs.to_string() << "\n";

    std::error_code ec;
    fs::rename(old_path_, log_path_, ec);
    if (ec) {
        std::cerr << "recovery: FATAL: could not restore " << old_path_ << " to " << log_path_ << ": "
                  << ec.message() << "; the store history now lives in " << old_path_ << "\n";
        std::abort();
    }
    if (!fsync_dir(dir_)) std::cerr << "recovery: fsync of " << dir_ << " failed\n";
    state_ = State::RolledBack;

    if (have_crc_) {
        uint32_t now = 0;
        if (!file_crc32(log_path_, &now) || now != old_crc_) {
            std::cerr << "recovery: restored log " << log_path_ << " does not match its quarantined digest\n";
        }
    }
}

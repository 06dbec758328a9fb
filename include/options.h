#pragma once
#include <string>

struct StoreOptions {
    // Active log name inside the store directory. Must have an extension:
    // the quarantine copy is named by appending ".old" to it.
    std::string log_file_name = "wal.log";

    // fsync after every append. Turning this off trades durability of the
    // last few writes for throughput.
    bool sync_writes = true;
};

#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "status.h"

// Append-only record log. One record per line, LF-terminated, no header.
// A WAL exclusively owns its file descriptor; close() (or the destructor)
// syncs and releases it.
class WAL {
public:
    ~WAL();

    WAL(const WAL&) = delete;
    WAL& operator=(const WAL&) = delete;

    // Creates `path`, truncating any existing file.
    static Status create_new(const std::string& path, bool sync_writes, std::unique_ptr<WAL>* out);

    // Writes record + '\n'. When sync_writes is set the data is fsync'ed
    // before OK is returned. On failure the file is cut back to its previous
    // length and the caller must treat the record as not written. If the
    // cut-back itself fails the log is closed and every later append fails.
    Status append(const std::string& record);

    Status sync();
    Status close();

    bool is_open() const { return fd_ >= 0; }
    bool failed() const { return failed_; }
    const std::string& path() const { return path_; }
    uint64_t size() const { return size_; }
    uint64_t records_written() const { return records_; }
    // Bytes appended since the last successful fsync.
    uint64_t unsynced_bytes() const { return size_ - synced_size_; }

private:
    WAL(std::string path, int fd, bool sync_writes);

    static bool writeAll(int fd, const void* p, size_t n);

    std::string path_;
    int fd_ = -1;
    bool sync_writes_ = true;
    uint64_t size_ = 0;
    uint64_t synced_size_ = 0;
    uint64_t records_ = 0;
    bool failed_ = false;
};

// Lazy, forward-only reader over an existing log. To read again, open a new reader.
class WALReader {
public:
    ~WALReader();

    WALReader(const WALReader&) = delete;
    WALReader& operator=(const WALReader&) = delete;

    static Status open_existing(const std::string& path, std::unique_ptr<WALReader>* out);

    // Yields the next record (without its '\n'). Returns false when the log is
    // exhausted (*s OK) or a read fails (*s holds the error). Records already
    // handed out are unaffected by a later error.
    bool next(std::string* record, Status* s);

    const std::string& path() const { return path_; }
    uint64_t records_read() const { return records_; }
    bool dropped_torn_tail() const { return torn_tail_; }

private:
    WALReader(std::string path, int fd);

    // Reads another chunk into buf_. Returns bytes read, 0 at EOF, -1 on error.
    long fill(Status* s);

    std::string path_;
    int fd_ = -1;
    std::string buf_;
    size_t pos_ = 0;
    bool eof_ = false;
    bool torn_tail_ = false;
    uint64_t records_ = 0;
};

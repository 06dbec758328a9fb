#include "wal.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>
#include <utility>

namespace {
constexpr size_t kReadChunk = 64 * 1024;
}  // namespace

// ===== WAL =====

WAL::WAL(std::string path, int fd, bool sync_writes)
    : path_(std::move(path)), fd_(fd), sync_writes_(sync_writes) {}

WAL::~WAL() {
    Status s = close();
    if (!s.ok()) {
        std::cerr << "WAL: close on destruction failed: " << s.to_string() << "\n";
    }
}

Status WAL::create_new(const std::string& path, bool sync_writes, std::unique_ptr<WAL>* out) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_APPEND, 0644);
    if (fd < 0) return Status::IOError("failed to create log", path, errno);
    out->reset(new WAL(path, fd, sync_writes));
    return Status::OK();
}

bool WAL::writeAll(int fd, const void* p, size_t n) {
    const char* c = static_cast<const char*>(p);
    size_t left = n;
    while (left) {
        ssize_t w = ::write(fd, c, left);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        c += w;
        left -= w;
    }
    return true;
}

Status WAL::append(const std::string& record) {
    if (failed_) return Status::IOError("log is unusable after a failed write: " + path_);
    if (fd_ < 0) return Status::IOError("log is closed: " + path_);
    if (record.find('\n') != std::string::npos) {
        return Status::InvalidArgument("record contains a line break");
    }

    std::string line;
    line.reserve(record.size() + 1);
    line.append(record);
    line.push_back('\n');

    // Single write where possible so a concurrent reader never sees half a line.
    const char* what = "failed to write log";
    bool ok = writeAll(fd_, line.data(), line.size());
    if (ok && sync_writes_) {
        what = "failed to sync log";
        ok = (::fsync(fd_) == 0);
    }
    if (!ok) {
        int err = errno;
        // Drop whatever part of the line made it to the file.
        if (::ftruncate(fd_, static_cast<off_t>(size_)) != 0) {
            // The fragment stays; appending after it would corrupt the next line.
            std::cerr << "WAL: could not cut back partial record in " << path_
                      << "; refusing further appends\n";
            ::close(fd_);
            fd_ = -1;
            failed_ = true;
        }
        return Status::IOError(what, path_, err);
    }

    size_ += line.size();
    if (sync_writes_) synced_size_ = size_;
    ++records_;
    return Status::OK();
}

Status WAL::sync() {
    if (fd_ < 0) return Status::OK();
    if (::fsync(fd_) != 0) return Status::IOError("failed to sync log", path_, errno);
    synced_size_ = size_;
    return Status::OK();
}

Status WAL::close() {
    if (fd_ < 0) return Status::OK();
    Status s = sync();
    if (::close(fd_) != 0 && s.ok()) {
        s = Status::IOError("failed to close log", path_, errno);
    }
    fd_ = -1;
    return s;
}

// ===== WALReader =====

WALReader::WALReader(std::string path, int fd) : path_(std::move(path)), fd_(fd) {}

WALReader::~WALReader() {
    if (fd_ >= 0) ::close(fd_);
}

Status WALReader::open_existing(const std::string& path, std::unique_ptr<WALReader>* out) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return Status::IOError("failed to open log", path, errno);
    out->reset(new WALReader(path, fd));
    return Status::OK();
}

long WALReader::fill(Status* s) {
    // Compact consumed bytes before growing the buffer.
    if (pos_ > 0) {
        buf_.erase(0, pos_);
        pos_ = 0;
    }
    char chunk[kReadChunk];
    while (true) {
        ssize_t r = ::read(fd_, chunk, sizeof(chunk));
        if (r < 0) {
            if (errno == EINTR) continue;
            *s = Status::IOError("failed to read log", path_, errno);
            return -1;
        }
        if (r == 0) eof_ = true;
        buf_.append(chunk, static_cast<size_t>(r));
        return static_cast<long>(r);
    }
}

bool WALReader::next(std::string* record, Status* s) {
    *s = Status::OK();
    if (fd_ < 0) return false;

    while (true) {
        size_t nl = buf_.find('\n', pos_);
        if (nl != std::string::npos) {
            record->assign(buf_, pos_, nl - pos_);
            pos_ = nl + 1;
            ++records_;
            return true;
        }
        if (eof_) break;
        if (fill(s) < 0) return false;
    }

    // EOF: an unterminated fragment was never acknowledged by append().
    if (pos_ < buf_.size()) {
        torn_tail_ = true;
        std::cerr << "WAL: dropping " << (buf_.size() - pos_)
                  << " byte unterminated tail of " << path_ << "\n";
        pos_ = buf_.size();
    }
    return false;
}

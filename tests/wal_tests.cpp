#include "wal.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <unistd.h>

namespace fs = std::filesystem;

static void clean_dir(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    fs::create_directories(p, ec);
    (void)ec;
}

static size_t local_file_size(const fs::path& p) {
    std::error_code ec;
    auto sz = fs::file_size(p, ec);
    return ec ? 0 : static_cast<size_t>(sz);
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void truncate_bytes_from_end(const fs::path& p, size_t bytes) {
    std::error_code ec;
    auto sz = fs::file_size(p, ec);
    if (ec || sz == 0 || sz <= bytes) return;
    int fd = ::open(p.c_str(), O_RDWR);
    if (fd >= 0) {
        int rc = ::ftruncate(fd, static_cast<off_t>(sz - bytes));
        (void)rc;
        ::close(fd);
    }
}

static std::string rand_string(size_t n) {
    static thread_local std::mt19937_64 rng(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    static const char alphabet[] =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);
    std::string s; s.reserve(n);
    for (size_t i = 0; i < n; ++i) s.push_back(alphabet[dist(rng)]);
    return s;
}

static std::vector<std::string> read_all(const fs::path& p) {
    std::unique_ptr<WALReader> rdr;
    assert(WALReader::open_existing(p.string(), &rdr).ok());
    std::vector<std::string> out;
    std::string rec;
    Status s;
    while (rdr->next(&rec, &s)) out.push_back(rec);
    assert(s.ok());
    return out;
}

static void test_create_new_truncates() {
    std::cout << "[T] create_new_truncates\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    { std::ofstream(walp) << "set old stuff\n"; }
    assert(local_file_size(walp) > 0);

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), true, &wal).ok());
    assert(wal->is_open());
    assert(local_file_size(walp) == 0);  // no header
}

static void test_append_format() {
    std::cout << "[T] append_format\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), true, &wal).ok());
    assert(wal->append("set a 1").ok());
    assert(wal->append("rm a").ok());
    assert(wal->records_written() == 2);
    assert(wal->size() == local_file_size(walp));

    // durable before return: visible to an independent reader right away
    assert(slurp(walp) == "set a 1\nrm a\n");
}

static void test_append_rejects_line_break() {
    std::cout << "[T] append_rejects_line_break\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), true, &wal).ok());
    Status s = wal->append("set a 1\nset b 2");
    assert(s.is_invalid_argument());
    assert(local_file_size(walp) == 0);
}

static void test_reader_in_order() {
    std::cout << "[T] reader_in_order\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    {
        std::unique_ptr<WAL> wal;
        assert(WAL::create_new(walp.string(), true, &wal).ok());
        for (int i = 0; i < 1000; ++i) {
            assert(wal->append("set k" + std::to_string(i) + " v" + std::to_string(i)).ok());
        }
        assert(wal->close().ok());
    }

    auto recs = read_all(walp);
    assert(recs.size() == 1000);
    for (int i = 0; i < 1000; ++i) {
        assert(recs[i] == "set k" + std::to_string(i) + " v" + std::to_string(i));
    }
}

static void test_truncated_tail_tolerance() {
    std::cout << "[T] truncated_tail_tolerance\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    {
        std::unique_ptr<WAL> wal;
        assert(WAL::create_new(walp.string(), true, &wal).ok());
        for (int i = 0; i < 10; ++i) {
            assert(wal->append("set k" + std::to_string(i) + " v" + std::to_string(i)).ok());
        }
        assert(wal->append("set incomplete xxxxxxxxxxxxxxxxxxxxxxxx").ok());
    }

    // Chop off 7 bytes from end (mid-record)
    truncate_bytes_from_end(walp, 7);

    std::unique_ptr<WALReader> rdr;
    assert(WALReader::open_existing(walp.string(), &rdr).ok());
    std::string rec;
    Status s;
    size_t n = 0;
    while (rdr->next(&rec, &s)) {
        assert(rec == "set k" + std::to_string(n) + " v" + std::to_string(n));
        ++n;
    }
    assert(s.ok());
    assert(n == 10);
    assert(rdr->dropped_torn_tail());
}

static void test_reader_not_resumable() {
    std::cout << "[T] reader_not_resumable\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";
    { std::ofstream(walp) << "set a 1\n"; }

    std::unique_ptr<WALReader> rdr;
    assert(WALReader::open_existing(walp.string(), &rdr).ok());
    std::string rec;
    Status s;
    assert(rdr->next(&rec, &s) && rec == "set a 1");
    assert(!rdr->next(&rec, &s) && s.ok());
    assert(!rdr->next(&rec, &s) && s.ok());  // stays exhausted

    // a new reader starts from the top again
    assert(read_all(walp).size() == 1);
}

static void test_open_missing() {
    std::cout << "[T] open_missing\n";
    clean_dir("testdata_wal");
    std::unique_ptr<WALReader> rdr;
    Status s = WALReader::open_existing("testdata_wal/nope.log", &rdr);
    assert(s.is_io_error());
    assert(!rdr);

    std::unique_ptr<WAL> wal;
    s = WAL::create_new("testdata_wal/no/such/dir/wal.log", true, &wal);
    assert(s.is_io_error());
    assert(!wal);
}

static void test_closed_log() {
    std::cout << "[T] closed_log\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), false, &wal).ok());
    assert(wal->append("set a 1").ok());
    assert(wal->close().ok());
    assert(!wal->is_open());
    assert(wal->close().ok());  // idempotent
    assert(wal->append("set b 2").is_io_error());
    assert(slurp(walp) == "set a 1\n");
}

static void test_failed_append_cut_back() {
    std::cout << "[T] failed_append_cut_back\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), true, &wal).ok());
    assert(wal->append("set a 1").ok());

    ::signal(SIGXFSZ, SIG_IGN);
    struct rlimit saved;
    assert(::getrlimit(RLIMIT_FSIZE, &saved) == 0);
    struct rlimit lim = saved;
    lim.rlim_cur = 20;  // part of the next record fits, the rest hits EFBIG
    assert(::setrlimit(RLIMIT_FSIZE, &lim) == 0);
    Status s = wal->append("set " + std::string(100, 'k') + " " + std::string(100, 'v'));
    assert(::setrlimit(RLIMIT_FSIZE, &saved) == 0);

    assert(s.is_io_error());
    assert(slurp(walp) == "set a 1\n");
    assert(wal->size() == 8);
    assert(wal->records_written() == 1);
    // cut-back worked, so the log stays open and appends resume cleanly
    assert(!wal->failed());
    assert(wal->is_open());
    assert(wal->append("set b 2").ok());
    assert(read_all(walp) == std::vector<std::string>({"set a 1", "set b 2"}));
}

static void test_unsynced_bytes() {
    std::cout << "[T] unsynced_bytes\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::unique_ptr<WAL> wal;
    assert(WAL::create_new(walp.string(), false, &wal).ok());
    assert(wal->unsynced_bytes() == 0);
    assert(wal->append("set a 1").ok());
    assert(wal->append("rm a").ok());
    assert(wal->unsynced_bytes() == 13);
    assert(wal->sync().ok());
    assert(wal->unsynced_bytes() == 0);

    std::unique_ptr<WAL> synced;
    assert(WAL::create_new("testdata_wal/synced.log", true, &synced).ok());
    assert(synced->append("set a 1").ok());
    assert(synced->unsynced_bytes() == 0);
}

static void test_large_records() {
    std::cout << "[T] large_records\n";
    clean_dir("testdata_wal");
    const fs::path walp = "testdata_wal/wal.log";

    std::string bigK = rand_string(64 * 1024);     // 64KB key
    std::string bigV = rand_string(256 * 1024);    // 256KB value, spans read chunks

    {
        std::unique_ptr<WAL> wal;
        assert(WAL::create_new(walp.string(), true, &wal).ok());
        assert(wal->append("set " + bigK + " " + bigV).ok());
        assert(wal->append("rm " + bigK).ok());
    }

    auto recs = read_all(walp);
    assert(recs.size() == 2);
    assert(recs[0] == "set " + bigK + " " + bigV);
    assert(recs[1] == "rm " + bigK);
}

int main() {
    test_create_new_truncates();
    test_append_format();
    test_append_rejects_line_break();
    test_reader_in_order();
    test_truncated_tail_tolerance();
    test_reader_not_resumable();
    test_open_missing();
    test_closed_log();
    test_failed_append_cut_back();
    test_unsynced_bytes();
    test_large_records();

    std::error_code ec;
    fs::remove_all("testdata_wal", ec);
    std::cout << "All WAL tests passed\n";
    return 0;
}

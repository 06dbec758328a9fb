#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "command.h"
#include "store.h"

#ifndef KVS_VERSION
#define KVS_VERSION "0.0.0"
#endif

namespace {
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitNotFound = 3;

void usage(std::ostream& os) {
    os << "usage: kvs [--dir <path>] <command>\n"
       << "commands:\n"
       << "  get <key>\n"
       << "  set <key> <value>\n"
       << "  rm <key>\n"
       << "options:\n"
       << "  --dir <path>    store directory (default: current directory)\n"
       << "  -V, --version   print version\n"
       << "  -h, --help      print this help\n";
}

// Exact argument counts: anything missing or extra is a usage error.
bool parse_command(const std::vector<std::string>& args, Command* out) {
    if (args.empty()) return false;
    const std::string& name = args[0];
    if (name == "get" && args.size() == 2) {
        *out = Command::get(args[1]);
        return true;
    }
    if (name == "set" && args.size() == 3) {
        *out = Command::set(args[1], args[2]);
        return true;
    }
    if (name == "rm" && args.size() == 2) {
        *out = Command::rm(args[1]);
        return true;
    }
    return false;
}
}  // namespace

int main(int argc, char** argv) {
    std::string dir;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-V") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << "kvs " << KVS_VERSION << "\n";
            return kExitOk;
        }
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage(std::cout);
            return kExitOk;
        }
        if (std::strcmp(argv[i], "--dir") == 0) {
            if (i + 1 >= argc) {
                usage(std::cerr);
                return kExitUsage;
            }
            dir = argv[++i];
            continue;
        }
        args.emplace_back(argv[i]);
    }

    Command cmd;
    if (!parse_command(args, &cmd)) {
        usage(std::cerr);
        return kExitUsage;
    }

    if (dir.empty()) {
        std::error_code ec;
        dir = std::filesystem::current_path(ec).string();
        if (ec) {
            std::cerr << "kvs: current directory could not be determined: " << ec.message() << "\n";
            return kExitError;
        }
    }

    std::unique_ptr<Store> store;
    Status s = Store::open(dir, &store);
    if (!s.ok()) {
        std::cerr << "kvs: " << s.to_string() << "\n";
        return kExitError;
    }

    std::string result;
    s = store->execute(cmd, &result);
    if (s.is_not_found() && cmd.type == CmdType::Get) {
        std::cout << s.message() << "\n";
        return kExitNotFound;
    }
    if (!s.ok()) {
        std::cerr << "kvs: " << s.to_string() << "\n";
        return kExitError;
    }
    if (cmd.type == CmdType::Get) std::cout << result << "\n";

    s = store->close();
    if (!s.ok()) {
        std::cerr << "kvs: " << s.to_string() << "\n";
        return kExitError;
    }
    return kExitOk;
}

#include "command.h"
#include "store.h"

#include <iostream>
#include <memory>
#include <sstream>

static void help() {
    std::cout
      << "Commands:\n"
      << "  set <key> <value>\n"
      << "  get <key>\n"
      << "  rm <key>\n"
      << "  sync            # fsync the log\n"
      << "  stats           # number of keys\n"
      << "  dump            # all keys and values\n"
      << "  help\n"
      << "  exit | quit\n";
}

int main(int argc, char** argv) {
    std::string data_dir = "data";
    if (argc >= 2) data_dir = argv[1];

    std::unique_ptr<Store> db;
    Status s = Store::open(data_dir, &db);
    if (!s.ok()) {
        std::cerr << "Failed to open store: " << s.to_string() << "\n";
        return 1;
    }

    std::cout << "KV REPL ready in '" << data_dir << "' (" << db->size() << " keys). Type 'help'.\n";
    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        std::istringstream iss(line);
        std::string cmd; iss >> cmd;
        if (cmd.empty()) continue;

        if (cmd == "help") { help(); continue; }
        if (cmd == "exit" || cmd == "quit") break;
        if (cmd == "sync") { s = db->sync(); std::cout << (s.ok() ? "OK" : s.to_string()) << "\n"; continue; }
        if (cmd == "stats") { std::cout << "keys=" << db->size() << "\n"; continue; }
        if (cmd == "dump") {
            for (const auto& [k, v] : db->snapshot()) std::cout << k << " = " << v << "\n";
            continue;
        }

        // everything else goes through the record codec
        Command c;
        s = decode(line, &c);
        if (!s.ok()) { std::cout << "ERR " << s.message() << " (try 'help')\n"; continue; }

        std::string result;
        s = db->execute(c, &result);
        if (s.is_not_found()) { std::cout << "(nil)\n"; continue; }
        if (!s.ok()) { std::cout << "ERR " << s.to_string() << "\n"; continue; }
        std::cout << (c.type == CmdType::Get ? result : "OK") << "\n";
    }

    s = db->close();
    if (!s.ok()) {
        std::cerr << "close failed: " << s.to_string() << "\n";
        return 1;
    }
    return 0;
}

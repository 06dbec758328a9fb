#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "status.h"

enum class CmdType : uint8_t { Get = 1, Set = 2, Rm = 3 };

// One store operation. `value` is only meaningful for Set.
struct Command {
    CmdType type = CmdType::Get;
    std::string key;
    std::string value;

    static Command get(std::string key) { return Command{CmdType::Get, std::move(key), {}}; }
    static Command set(std::string key, std::string value) {
        return Command{CmdType::Set, std::move(key), std::move(value)};
    }
    static Command rm(std::string key) { return Command{CmdType::Rm, std::move(key), {}}; }

    bool mutates() const { return type != CmdType::Get; }

    bool operator==(const Command& o) const {
        return type == o.type && key == o.key && value == o.value;
    }
    bool operator!=(const Command& o) const { return !(*this == o); }
};

// --- Record format ---
// One command per line, single-space separated tokens:
//   get <key>
//   set <key> <value>
//   rm <key>
// Keys and values must be non-empty and contain no whitespace.
// The trailing LF is added by the WAL, not by encode().

const char* command_name(CmdType t);

std::string encode(const Command& cmd);

// Tokens past the ones a command needs are ignored.
Status decode(const std::string& line, Command* out);

// OK if `token` can be written as a key or value and read back unchanged.
Status check_token(const std::string& what, const std::string& token);

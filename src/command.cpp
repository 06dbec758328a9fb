#include "command.h"

#include <sstream>
#include <vector>

namespace {
bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}
}  // namespace

const char* command_name(CmdType t) {
    switch (t) {
        case CmdType::Get: return "get";
        case CmdType::Set: return "set";
        case CmdType::Rm: return "rm";
    }
    return "?";
}

std::string encode(const Command& cmd) {
    std::string out = command_name(cmd.type);
    out.push_back(' ');
    out.append(cmd.key);
    if (cmd.type == CmdType::Set) {
        out.push_back(' ');
        out.append(cmd.value);
    }
    return out;
}

Status decode(const std::string& line, Command* out) {
    std::istringstream iss(line);
    std::vector<std::string> tok;
    std::string t;
    while (tok.size() < 3 && iss >> t) tok.push_back(std::move(t));

    if (tok.empty()) return Status::InvalidArgument("missing command", Status::Sub::MissingCommand);

    Command cmd{};
    if (tok[0] == "get") {
        cmd.type = CmdType::Get;
    } else if (tok[0] == "set") {
        cmd.type = CmdType::Set;
    } else if (tok[0] == "rm") {
        cmd.type = CmdType::Rm;
    } else {
        return Status::InvalidArgument("invalid command: " + tok[0], Status::Sub::InvalidCommand);
    }

    if (tok.size() < 2) {
        return Status::InvalidArgument(std::string("missing key for ") + tok[0], Status::Sub::MissingKey);
    }
    cmd.key = tok[1];

    if (cmd.type == CmdType::Set) {
        if (tok.size() < 3) {
            return Status::InvalidArgument("missing value for set " + cmd.key, Status::Sub::MissingValue);
        }
        cmd.value = tok[2];
    }

    *out = std::move(cmd);
    return Status::OK();
}

Status check_token(const std::string& what, const std::string& token) {
    if (token.empty()) return Status::InvalidArgument(what + " is empty");
    for (char c : token) {
        if (is_space(c)) return Status::InvalidArgument(what + " contains whitespace: '" + token + "'");
    }
    return Status::OK();
}

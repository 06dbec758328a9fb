#include "status.h"

#include <cstring>

Status Status::IOError(const std::string& what, const std::string& path, int err) {
    std::string msg = what + " '" + path + "'";
    if (err != 0) {
        msg += ": ";
        msg += std::strerror(err);
    }
    return Status(Code::IOError, msg);
}

Status Status::Recovery(const Status& cause) {
    Status s(Code::Recovery, cause.to_string());
    s.cause_ = cause.is_recovery() ? cause.cause_ : cause.code_;
    s.sub_ = cause.sub_;
    return s;
}

const char* code_name(Status::Code code) {
    switch (code) {
        case Status::Code::Ok: return "OK";
        case Status::Code::NotFound: return "NotFound";
        case Status::Code::InvalidArgument: return "InvalidArgument";
        case Status::Code::IOError: return "IOError";
        case Status::Code::Recovery: return "Recovery";
    }
    return "Unknown";
}

const char* sub_name(Status::Sub sub) {
    switch (sub) {
        case Status::Sub::None: return "None";
        case Status::Sub::MissingCommand: return "MissingCommand";
        case Status::Sub::InvalidCommand: return "InvalidCommand";
        case Status::Sub::MissingKey: return "MissingKey";
        case Status::Sub::MissingValue: return "MissingValue";
        case Status::Sub::InvalidLogFileName: return "InvalidLogFileName";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (ok()) return "OK";
    std::string out = code_name(code_);
    out += ": ";
    out += msg_;
    return out;
}

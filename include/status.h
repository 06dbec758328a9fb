#pragma once
#include <string>
#include <utility>

// Result of every store operation. The code tells callers which error kind
// they got; the message is for humans.
class Status {
public:
    enum class Code { Ok = 0, NotFound, InvalidArgument, IOError, Recovery };

    // Which validation failed, for InvalidArgument (and Recovery wrapping one).
    enum class Sub {
        None = 0,
        MissingCommand,
        InvalidCommand,
        MissingKey,
        MissingValue,
        InvalidLogFileName,
    };

    Status() = default;

    static Status OK() { return Status(); }
    static Status NotFound(const std::string& msg) { return Status(Code::NotFound, msg); }
    // Malformed record or argument the codec cannot represent.
    static Status InvalidArgument(const std::string& msg, Sub sub = Sub::None) {
        Status s(Code::InvalidArgument, msg);
        s.sub_ = sub;
        return s;
    }
    static Status IOError(const std::string& msg) { return Status(Code::IOError, msg); }
    static Status IOError(const std::string& what, const std::string& path, int err);
    // Wraps the failure that aborted a replay; the wrapped kind stays visible via cause().
    static Status Recovery(const Status& cause);
    static Status Recovery(const std::string& msg) { return Status(Code::Recovery, msg); }

    bool ok() const { return code_ == Code::Ok; }
    bool is_not_found() const { return code_ == Code::NotFound; }
    bool is_invalid_argument() const { return code_ == Code::InvalidArgument; }
    bool is_io_error() const { return code_ == Code::IOError; }
    bool is_recovery() const { return code_ == Code::Recovery; }

    Code code() const { return code_; }
    Code cause() const { return cause_; }
    Sub subcode() const { return sub_; }
    const std::string& message() const { return msg_; }

    std::string to_string() const;

private:
    Status(Code code, std::string msg) : code_(code), cause_(code), msg_(std::move(msg)) {}

    Code code_ = Code::Ok;
    Code cause_ = Code::Ok;
    Sub sub_ = Sub::None;
    std::string msg_;
};

const char* code_name(Status::Code code);
const char* sub_name(Status::Sub sub);

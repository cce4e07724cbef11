#pragma once
// Error taxonomy shared by every core component
//
// Failures travel as values: Status for operations without a result,
// Result<T> for operations that produce one. Nothing throws across the
// Engine boundary.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kosha {

enum class ErrorKind : uint8_t {
    Validation = 0,          // Bad dimension, bad k, empty id, non-finite values
    NotFound = 1,            // Unknown id on delete/get
    ConsistencyGap = 2,      // Index referenced an id the store no longer has
    ResourceExhaustion = 3,  // Index slot arena is full
    DependencyFailure = 4,   // Embedder unavailable
    Io = 5,                  // Persistence failure
    Internal = 6,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::ConsistencyGap: return "consistency_gap";
        case ErrorKind::ResourceExhaustion: return "resource_exhaustion";
        case ErrorKind::DependencyFailure: return "dependency_failure";
        case ErrorKind::Io: return "io";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + message;
    }
};

class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }

    static Status fail(ErrorKind kind, std::string message) {
        Status s;
        s.error_ = Error{kind, std::move(message)};
        return s;
    }

    static Status fail(Error error) {
        Status s;
        s.error_ = std::move(error);
        return s;
    }

    bool is_ok() const { return !error_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const Error& error() const { return error_.value(); }
    ErrorKind kind() const { return error_ ? error_->kind : ErrorKind::Internal; }

private:
    std::optional<Error> error_;
};

template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result fail(ErrorKind kind, std::string message) {
        Result r;
        r.error_ = Error{kind, std::move(message)};
        return r;
    }

    static Result fail(Error error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const T& value() const { return value_.value(); }
    T& value() { return value_.value(); }
    T take() { return std::move(value_.value()); }

    const Error& error() const { return error_.value(); }
    ErrorKind kind() const { return error_ ? error_->kind : ErrorKind::Internal; }

    Status status() const {
        return error_ ? Status::fail(*error_) : Status::ok();
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<Error> error_;
};

} // namespace kosha

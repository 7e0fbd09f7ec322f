// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <variant>

namespace hostscope {

/**
 * Closed error taxonomy.
 *
 * The numeric values are part of the envelope wire format ("error.code") and
 * must stay stable.
 */
enum class ErrorCode : int {
    MemoryAllocationFailure = 0,
    InvalidArguments = 1,
    VmiOpFailure = 2,
    ToolNotAvailable = 1000,
    ExecutionFailure = 1001,
    IoFailure = 1002,
};

inline const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::MemoryAllocationFailure:
            return "MEMORY_ALLOCATION_FAILURE";
        case ErrorCode::InvalidArguments:
            return "INVALID_ARGUMENTS";
        case ErrorCode::VmiOpFailure:
            return "VMI_OP_FAILURE";
        case ErrorCode::ToolNotAvailable:
            return "TOOL_NOT_AVAILABLE";
        case ErrorCode::ExecutionFailure:
            return "EXECUTION_FAILURE";
        case ErrorCode::IoFailure:
            return "IO_FAILURE";
    }
    return "EXECUTION_FAILURE";
}

class Error {
  public:
    Error(ErrorCode code, std::string message, std::string context = {})
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    // Map an errno value onto the taxonomy. Missing or forbidden resources are
    // I/O conditions; anything else is an execution failure.
    static Error system(int errnum, const std::string& message, const std::string& context = {})
    {
        ErrorCode code = ErrorCode::ExecutionFailure;
        switch (errnum) {
            case EACCES:
            case EPERM:
            case ENOENT:
            case ENOTDIR:
            case EROFS:
            case EIO:
                code = ErrorCode::IoFailure;
                break;
            case ENOMEM:
                code = ErrorCode::MemoryAllocationFailure;
                break;
            default:
                break;
        }
        std::string detail = std::strerror(errnum);
        if (!context.empty()) {
            detail = context + ": " + detail;
        }
        return Error(code, message, detail);
    }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    [[nodiscard]] std::string to_string() const
    {
        if (context_.empty()) {
            return message_;
        }
        return message_ + ": " + context_;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

template <typename T>
class Result {
  public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T* operator->() { return &std::get<T>(data_); }
    const T* operator->() const { return &std::get<T>(data_); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    T value_or(T fallback) const
    {
        if (ok()) {
            return std::get<T>(data_);
        }
        return fallback;
    }

  private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
  public:
    Result() = default;
    Result(Error error) : error_(std::move(error)), has_error_(true) {}

    [[nodiscard]] bool ok() const { return !has_error_; }
    [[nodiscard]] explicit operator bool() const { return ok(); }

    [[nodiscard]] const Error& error() const { return error_; }

  private:
    Error error_{ErrorCode::ExecutionFailure, ""};
    bool has_error_ = false;
};

#define HOSTSCOPE_TRY_CONCAT_INNER(a, b) a##b
#define HOSTSCOPE_TRY_CONCAT(a, b) HOSTSCOPE_TRY_CONCAT_INNER(a, b)

// Propagate the error of a Result-returning expression to the caller.
#define TRY(expr)                                                                 \
    do {                                                                          \
        auto HOSTSCOPE_TRY_CONCAT(_try_result_, __LINE__) = (expr);               \
        if (!HOSTSCOPE_TRY_CONCAT(_try_result_, __LINE__)) {                      \
            return HOSTSCOPE_TRY_CONCAT(_try_result_, __LINE__).error();          \
        }                                                                         \
    } while (0)

} // namespace hostscope

#pragma once

#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace taskprobe {
namespace core {

/**
 * Error codes for result<T>.
 *
 * Everything except invalid_argument, empty_log and unsupported is a
 * transport-level failure from the point of view of the test runner;
 * `exception` wraps a std::exception thrown out of an action.
 */
enum class error_code : int {
    success = 0,
    invalid_state = 1,
    invalid_argument = 2,
    connect_failed = 3,
    timeout = 4,
    send_failed = 5,
    recv_failed = 6,
    connection_closed = 7,
    parse_error = 8,
    decode_error = 9,
    empty_log = 10,
    unsupported = 11,
    exception = 12
};

/**
 * Short name of an error code ("timeout", "parse_error", ...).
 */
const char* error_code_name(error_code code) noexcept;

/**
 * Exception-free result type.
 *
 * Either contains a value T or an error code with a human-readable message.
 * The message is what ends up in a report, so it should read on its own
 * ("Connection refused (localhost:8080)", not "errno 111").
 *
 * Usage:
 *   result<int> get_status() {
 *       if (failed) return {error_code::timeout, "Timed out after 5000ms"};
 *       return 200;
 *   }
 *
 *   auto r = get_status();
 *   if (r.is_ok()) {
 *       int status = r.value();
 *   } else {
 *       log(r.message());
 *   }
 */
template<typename T>
class result {
public:
    /**
     * Default constructor creates an error result.
     */
    result() noexcept
        : has_value_(false), error_(error_code::invalid_state) {}

    /**
     * Construct from value (success case).
     */
    result(const T& val) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(val);
    }

    result(T&& val) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(true) {
        new (value_storage_) T(std::move(val));
    }

    /**
     * Construct from error code (error case).
     */
    result(error_code err) noexcept
        : has_value_(false), error_(err) {}

    result(error_code err, std::string message) noexcept
        : has_value_(false), error_(err), message_(std::move(message)) {}

    result(const result& other)
        : has_value_(other.has_value_), error_(other.error_), message_(other.message_) {
        if (has_value_) {
            new (value_storage_) T(other.value());
        }
    }

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : has_value_(other.has_value_), error_(other.error_), message_(std::move(other.message_)) {
        if (has_value_) {
            new (value_storage_) T(std::move(other.value()));
        }
    }

    result& operator=(const result& other) {
        if (this != &other) {
            result copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    result& operator=(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            reset();
            has_value_ = other.has_value_;
            error_ = other.error_;
            message_ = std::move(other.message_);
            if (has_value_) {
                new (value_storage_) T(std::move(other.value()));
            }
        }
        return *this;
    }

    ~result() {
        reset();
    }

    bool is_ok() const noexcept { return has_value_; }
    bool is_err() const noexcept { return !has_value_; }

    /**
     * Get the value (undefined behavior if is_err()).
     */
    T& value() & noexcept {
        return *std::launder(reinterpret_cast<T*>(value_storage_));
    }

    const T& value() const& noexcept {
        return *std::launder(reinterpret_cast<const T*>(value_storage_));
    }

    T&& value() && noexcept {
        return std::move(*std::launder(reinterpret_cast<T*>(value_storage_)));
    }

    /**
     * Get the error code (success if is_ok()).
     */
    error_code error() const noexcept {
        return has_value_ ? error_code::success : error_;
    }

    /**
     * Error description. Falls back to the code name when no message was given.
     */
    std::string message() const {
        if (has_value_) {
            return {};
        }
        return message_.empty() ? std::string(error_code_name(error_)) : message_;
    }

    T value_or(T default_value) const& {
        return has_value_ ? value() : std::move(default_value);
    }

    explicit operator bool() const noexcept { return has_value_; }

private:
    void reset() noexcept {
        if (has_value_) {
            value().~T();
            has_value_ = false;
        }
    }

    alignas(T) unsigned char value_storage_[sizeof(T)];
    bool has_value_;
    error_code error_{error_code::success};
    std::string message_;
};

/**
 * Specialization for void (only indicates success/error).
 */
template<>
class result<void> {
public:
    result() noexcept : error_(error_code::success) {}
    result(error_code err) noexcept : error_(err) {}
    result(error_code err, std::string message) noexcept
        : error_(err), message_(std::move(message)) {}

    bool is_ok() const noexcept { return error_ == error_code::success; }
    bool is_err() const noexcept { return error_ != error_code::success; }
    error_code error() const noexcept { return error_; }

    std::string message() const {
        if (is_ok()) {
            return {};
        }
        return message_.empty() ? std::string(error_code_name(error_)) : message_;
    }

    explicit operator bool() const noexcept { return is_ok(); }

private:
    error_code error_;
    std::string message_;
};

template<typename T>
result<T> ok(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
    return result<T>(std::move(value));
}

inline result<void> ok() noexcept {
    return result<void>();
}

template<typename T>
result<T> err(error_code code, std::string message = {}) noexcept {
    return result<T>(code, std::move(message));
}

inline result<void> err(error_code code, std::string message = {}) noexcept {
    return result<void>(code, std::move(message));
}

inline const char* error_code_name(error_code code) noexcept {
    switch (code) {
        case error_code::success:           return "success";
        case error_code::invalid_state:     return "invalid_state";
        case error_code::invalid_argument:  return "invalid_argument";
        case error_code::connect_failed:    return "connect_failed";
        case error_code::timeout:           return "timeout";
        case error_code::send_failed:       return "send_failed";
        case error_code::recv_failed:       return "recv_failed";
        case error_code::connection_closed: return "connection_closed";
        case error_code::parse_error:       return "parse_error";
        case error_code::decode_error:      return "decode_error";
        case error_code::empty_log:         return "empty_log";
        case error_code::unsupported:       return "unsupported";
        case error_code::exception:         return "exception";
    }
    return "unknown";
}

} // namespace core
} // namespace taskprobe

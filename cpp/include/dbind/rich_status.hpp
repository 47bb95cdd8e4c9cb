#ifndef __DBIND_RICH_STATUS_HPP
#define __DBIND_RICH_STATUS_HPP

#include <dbind/config.hpp>
#include <dbind/status.hpp>

#include <stdlib.h>
#include <array>
#include <optional>
#include <string>

#if DBIND_ENABLE_TEXT_LOGGING
#include <iostream>
#include <sstream>
#endif

namespace dbind {

#if DBIND_ENABLE_TEXT_LOGGING
using logstr = std::string;
#else
struct logstr {};
#endif

/**
 * @brief Error object returned by all fallible operations.
 *
 * A RichStatus carries a status code, an optional D-Bus error name and a
 * small stack of (message, file, line) frames. Each layer that propagates
 * the error can amend it with its own frame.
 */
struct [[nodiscard]] RichStatus {
    RichStatus() : n_msgs(0) {}

    template<typename TFunc>
    RichStatus(TFunc msg_gen, const char* file, size_t line, const RichStatus& inner)
        : msgs_(inner.msgs_), n_msgs(inner.n_msgs),
          code_(inner.is_error() ? inner.code_ : Status::kFailed),
          error_name_(inner.error_name_) {
        logstr msg;
#if DBIND_ENABLE_TEXT_LOGGING
        std::ostringstream stream;
        msg_gen(stream);
        msg = stream.str();
#endif
        if (n_msgs < msgs_.size()) {
            msgs_[n_msgs++] = {msg, file, line};
        } else {
            // Keep the innermost frames and the outermost one.
            msgs_[msgs_.size() - 1] = {msg, file, line};
        }
    }

    struct StackFrame {
        logstr msg;
        const char* file;
        size_t line;
    };

    std::array<StackFrame, DBIND_MAX_STATUS_FRAMES> msgs_;
    size_t n_msgs;

    bool is_error() const {
        return n_msgs > 0;
    }

    bool is_success() const {
        return !is_error();
    }

    template<typename TFunc>
    bool on_error(TFunc func) {
        if (is_error()) {
            func();
        }
        return is_error();
    }

    Status code() const { return is_error() ? code_ : Status::kOk; }

    /**
     * @brief D-Bus error name associated with this error (e.g.
     * "org.freedesktop.DBus.Error.UnknownMethod"). Empty if none was set.
     */
    const std::string& error_name() const { return error_name_; }

    /** @brief Innermost (original) error message, empty on success. */
    std::string message() const {
#if DBIND_ENABLE_TEXT_LOGGING
        return n_msgs ? msgs_[0].msg : std::string{};
#else
        return {};
#endif
    }

    RichStatus with_code(Status code) const {
        RichStatus result = *this;
        result.code_ = code;
        return result;
    }

    RichStatus with_error_name(std::string name) const {
        RichStatus result = *this;
        result.error_name_ = std::move(name);
        return result;
    }

    const char* inner_file() const { return n_msgs ? msgs_[0].file : nullptr; }
    size_t inner_line() const { return n_msgs ? msgs_[0].line : 0; }

    static RichStatus success() {
        return {};
    }

private:
    Status code_ = Status::kOk;
    std::string error_name_;
};


#if DBIND_ENABLE_TEXT_LOGGING

static inline std::ostream& operator<<(std::ostream& stream, RichStatus const& status) {
    if (status.is_success()) {
        return stream << "success";
    }
    stream << status_to_string(status.code());
    if (!status.error_name().empty()) {
        stream << " (" << status.error_name() << ")";
    }
    for (size_t i = 0; i < status.n_msgs; ++i) {
        stream << "\n\t\tin " << status.msgs_[i].file << ":" << status.msgs_[i].line << ": " << status.msgs_[i].msg;
    }
    return stream;
}

#endif

template<typename T>
class RichStatusOr {
public:
    RichStatusOr(T val) : status_{RichStatus::success()}, val_{std::move(val)} {}
    RichStatusOr(RichStatus status) : status_{status}, val_{std::nullopt} {}

    RichStatus status() const { return status_; }
    T& value() { return *val_; }
    const T& value() const { return *val_; }
    bool has_value() const { return val_.has_value(); }

private:
    RichStatus status_;
    std::optional<T> val_;
};

}


#if DBIND_ENABLE_TEXT_LOGGING

#define D_MAKE_ERR(msg) dbind::RichStatus{[&](std::ostream& str) { str << msg; }, __FILE__, __LINE__, dbind::RichStatus::success()}
#define D_AMEND_ERR(inner, msg) dbind::RichStatus{[&](std::ostream& str) { str << msg; }, __FILE__, __LINE__, (inner)}

#else

#define D_MAKE_ERR(msg) dbind::RichStatus{[](int) {}, __FILE__, __LINE__, dbind::RichStatus::success()}
#define D_AMEND_ERR(inner, msg) dbind::RichStatus{[](int) {}, __FILE__, __LINE__, (inner)}

#endif

/**
 * @brief Creates an error with the given status code.
 */
#define D_MAKE_ERR_CODE(code, msg) (D_MAKE_ERR(msg).with_code(code))

/**
 * @brief Returns an error object from the current function if `expr` evaluates
 * to true.
 *
 * The containing function must have a return type that is assignable from
 * RichStatus.
 *
 * If `DBIND_ENABLE_TEXT_LOGGING` is non-zero, `msg` is evaluated and attached
 * to the error object.
 */
#define D_RET_IF(expr, msg) \
    do { \
        bool __err = (expr); \
        if (__err) \
            return D_MAKE_ERR(msg); \
    } while (0)

/**
 * @brief Same as D_RET_IF() but tags the error with a status code.
 */
#define D_RET_IF_CODE(expr, code, msg) \
    do { \
        bool __err = (expr); \
        if (__err) \
            return D_MAKE_ERR_CODE(code, msg); \
    } while (0)

/**
 * @brief Returns an error object from the current function if `status` is an
 * error.
 *
 * The containing function must have a return type that is assignable from
 * RichStatus. The status code of the inner error is preserved.
 */
#define D_RET_IF_ERR(status, msg) \
    do { \
        dbind::RichStatus __status = (status); \
        if (__status.is_error()) \
            return D_AMEND_ERR(__status, msg); \
    } while (0)

#endif // __DBIND_RICH_STATUS_HPP

#ifndef __DBIND_LOGGING_HPP
#define __DBIND_LOGGING_HPP

#include <dbind/config.hpp>

#include <dbind/callback.hpp>
#include <stdint.h>
#include <stdlib.h>

#if DBIND_ENABLE_TEXT_LOGGING
#include <sstream>
#include <iostream>
#include <string.h>
#include <errno.h>
#endif

namespace dbind {

enum class LogLevel : int {
    kError = 1,
    kWarning = 2,
    kDebug = 4,
    kTrace = 5,
};

/**
 * @brief Log function callback type
 *
 * @param ctx: An opaque user defined context pointer.
 * @param file: The file name of the call site. Valid until the program terminates.
 * @param line: The line number of the call site.
 * @param level: The LogLevel of the message, cast to int.
 * @param info0: A general purpose information parameter. The meaning of this depends on the call site.
 * @param info1: A general purpose information parameter. The meaning of this depends on the call site.
 * @param text: Text to log. Valid only for the duration of the log call. Always
 *        Null if dbind is compiled with DBIND_ENABLE_TEXT_LOGGING=0.
 */
typedef Callback<void, const char* /* file */, unsigned /* line */, int /* level */, uintptr_t /* info0 */, uintptr_t /* info1 */, const char* /* text */> log_fn_t;

class Logger {
public:
    Logger(log_fn_t impl, LogLevel verbosity)
        : impl_{impl}, verbosity_{verbosity} {}

    template<typename TFunc>
    void log(const char* file, unsigned line, int level, uintptr_t info0, uintptr_t info1, TFunc text_gen) const {
        if (level <= (int)verbosity_ && level <= DBIND_MAX_LOG_VERBOSITY) {
            const char* c_str = nullptr;
#if DBIND_ENABLE_TEXT_LOGGING
            std::ostringstream stream;
            text_gen(stream);
            std::string str = stream.str();
            c_str = str.c_str();
#endif
            impl_.invoke(file, line, level, info0, info1, c_str);
        }
    }

    LogLevel verbosity() const { return verbosity_; }

    static Logger none() {
        return {
            {[](void*, const char*, unsigned, int, uintptr_t, uintptr_t, const char*){}, nullptr},
            (LogLevel)-1
        };
    }

private:
    log_fn_t impl_;
    LogLevel verbosity_;
};

/**
 * @brief Returns the log verbosity as configured by the environment variable
 * `DBIND_LOG`.
 *
 * If the variable is not set this returns LogLevel::kError.
 */
static inline LogLevel get_log_verbosity() {
    const char * var_val = std::getenv("DBIND_LOG");
    if (var_val) {
        unsigned long num = strtoul(var_val, nullptr, 10);
        return (LogLevel)num;
    } else {
        return LogLevel::kError;
    }
}

/**
 * @brief Log sink that writes to stderr. Can be passed to Logger as
 * `{log_to_stderr, nullptr}`.
 */
void log_to_stderr(void* ctx, const char* file, unsigned line, int level, uintptr_t info0, uintptr_t info1, const char* text);

}

/**
 * @brief Tag type to print the last system error
 *
 * The statement `std::out << sys_err();` will print the last system error
 * in the following format: "error description (errno)".
 */
struct sys_err {};

#if DBIND_ENABLE_TEXT_LOGGING

namespace std {
static inline std::ostream& operator<<(std::ostream& stream, const sys_err&) {
    auto error_code = errno;
    return stream << strerror(error_code) << " (" << error_code << ")";
}
}

#endif

namespace dbind {

template<typename T, typename TFunc>
const T& with(const T& val, TFunc func) {
    func(val);
    return val;
}

}

#if DBIND_ENABLE_TEXT_LOGGING
#define STR_BUILDER(msg) ([&](std::ostream& str) { str << msg; })
#else
#define STR_BUILDER(msg) ([](int) {})
#endif

#define D_LOG_IF(logger, expr, msg) \
    dbind::with((bool)(expr), [&](bool __expr) { \
        if (__expr) (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kError, 0, 0, STR_BUILDER(msg)); \
    })

#define D_LOG_IF_ERR(logger, status, msg) \
    dbind::with((status), [&](const dbind::RichStatus& __status) { \
        if (__status.is_error()) (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kError, (uintptr_t)__status.inner_file(), __status.inner_line(), STR_BUILDER(msg << ": " << __status)); \
    }).is_error()

#define D_LOG_T(logger, msg) \
    (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kTrace, 0, 0, STR_BUILDER(msg))

#define D_LOG_D(logger, msg) \
    (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kDebug, 0, 0, STR_BUILDER(msg))

#define D_LOG_W(logger, msg) \
    (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kWarning, 0, 0, STR_BUILDER(msg))

#define D_LOG_E(logger, msg) \
    (logger).log(__FILE__, __LINE__, (int)dbind::LogLevel::kError, 0, 0, STR_BUILDER(msg))

#endif // __DBIND_LOGGING_HPP

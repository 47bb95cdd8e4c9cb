#ifndef __DBIND_STATUS_HPP
#define __DBIND_STATUS_HPP

namespace dbind {

enum class Status {
    kOk,
    kDeclarationError, //!< An interface declaration is malformed or violates the override rules
    kArgumentError, //!< A call could not be matched to the method's parameter list
    kNoSetter, //!< Attempt to write a property that has no setter
    kRemoteError, //!< The remote peer replied with a D-Bus error
    kInvalidState, //!< The object is in the wrong binding state for the operation
    kInvalidArgument, //!< A value does not match the D-Bus signature it is used with
    kBusError, //!< libdbus reported a failure (out of memory, disconnected, ...)
    kFailed, //!< Unspecified failure, e.g. reported by an application callback
};

static inline const char* status_to_string(Status status) {
    switch (status) {
        case Status::kOk: return "ok";
        case Status::kDeclarationError: return "declaration error";
        case Status::kArgumentError: return "argument error";
        case Status::kNoSetter: return "no setter";
        case Status::kRemoteError: return "remote error";
        case Status::kInvalidState: return "invalid state";
        case Status::kInvalidArgument: return "invalid argument";
        case Status::kBusError: return "bus error";
        case Status::kFailed: return "failed";
    }
    return "unknown";
}

}

#endif // __DBIND_STATUS_HPP

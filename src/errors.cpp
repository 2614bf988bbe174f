#include "minhypr/errors.hpp"

namespace minhypr {

    std::string_view error_kind_name(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::kNoActiveWindow: return "no active window";
            case ErrorKind::kAlreadyMinimized: return "already minimized";
            case ErrorKind::kNotFound: return "not found";
            case ErrorKind::kEmptySet: return "no minimized windows";
            case ErrorKind::kCorruptState: return "corrupt state";
            case ErrorKind::kAdapterFailure: return "adapter failure";
            case ErrorKind::kLockTimeout: return "lock timeout";
            case ErrorKind::kInvalidArgument: return "invalid argument";
            case ErrorKind::kIo: return "io error";
        }
        return "error";
    }

    std::string format_error(const Error& error) {
        std::string text(error_kind_name(error.kind));
        if (!error.message.empty()) {
            text.append(": ");
            text.append(error.message);
        }
        return text;
    }

    bool is_benign(ErrorKind kind) {
        return kind == ErrorKind::kAlreadyMinimized;
    }

} // namespace minhypr

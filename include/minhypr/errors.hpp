#ifndef MINHYPR_ERRORS_HPP
#define MINHYPR_ERRORS_HPP

#include <expected>
#include <string>
#include <string_view>

namespace minhypr {

    enum class ErrorKind {
        kNoActiveWindow,
        kAlreadyMinimized,
        kNotFound,
        kEmptySet,
        kCorruptState,
        kAdapterFailure,
        kLockTimeout,
        kInvalidArgument,
        kIo,
    };

    struct Error {
        ErrorKind   kind;
        std::string message;
    };

    template <typename T>
    using Result = std::expected<T, Error>;

    inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
        return std::unexpected(Error{.kind = kind, .message = std::move(message)});
    }

    std::string_view error_kind_name(ErrorKind kind);
    std::string      format_error(const Error& error);

    // AlreadyMinimized is reported but not treated as a failure by the command line.
    bool             is_benign(ErrorKind kind);

} // namespace minhypr

#endif // MINHYPR_ERRORS_HPP

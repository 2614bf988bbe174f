#ifndef MINHYPR_FAILSAFE_HPP
#define MINHYPR_FAILSAFE_HPP

#include <exception>
#include <string_view>
#include <utility>

namespace minhypr::failsafe {

    namespace detail {

        template <typename OnError>
        void report(OnError& on_error, std::string_view context, std::string_view message) noexcept {
            try {
                on_error(context, message);
            } catch (...) {}
        }

    } // namespace detail

    // Runs fn() and returns its exit code. An exception escaping fn is handed to
    // on_error and the invocation exits with `failure_code` instead.
    template <typename F, typename OnError>
    int run(F&& fn, OnError&& on_error, std::string_view context, int failure_code = 1) noexcept {
        try {
            return std::forward<F>(fn)();
        } catch (const std::exception& ex) {
            detail::report(on_error, context, ex.what());
        } catch (...) {
            detail::report(on_error, context, "unknown exception");
        }
        return failure_code;
    }

} // namespace minhypr::failsafe

#endif // MINHYPR_FAILSAFE_HPP

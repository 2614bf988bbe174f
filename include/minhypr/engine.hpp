#ifndef MINHYPR_ENGINE_HPP
#define MINHYPR_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "minhypr/capture.hpp"
#include "minhypr/compositor.hpp"
#include "minhypr/config.hpp"
#include "minhypr/errors.hpp"
#include "minhypr/minimized_set.hpp"
#include "minhypr/state_store.hpp"

namespace minhypr {

    struct RestoreFailure {
        WindowId id;
        Error    error;
    };

    struct RestoreAllReport {
        std::vector<MinimizedWindow> restored;
        std::vector<RestoreFailure>  failures;

        bool                         ok() const {
            return failures.empty();
        }
    };

    struct ReapReport {
        std::vector<MinimizedWindow> removed;
        std::vector<WindowId>        adopted;

        bool                         changed() const {
            return !removed.empty() || !adopted.empty();
        }
    };

    // Parses "42" as an id; anything starting with 0x is treated as an address.
    struct RestoreTargetArg {
        std::optional<WindowId>    id;
        std::optional<std::string> address;
    };
    std::optional<RestoreTargetArg> parse_restore_argument(std::string_view value);

    class MinimizeEngine {
      public:
        using Clock = std::function<std::int64_t()>;

        // `capturer` may be null when thumbnails are disabled.
        MinimizeEngine(const StateStore& store, Compositor& compositor, Capturer* capturer, Config config, Clock clock = unix_time_ms);

        Result<MinimizedWindow>  minimize(const std::optional<std::string>& address = std::nullopt);
        Result<MinimizedWindow>  restore(WindowId id);
        Result<MinimizedWindow>  restore_address(std::string_view address);
        Result<MinimizedWindow>  restore_last();
        Result<RestoreAllReport> restore_all();
        Result<ReapReport>       reap_stale();
        // Reaped snapshot for listings and the picker.
        Result<MinimizedSet>     list();

      private:
        Result<ReapReport>      reap_locked(MinimizedSet& set, std::vector<ClientInfo>* clients_out);
        Result<MinimizedWindow> restore_locked(MinimizedSet& set, WindowId id);
        Result<std::string>     restore_destination(const MinimizedWindow& window);
        bool                    excluded(const ClientInfo& client) const;

        const StateStore& store_;
        Compositor&       compositor_;
        Capturer*         capturer_;
        Config            config_;
        Clock             clock_;
        std::string       special_name_;
    };

} // namespace minhypr

#endif // MINHYPR_ENGINE_HPP

#ifndef MINHYPR_STATE_STORE_HPP
#define MINHYPR_STATE_STORE_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "minhypr/errors.hpp"
#include "minhypr/file_descriptor.hpp"
#include "minhypr/minimized_set.hpp"

namespace minhypr {

    inline constexpr int kStoreVersion = 1;

    std::int64_t         unix_time_ms();

    std::string          render_store_json(const MinimizedSet& set);
    // kCorruptState for anything that is not a well-formed store of a known version.
    Result<MinimizedSet> parse_store_json(std::string_view text);

    // Exclusive flock(2) on the lock file, released when the object dies.
    class FileLock {
      public:
        static Result<FileLock> acquire(const std::filesystem::path& path, std::chrono::milliseconds timeout, const std::filesystem::path& proc_root);

        FileLock(FileLock&&) noexcept            = default;
        FileLock& operator=(FileLock&&) noexcept = default;

      private:
        explicit FileLock(FileDescriptor fd);

        FileDescriptor fd_;
    };

    struct StoreOptions {
        std::filesystem::path       store_path;
        std::filesystem::path       lock_path;
        std::chrono::milliseconds   lock_timeout{3000};
        std::filesystem::path       proc_root = "/proc";
        std::function<std::int64_t()> clock   = unix_time_ms;
    };

    class StateStore {
      public:
        explicit StateStore(StoreOptions options);

        // Missing file is an empty set.
        Result<MinimizedSet> load() const;
        Result<void>         save(const MinimizedSet& set) const;
        // Lock-free read for status output.
        Result<MinimizedSet> peek() const;
        // Like load(), but a corrupt file is moved aside and an empty set returned.
        Result<MinimizedSet> load_or_recover() const;

        // Runs fn(MinimizedSet&) -> Result<T> under the lock and persists the set if fn changed it.
        template <typename Fn>
        auto with_lock(Fn&& fn) const -> std::invoke_result_t<Fn&, MinimizedSet&> {
            auto lock = FileLock::acquire(options_.lock_path, options_.lock_timeout, options_.proc_root);
            if (!lock) {
                return std::unexpected(lock.error());
            }
            auto set = load_or_recover();
            if (!set) {
                return std::unexpected(set.error());
            }
            const auto revision = set->revision();
            auto       result   = fn(*set);
            if (set->revision() != revision) {
                if (auto saved = save(*set); !saved) {
                    return std::unexpected(saved.error());
                }
            }
            return result;
        }

        const StoreOptions& options() const {
            return options_;
        }

      private:
        StoreOptions options_;
    };

} // namespace minhypr

#endif // MINHYPR_STATE_STORE_HPP

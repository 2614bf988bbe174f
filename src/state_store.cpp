#include "minhypr/state_store.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iterator>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "minhypr/json_utils.hpp"
#include "minhypr/logging.hpp"
#include "minhypr/process_utils.hpp"
#include "minhypr/strings.hpp"

namespace minhypr {

    namespace {

        constexpr std::chrono::milliseconds kLockPollInterval{20};

        Error corrupt(std::string message) {
            return Error{.kind = ErrorKind::kCorruptState, .message = std::move(message)};
        }

        Error io_error(std::string message) {
            return Error{.kind = ErrorKind::kIo, .message = std::move(message)};
        }

        nlohmann::json window_to_json(const MinimizedWindow& window) {
            nlohmann::json json = {
                {"id", window.id},
                {"address", window.address},
                {"title", window.title},
                {"class", window.class_name},
                {"icon", window.icon},
                {"minimized_at", window.minimized_at},
            };
            if (window.thumbnail) {
                json["thumbnail"] = window.thumbnail->string();
            }
            if (window.source_workspace) {
                nlohmann::json workspace = {{"id", window.source_workspace->id}};
                if (window.source_workspace->name) {
                    workspace["name"] = *window.source_workspace->name;
                }
                json["workspace"] = std::move(workspace);
            }
            return json;
        }

        Result<MinimizedWindow> window_from_json(const nlohmann::json& json, size_t index) {
            const auto where = "windows[" + std::to_string(index) + "]";
            if (!json.is_object()) {
                return std::unexpected(corrupt(where + " is not an object"));
            }
            if (!json.contains("id") || !json.at("id").is_number_unsigned()) {
                return std::unexpected(corrupt(where + ".id missing or invalid"));
            }
            const auto address = optional_string_field(json, "address");
            if (!address) {
                return std::unexpected(corrupt(where + ".address missing or invalid"));
            }
            const auto minimized_at = optional_int64_field(json, "minimized_at");
            if (!minimized_at) {
                return std::unexpected(corrupt(where + ".minimized_at missing or invalid"));
            }

            MinimizedWindow window{
                .id           = json.at("id").get<WindowId>(),
                .address      = *address,
                .title        = optional_string_field(json, "title").value_or(""),
                .class_name   = optional_string_field(json, "class").value_or(""),
                .icon         = optional_string_field(json, "icon").value_or(""),
                .thumbnail    = std::nullopt,
                .minimized_at = *minimized_at,
            };
            if (const auto thumbnail = optional_string_field(json, "thumbnail")) {
                window.thumbnail = std::filesystem::path(*thumbnail);
            }
            if (json.contains("workspace") && json.at("workspace").is_object()) {
                const auto& workspace = json.at("workspace");
                if (const auto id = optional_int_field(workspace, "id")) {
                    window.source_workspace = WorkspaceRef{.id = *id, .name = optional_string_field(workspace, "name")};
                }
            }
            return window;
        }

        Result<std::string> read_file(const std::filesystem::path& path) {
            std::ifstream input(path, std::ios::binary);
            if (!input.good()) {
                return std::unexpected(io_error("unable to read " + path.string()));
            }
            std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
            if (input.bad()) {
                return std::unexpected(io_error("unable to read " + path.string()));
            }
            return text;
        }

        std::optional<std::string> write_all(int fd, std::string_view data) {
            size_t written = 0;
            while (written < data.size()) {
                const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return std::string(std::strerror(errno));
                }
                written += static_cast<size_t>(n);
            }
            return std::nullopt;
        }

        std::optional<int> read_lock_holder(const std::filesystem::path& path) {
            std::ifstream input(path);
            if (!input.good()) {
                return std::nullopt;
            }
            std::string line;
            std::getline(input, line);
            const auto trimmed = trim_view(line);
            int        pid     = 0;
            const auto result  = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), pid);
            if (result.ec != std::errc() || pid <= 0) {
                return std::nullopt;
            }
            return pid;
        }

    } // namespace

    std::int64_t unix_time_ms() {
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
    }

    std::string render_store_json(const MinimizedSet& set) {
        nlohmann::json windows = nlohmann::json::array();
        for (const auto& window : set.entries()) {
            windows.push_back(window_to_json(window));
        }
        nlohmann::json root = {
            {"version", kStoreVersion},
            {"next_id", set.next_id()},
            {"windows", std::move(windows)},
        };
        return root.dump(2) + "\n";
    }

    Result<MinimizedSet> parse_store_json(std::string_view text) {
        const auto root = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (root.is_discarded()) {
            return std::unexpected(corrupt("invalid json"));
        }
        if (!root.is_object()) {
            return std::unexpected(corrupt("root is not an object"));
        }
        const auto version = optional_int_field(root, "version");
        if (!version) {
            return std::unexpected(corrupt("version missing or invalid"));
        }
        if (*version > kStoreVersion || *version < 1) {
            return std::unexpected(corrupt("unsupported version " + std::to_string(*version)));
        }
        if (!root.contains("next_id") || !root.at("next_id").is_number_unsigned()) {
            return std::unexpected(corrupt("next_id missing or invalid"));
        }
        if (!root.contains("windows") || !root.at("windows").is_array()) {
            return std::unexpected(corrupt("windows missing or invalid"));
        }

        MinimizedSet set(root.at("next_id").get<WindowId>());
        const auto&  windows = root.at("windows");
        for (size_t index = 0; index < windows.size(); ++index) {
            auto window = window_from_json(windows.at(index), index);
            if (!window) {
                return std::unexpected(window.error());
            }
            if (!set.insert_existing(std::move(*window))) {
                return std::unexpected(corrupt("windows[" + std::to_string(index) + "] duplicates an id or address"));
            }
        }
        return set;
    }

    FileLock::FileLock(FileDescriptor fd) : fd_(std::move(fd)) {}

    Result<FileLock> FileLock::acquire(const std::filesystem::path& path, std::chrono::milliseconds timeout, const std::filesystem::path& proc_root) {
        std::error_code ec;
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return std::unexpected(io_error("unable to create " + parent.string() + ": " + ec.message()));
            }
        }

        FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
        if (!fd) {
            return std::unexpected(io_error("unable to open " + path.string() + ": " + std::strerror(errno)));
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EWOULDBLOCK) {
                return std::unexpected(io_error("flock failed: " + std::string(std::strerror(errno))));
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return std::unexpected(Error{
                    .kind    = ErrorKind::kLockTimeout,
                    .message = "lock " + path.string() + " held by " + describe_process(read_lock_holder(path), proc_root),
                });
            }
            std::this_thread::sleep_for(kLockPollInterval);
        }

        const auto pid = std::to_string(::getpid()) + "\n";
        if (::ftruncate(fd.get(), 0) != 0 || ::lseek(fd.get(), 0, SEEK_SET) < 0 || write_all(fd.get(), pid)) {
            // The pid is diagnostic only.
            debug_log(true, "store", "unable to record lock holder in " + path.string());
        }
        return FileLock(std::move(fd));
    }

    StateStore::StateStore(StoreOptions options) : options_(std::move(options)) {}

    Result<MinimizedSet> StateStore::load() const {
        std::error_code ec;
        if (!std::filesystem::exists(options_.store_path, ec)) {
            if (ec) {
                return std::unexpected(io_error("unable to stat " + options_.store_path.string() + ": " + ec.message()));
            }
            return MinimizedSet{};
        }
        const auto text = read_file(options_.store_path);
        if (!text) {
            return std::unexpected(text.error());
        }
        return parse_store_json(*text);
    }

    Result<MinimizedSet> StateStore::peek() const {
        return load();
    }

    Result<MinimizedSet> StateStore::load_or_recover() const {
        auto set = load();
        if (set || set.error().kind != ErrorKind::kCorruptState) {
            return set;
        }

        const auto      backup = std::filesystem::path(options_.store_path.string() + ".corrupt-" + std::to_string(options_.clock()));
        std::error_code ec;
        std::filesystem::rename(options_.store_path, backup, ec);
        if (ec) {
            return std::unexpected(io_error("store is corrupt (" + set.error().message + ") and could not be moved aside: " + ec.message()));
        }
        error_log("store", "corrupt state (" + set.error().message + "); moved to " + backup.string() + " and starting empty");
        return MinimizedSet{};
    }

    Result<void> StateStore::save(const MinimizedSet& set) const {
        std::error_code ec;
        if (const auto parent = options_.store_path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return std::unexpected(io_error("unable to create " + parent.string() + ": " + ec.message()));
            }
        }

        const auto     tempname = std::filesystem::path(options_.store_path.string() + ".tmp");
        FileDescriptor fd(::open(tempname.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
        if (!fd) {
            return std::unexpected(io_error("unable to write " + tempname.string() + ": " + std::strerror(errno)));
        }
        if (const auto failed = write_all(fd.get(), render_store_json(set))) {
            std::filesystem::remove(tempname, ec);
            return std::unexpected(io_error("unable to write " + tempname.string() + ": " + *failed));
        }
        if (::fsync(fd.get()) != 0) {
            const std::string reason = std::strerror(errno);
            std::filesystem::remove(tempname, ec);
            return std::unexpected(io_error("unable to flush " + tempname.string() + ": " + reason));
        }
        if (!fd.close()) {
            const std::string reason = std::strerror(errno);
            std::filesystem::remove(tempname, ec);
            return std::unexpected(io_error("unable to close " + tempname.string() + ": " + reason));
        }

        std::filesystem::rename(tempname, options_.store_path, ec);
        if (ec) {
            return std::unexpected(io_error("unable to finalize " + options_.store_path.string() + ": " + ec.message()));
        }
        return {};
    }

} // namespace minhypr

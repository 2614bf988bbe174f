#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "minhypr/capture.hpp"
#include "minhypr/command.hpp"
#include "minhypr/compositor.hpp"
#include "minhypr/config.hpp"
#include "minhypr/engine.hpp"
#include "minhypr/failsafe.hpp"
#include "minhypr/hypr_socket.hpp"
#include "minhypr/hyprctl.hpp"
#include "minhypr/logging.hpp"
#include "minhypr/paths.hpp"
#include "minhypr/picker.hpp"
#include "minhypr/runtime.hpp"
#include "minhypr/state_store.hpp"
#include "minhypr/waybar.hpp"

namespace {

    void write_out(std::FILE* stream, const std::string& text) {
        if (!text.empty()) {
            std::fwrite(text.data(), 1, text.size(), stream);
            std::fflush(stream);
        }
    }

    minhypr::StoreOptions store_options(const minhypr::Paths& paths, const minhypr::Config& config) {
        return minhypr::StoreOptions{
            .store_path   = paths.store_path,
            .lock_path    = paths.lock_path,
            .lock_timeout = std::chrono::milliseconds(config.lock_timeout_ms),
            .proc_root    = paths.proc_root,
        };
    }

    // Waybar polls this; it must print exactly one payload line and exit 0.
    int run_show() {
        std::string output;
        const int   status = minhypr::failsafe::run(
            [&] {
                const auto paths = minhypr::try_resolve_paths_from_env();
                if (!paths) {
                    output = minhypr::render_show(nullptr);
                    return 0;
                }
                const minhypr::StateStore store(store_options(*paths, minhypr::Config{}));
                output = minhypr::render_show(&store);
                return 0;
            },
            [](std::string_view, std::string_view) {}, "show");
        if (status != 0 || output.empty()) {
            output = minhypr::render_waybar_json(minhypr::neutral_status_payload());
        }
        write_out(stdout, output);
        return 0;
    }

    int run(const minhypr::Command& command) {
        minhypr::set_log_sink(minhypr::LogLevel::kError, minhypr::stderr_log_sink);

        const auto paths = minhypr::try_resolve_paths_from_env();
        if (!paths) {
            write_out(stderr, "minhypr: HOME is not set\n");
            return 1;
        }

        std::vector<std::string> warnings;
        const auto               config_path = command.config_path ? std::filesystem::path(*command.config_path) : paths->config_path;
        auto                     config      = minhypr::load_config(config_path, &warnings);
        if (command.debug) {
            config.debug_logging = true;
        }
        if (config.debug_logging) {
            minhypr::set_log_sink(minhypr::LogLevel::kDebug, minhypr::stderr_log_sink);
        }
        for (const auto& warning : warnings) {
            minhypr::error_log("config", warning);
        }

        const minhypr::RuntimeConfig     runtime_config{.paths = *paths, .config = config};
        const auto                       runner = minhypr::default_process_runner();

        minhypr::SocketInvoker           invoker(paths->hyprland_socket);
        minhypr::HyprctlClient           client(invoker);
        minhypr::HyprctlCompositor       compositor(client);
        std::unique_ptr<minhypr::Capturer> capturer;
        if (config.capture_thumbnails) {
            capturer = std::make_unique<minhypr::GrimCapturer>(paths->thumbnail_dir, config.thumbnail_size, config.icon_size, runner);
        }
        const minhypr::StateStore        store(store_options(*paths, config));
        minhypr::MinimizeEngine          engine(store, compositor, capturer.get(), config);
        minhypr::RofiPicker              picker(config.picker_command, paths->rofi_theme_path, runner);

        minhypr::RuntimeServices         services{
                    .engine = &engine,
                    .store  = &store,
                    .picker = &picker,
                    .runner = runner,
        };
        if (const char* info = std::getenv("ROFI_INFO"); info && command.kind == minhypr::CommandKind::kShowRofi) {
            services.rofi_info = std::string(info);
        }

        const auto output = minhypr::run_command(command, runtime_config, services);
        write_out(output.success ? stdout : stderr, output.success ? output.output : "minhypr: " + output.output + (output.output.ends_with('\n') ? "" : "\n"));
        return output.exit_code;
    }

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    const std::vector<std::string> args(argv + 1, argv + argc);
    const auto                     parsed = minhypr::parse_command(args);
    if (const auto* error = std::get_if<minhypr::ParseError>(&parsed)) {
        write_out(stderr, "minhypr: " + error->message + "\n\n" + minhypr::usage_text());
        return 2;
    }
    const auto& command = std::get<minhypr::Command>(parsed);
    if (command.kind == minhypr::CommandKind::kShow) {
        return run_show();
    }

    return minhypr::failsafe::run([&] { return run(command); },
                                  [](std::string_view context, std::string_view message) {
                                      write_out(stderr, "minhypr: " + std::string(context) + ": " + std::string(message) + "\n");
                                  },
                                  "minhypr");
}

#include "minhypr/runtime.hpp"

#include "minhypr/logging.hpp"
#include "minhypr/menu.hpp"
#include "minhypr/notifications.hpp"
#include "minhypr/setup.hpp"
#include "minhypr/status.hpp"
#include "minhypr/version.hpp"
#include "minhypr/waybar.hpp"

namespace minhypr {

    namespace {

        CommandOutput ok(std::string output) {
            return CommandOutput{.success = true, .output = std::move(output), .exit_code = 0};
        }

        CommandOutput failed(const Error& error) {
            return CommandOutput{.success = false, .output = format_error(error), .exit_code = exit_code_for(error)};
        }

        CommandOutput unavailable(std::string_view what) {
            return failed(Error{.kind = ErrorKind::kAdapterFailure, .message = std::string(what) + " unavailable"});
        }

        bool mutates(CommandKind kind) {
            switch (kind) {
                case CommandKind::kMinimize:
                case CommandKind::kRestore:
                case CommandKind::kRestoreAll:
                case CommandKind::kRestoreLast:
                case CommandKind::kShowRofi: return true;
                default: return false;
            }
        }

        void nudge_waybar(const RuntimeConfig& runtime_config, const RuntimeServices& services) {
            if (const auto error = signal_waybar(runtime_config.config.waybar_signal, services.runner)) {
                error_log("waybar", *error);
            }
        }

        std::string restored_line(const MinimizedWindow& window) {
            return "restored " + std::to_string(window.id) + " " + display_label(window) + "\n";
        }

        CommandOutput finish_restore(const Result<MinimizedWindow>& restored, const RuntimeConfig& runtime_config, const RuntimeServices& services) {
            if (!restored) {
                return failed(restored.error());
            }
            nudge_waybar(runtime_config, services);
            return ok(restored_line(*restored));
        }

        CommandOutput run_minimize(const Command& command, const RuntimeConfig& runtime_config, RuntimeServices& services) {
            const auto minimized = services.engine->minimize(command.target);
            if (!minimized) {
                if (is_benign(minimized.error().kind)) {
                    return ok(format_error(minimized.error()) + "\n");
                }
                return failed(minimized.error());
            }
            nudge_waybar(runtime_config, services);
            return ok("minimized " + std::to_string(minimized->id) + " " + display_label(*minimized) + "\n");
        }

        CommandOutput restore_target(std::string_view target, const RuntimeConfig& runtime_config, RuntimeServices& services) {
            const auto parsed = parse_restore_argument(target);
            if (!parsed) {
                return failed(Error{.kind = ErrorKind::kInvalidArgument, .message = "expected an id or a 0x address, got " + std::string(target)});
            }
            if (parsed->address) {
                return finish_restore(services.engine->restore_address(*parsed->address), runtime_config, services);
            }
            return finish_restore(services.engine->restore(*parsed->id), runtime_config, services);
        }

        CommandOutput run_restore(const Command& command, const RuntimeConfig& runtime_config, RuntimeServices& services) {
            if (command.target) {
                return restore_target(*command.target, runtime_config, services);
            }
            if (!services.picker) {
                return unavailable("picker");
            }
            const auto set = services.engine->list();
            if (!set) {
                return failed(set.error());
            }
            if (set->empty()) {
                return ok("No minimized windows\n");
            }
            // The lock is not held while the menu is open.
            const auto choice = services.picker->choose(*set);
            if (!choice) {
                return failed(choice.error());
            }
            if (!*choice) {
                return ok("");
            }
            return finish_restore(services.engine->restore(**choice), runtime_config, services);
        }

        CommandOutput run_restore_all(const RuntimeConfig& runtime_config, RuntimeServices& services) {
            const auto report = services.engine->restore_all();
            if (!report) {
                return failed(report.error());
            }
            if (!report->restored.empty()) {
                nudge_waybar(runtime_config, services);
            }
            std::string output;
            for (const auto& window : report->restored) {
                output += restored_line(window);
            }
            if (report->ok()) {
                return ok(std::move(output));
            }
            for (const auto& failure : report->failures) {
                output += "failed " + std::to_string(failure.id) + ": " + format_error(failure.error) + "\n";
            }
            return CommandOutput{.success = false, .output = std::move(output), .exit_code = 1};
        }

        CommandOutput run_show_rofi(const RuntimeConfig& runtime_config, RuntimeServices& services) {
            // rofi re-runs the script with ROFI_INFO set once a row is picked.
            if (services.rofi_info && !services.rofi_info->empty()) {
                const auto restored = restore_target(*services.rofi_info, runtime_config, services);
                return restored.success ? ok("") : restored;
            }
            const auto set = services.engine->list();
            if (!set) {
                return failed(set.error());
            }
            return ok(render_script_rows(*set));
        }

        CommandOutput run_reap(const RuntimeConfig& runtime_config, RuntimeServices& services) {
            const auto report = services.engine->reap_stale();
            if (!report) {
                return failed(report.error());
            }
            if (report->changed()) {
                nudge_waybar(runtime_config, services);
            }
            return ok("removed " + std::to_string(report->removed.size()) + ", adopted " + std::to_string(report->adopted.size()) + "\n");
        }

        CommandOutput run_setup_hyprland(const RuntimeConfig& runtime_config) {
            const auto& paths = runtime_config.paths;
            if (ensure_minhypr_conf(paths.config_path)) {
                debug_log(runtime_config.config.debug_logging, "setup", "wrote " + paths.config_path.string());
            }
            if (const auto error = install_hyprland_snippet(paths)) {
                return failed(Error{.kind = ErrorKind::kIo, .message = *error});
            }
            return ok("keybinds written to " + paths.hyprland_snippet_path.string() + " and sourced from " + paths.hyprland_conf_path.string() + "\n");
        }

        CommandOutput dispatch(const Command& command, const RuntimeConfig& runtime_config, RuntimeServices& services) {
            switch (command.kind) {
                case CommandKind::kHelp: return ok(usage_text());
                case CommandKind::kVersion: return ok("minhypr " + std::string(kVersion) + "\n");
                case CommandKind::kShow: return ok(render_show(services.store));
                case CommandKind::kSetupRofi: {
                    if (const auto error = install_rofi_assets(runtime_config.paths)) {
                        return failed(Error{.kind = ErrorKind::kIo, .message = *error});
                    }
                    return ok("rofi assets written to " + runtime_config.paths.config_dir.string() + "\n");
                }
                case CommandKind::kSetupHyprland: return run_setup_hyprland(runtime_config);
                default: break;
            }

            if (!services.engine) {
                return unavailable("engine");
            }
            switch (command.kind) {
                case CommandKind::kMinimize: return run_minimize(command, runtime_config, services);
                case CommandKind::kRestore: return run_restore(command, runtime_config, services);
                case CommandKind::kRestoreAll: return run_restore_all(runtime_config, services);
                case CommandKind::kRestoreLast: return finish_restore(services.engine->restore_last(), runtime_config, services);
                case CommandKind::kList: {
                    const auto set = services.engine->list();
                    if (!set) {
                        return failed(set.error());
                    }
                    return ok(command.json ? render_window_list_json(*set) : render_window_list(*set));
                }
                case CommandKind::kShowRofi: return run_show_rofi(runtime_config, services);
                case CommandKind::kReap: return run_reap(runtime_config, services);
                default: break;
            }
            return CommandOutput{.success = false, .output = "unsupported command", .exit_code = 2};
        }

    } // namespace

    int exit_code_for(const Error& error) {
        return error.kind == ErrorKind::kInvalidArgument ? 2 : 1;
    }

    std::string render_show(const StateStore* store) {
        if (!store) {
            return render_waybar_json(neutral_status_payload());
        }
        const auto set = store->peek();
        if (!set) {
            return render_waybar_json(neutral_status_payload());
        }
        return render_waybar_json(build_status_payload(*set));
    }

    CommandOutput run_command(const Command& command, const RuntimeConfig& runtime_config, RuntimeServices& services) {
        auto output = dispatch(command, runtime_config, services);
        if (!output.success && runtime_config.config.notify_errors && mutates(command.kind)) {
            if (const auto error = send_notification(services.runner, failure_notification_text(command_name(command.kind), output.output))) {
                error_log("notify", *error);
            }
        }
        return output;
    }

} // namespace minhypr

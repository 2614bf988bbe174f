#include "minhypr/picker.hpp"

#include <system_error>

#include "minhypr/menu.hpp"

namespace minhypr {

    RofiPicker::RofiPicker(std::string command, std::optional<std::filesystem::path> theme, ProcessRunner runner) :
        command_(std::move(command)), theme_(std::move(theme)), runner_(std::move(runner)) {}

    std::vector<std::string> RofiPicker::arguments() const {
        std::vector<std::string> args = {command_, "-dmenu", "-i", "-p", "Restore", "-format", "i", "-no-custom", "-show-icons"};
        std::error_code          ec;
        if (theme_ && std::filesystem::exists(*theme_, ec)) {
            args.push_back("-theme");
            args.push_back(theme_->string());
        }
        return args;
    }

    Result<std::optional<WindowId>> RofiPicker::choose(const MinimizedSet& set) {
        if (!runner_) {
            return make_error(ErrorKind::kAdapterFailure, "no process runner");
        }
        const auto args   = arguments();
        auto       result = runner_(args, render_rofi_rows(set));
        if (!result) {
            return make_error(ErrorKind::kAdapterFailure, command_ + ": " + result.error());
        }
        if (result->exit_code == 127) {
            return make_error(ErrorKind::kAdapterFailure, command_ + " not found");
        }
        // rofi exits 1 on escape.
        if (result->exit_code == 1) {
            return std::optional<WindowId>{};
        }
        if (result->exit_code != 0) {
            return make_error(ErrorKind::kAdapterFailure, command_ + " exited with code " + std::to_string(result->exit_code));
        }
        const auto id = id_for_row(set, result->output);
        if (!id) {
            return std::optional<WindowId>{};
        }
        return id;
    }

} // namespace minhypr

#include "minhypr/process_utils.hpp"

#include <fstream>

namespace minhypr {

    std::optional<std::string> read_process_cmdline(int pid, const std::filesystem::path& proc_root) {
        if (pid <= 0) {
            return std::nullopt;
        }
        std::ifstream input(proc_root / std::to_string(pid) / "cmdline", std::ios::binary);
        if (!input) {
            return std::nullopt;
        }
        // Arguments are NUL separated; join them with single spaces.
        std::string joined;
        std::string arg;
        while (std::getline(input, arg, '\0')) {
            if (arg.empty()) {
                continue;
            }
            if (!joined.empty()) {
                joined.push_back(' ');
            }
            joined += arg;
        }
        if (joined.empty()) {
            return std::nullopt;
        }
        return joined;
    }

    bool process_alive(int pid, const std::filesystem::path& proc_root) {
        if (pid <= 0) {
            return false;
        }
        std::error_code ec;
        return std::filesystem::exists(proc_root / std::to_string(pid), ec) && !ec;
    }

    std::string describe_process(std::optional<int> pid, const std::filesystem::path& proc_root) {
        if (!pid || *pid <= 0) {
            return "unknown holder";
        }
        std::string text = "pid " + std::to_string(*pid);
        if (!process_alive(*pid, proc_root)) {
            return text + " (exited)";
        }
        if (const auto cmdline = read_process_cmdline(*pid, proc_root)) {
            text += " (" + *cmdline + ")";
        }
        return text;
    }

} // namespace minhypr

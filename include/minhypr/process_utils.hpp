#ifndef MINHYPR_PROCESS_UTILS_HPP
#define MINHYPR_PROCESS_UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace minhypr {

    std::optional<std::string> read_process_cmdline(int pid, const std::filesystem::path& proc_root);
    bool                       process_alive(int pid, const std::filesystem::path& proc_root);

    // "pid 42 (minhypr restore-all)", "pid 42 (exited)" or "unknown holder".
    std::string                describe_process(std::optional<int> pid, const std::filesystem::path& proc_root);

} // namespace minhypr

#endif // MINHYPR_PROCESS_UTILS_HPP

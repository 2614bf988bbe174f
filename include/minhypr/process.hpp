#ifndef MINHYPR_PROCESS_HPP
#define MINHYPR_PROCESS_HPP

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace minhypr {

    struct ProcessResult {
        int         exit_code;
        std::string output;
    };

    // Spawns argv[0] from PATH, feeds `input` on stdin and collects stdout.
    // Exit code 127 means the program could not be executed.
    std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv, std::string_view input = {});

    using ProcessRunner = std::function<std::expected<ProcessResult, std::string>(const std::vector<std::string>&, std::string_view)>;

    ProcessRunner                             default_process_runner();

    // Runs and requires exit status 0.
    std::expected<std::string, std::string>   run_checked(const ProcessRunner& runner, const std::vector<std::string>& argv, std::string_view input = {});

} // namespace minhypr

#endif // MINHYPR_PROCESS_HPP

#include "minhypr/process.hpp"

#include <cerrno>
#include <cstring>
#include <optional>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "minhypr/file_descriptor.hpp"

namespace minhypr {

    namespace {

        std::string errno_message(std::string_view what) {
            return std::string(what) + " failed: " + std::strerror(errno);
        }

        std::optional<std::string> write_all(int fd, std::string_view data) {
            size_t written = 0;
            while (written < data.size()) {
                const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    // The child may exit without reading its input.
                    if (errno == EPIPE) {
                        return std::nullopt;
                    }
                    return errno_message("write()");
                }
                written += static_cast<size_t>(n);
            }
            return std::nullopt;
        }

        std::optional<std::string> read_all(int fd, std::string& output) {
            char buffer[4096];
            while (true) {
                const ssize_t n = ::read(fd, buffer, sizeof(buffer));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return errno_message("read()");
                }
                if (n == 0) {
                    return std::nullopt;
                }
                output.append(buffer, static_cast<size_t>(n));
            }
        }

        std::expected<int, std::string> wait_child(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::unexpected(errno_message("waitpid()"));
            }
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return -1;
        }

    } // namespace

    std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv, std::string_view input) {
        if (argv.empty() || argv.front().empty()) {
            return std::unexpected(std::string("empty command"));
        }

        FileDescriptor stdin_read;
        FileDescriptor stdin_write;
        FileDescriptor stdout_read;
        FileDescriptor stdout_write;
        if (!FileDescriptor::open_pipe(stdin_read, stdin_write) || !FileDescriptor::open_pipe(stdout_read, stdout_write)) {
            return std::unexpected(errno_message("pipe()"));
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            return std::unexpected(errno_message("fork()"));
        }

        if (pid == 0) {
            ::dup2(stdin_read.get(), STDIN_FILENO);
            ::dup2(stdout_write.get(), STDOUT_FILENO);
            ::execvp(args[0], args.data());
            ::_exit(127);
        }

        stdin_read.reset();
        stdout_write.reset();

        auto write_error = write_all(stdin_write.get(), input);
        stdin_write.reset();

        std::string output;
        const auto  read_error = read_all(stdout_read.get(), output);
        stdout_read.reset();

        const auto exit_code = wait_child(pid);
        if (!exit_code) {
            return std::unexpected(exit_code.error());
        }
        if (write_error) {
            return std::unexpected(*write_error);
        }
        if (read_error) {
            return std::unexpected(*read_error);
        }
        return ProcessResult{.exit_code = *exit_code, .output = std::move(output)};
    }

    ProcessRunner default_process_runner() {
        return [](const std::vector<std::string>& argv, std::string_view input) { return run_process(argv, input); };
    }

    std::expected<std::string, std::string> run_checked(const ProcessRunner& runner, const std::vector<std::string>& argv, std::string_view input) {
        if (!runner) {
            return std::unexpected(std::string("no process runner"));
        }
        auto result = runner(argv, input);
        if (!result) {
            return std::unexpected(argv.front() + ": " + result.error());
        }
        if (result->exit_code == 127) {
            return std::unexpected(argv.front() + " not found");
        }
        if (result->exit_code != 0) {
            return std::unexpected(argv.front() + " exited with code " + std::to_string(result->exit_code));
        }
        return std::move(result->output);
    }

} // namespace minhypr

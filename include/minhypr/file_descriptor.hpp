#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <utility>

namespace minhypr {

    // Owns one descriptor; closed on destruction unless released.
    class FileDescriptor {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() {
            close();
        }

        FileDescriptor(const FileDescriptor&)            = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
        FileDescriptor& operator=(FileDescriptor&& other) noexcept {
            if (this != &other) {
                reset(std::exchange(other.fd_, -1));
            }
            return *this;
        }

        // Both ends are O_CLOEXEC so spawned children only see what they dup2.
        static bool open_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            read_end.reset(fds[0]);
            write_end.reset(fds[1]);
            return true;
        }

        int get() const {
            return fd_;
        }
        explicit operator bool() const {
            return fd_ >= 0;
        }

        int release() {
            return std::exchange(fd_, -1);
        }
        void reset(int fd = -1) {
            close();
            fd_ = fd;
        }

        // Returns false with errno set when close(2) fails; the descriptor is gone either way.
        bool close() {
            if (fd_ < 0) {
                return true;
            }
            return ::close(std::exchange(fd_, -1)) == 0;
        }

      private:
        int fd_ = -1;
    };

}

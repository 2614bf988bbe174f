#include "minhypr/file_descriptor.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <utility>

#include <gtest/gtest.h>

namespace {

    bool is_open(int fd) {
        return ::fcntl(fd, F_GETFD) != -1;
    }

    TEST(FileDescriptor, DefaultIsInvalid) {
        minhypr::FileDescriptor fd;
        EXPECT_FALSE(static_cast<bool>(fd));
        EXPECT_EQ(fd.get(), -1);
    }

    TEST(FileDescriptor, ClosesWhenScopeEnds) {
        int pipe_fds[2];
        ASSERT_EQ(::pipe(pipe_fds), 0);
        {
            minhypr::FileDescriptor read_end(pipe_fds[0]);
            minhypr::FileDescriptor write_end(pipe_fds[1]);
            EXPECT_TRUE(is_open(read_end.get()));
        }
        EXPECT_FALSE(is_open(pipe_fds[0]));
        EXPECT_FALSE(is_open(pipe_fds[1]));
    }

    TEST(FileDescriptor, MoveAssignmentClosesPreviousDescriptor) {
        int first[2];
        int second[2];
        ASSERT_EQ(::pipe(first), 0);
        ASSERT_EQ(::pipe(second), 0);
        minhypr::FileDescriptor target(first[0]);
        minhypr::FileDescriptor source(second[0]);

        target = std::move(source);

        EXPECT_EQ(target.get(), second[0]);
        EXPECT_FALSE(static_cast<bool>(source));
        EXPECT_FALSE(is_open(first[0]));
        ::close(first[1]);
        ::close(second[1]);
    }

    TEST(FileDescriptor, ReleaseHandsOverOwnership) {
        int pipe_fds[2];
        ASSERT_EQ(::pipe(pipe_fds), 0);
        int released = -1;
        {
            minhypr::FileDescriptor fd(pipe_fds[0]);
            released = fd.release();
            EXPECT_FALSE(static_cast<bool>(fd));
        }
        EXPECT_TRUE(is_open(released));
        ::close(released);
        ::close(pipe_fds[1]);
    }

    TEST(FileDescriptor, OpenPipeIsCloseOnExec) {
        minhypr::FileDescriptor read_end;
        minhypr::FileDescriptor write_end;
        ASSERT_TRUE(minhypr::FileDescriptor::open_pipe(read_end, write_end));

        EXPECT_NE(::fcntl(read_end.get(), F_GETFD) & FD_CLOEXEC, 0);
        EXPECT_NE(::fcntl(write_end.get(), F_GETFD) & FD_CLOEXEC, 0);
        ASSERT_EQ(::write(write_end.get(), "x", 1), 1);
        char byte = 0;
        EXPECT_EQ(::read(read_end.get(), &byte, 1), 1);
        EXPECT_EQ(byte, 'x');
    }

    TEST(FileDescriptor, ExplicitCloseReportsSuccessOnce) {
        minhypr::FileDescriptor read_end;
        minhypr::FileDescriptor write_end;
        ASSERT_TRUE(minhypr::FileDescriptor::open_pipe(read_end, write_end));
        const int raw = write_end.get();

        EXPECT_TRUE(write_end.close());
        EXPECT_FALSE(static_cast<bool>(write_end));
        EXPECT_FALSE(is_open(raw));
        EXPECT_TRUE(write_end.close());
    }

}

#include "process/pipe.hpp"
#include <errno.h>
#include <fcntl.h>
#include <glog/logging.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <system_error>

namespace sandbox::process {
using namespace std;

static const size_t WRITE_CHUNK_SIZE = 64 * 1024;

file_descriptor::file_descriptor(int fd) : fd(fd) {}

file_descriptor::file_descriptor(file_descriptor &&other) noexcept : fd(other.fd) {
    other.fd = -1;
}

file_descriptor::~file_descriptor() {
    close();
}

file_descriptor &file_descriptor::operator=(file_descriptor &&other) noexcept {
    if (this != &other) {
        close();
        fd = other.fd;
        other.fd = -1;
    }
    return *this;
}

int file_descriptor::release() {
    int result = fd;
    fd = -1;
    return result;
}

void file_descriptor::close() {
    if (fd < 0) return;
    if (::close(fd) != 0 && errno != EINTR)
        PLOG(WARNING) << "closing fd " << fd;
    fd = -1;
}

pair<file_descriptor, file_descriptor> make_pipe() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw system_error(errno, system_category(), "creating pipe");
    return {file_descriptor(fds[0]), file_descriptor(fds[1])};
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags == -1)
        throw system_error(errno, system_category(), "fcntl, getting flags");
    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw system_error(errno, system_category(), "fcntl, setting flags");
}

writable_stream::~writable_stream() {}

pipe_writer::pipe_writer(file_descriptor fd) : descriptor(move(fd)) {
    set_nonblocking(descriptor.get());
}

int pipe_writer::fd() const {
    return descriptor.get();
}

bool pipe_writer::is_closing() {
    if (!descriptor.valid()) return true;
    // 读端全部关闭后，写端会被 poll 报告为 POLLERR
    struct pollfd pfd = {descriptor.get(), POLLOUT, 0};
    int r = poll(&pfd, 1, 0);
    if (r < 0) return errno != EINTR;
    return (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0;
}

ssize_t pipe_writer::write_some(const char *data, size_t size) {
    if (!descriptor.valid()) {
        errno = EBADF;
        return -1;
    }
    return ::write(descriptor.get(), data, size);
}

void pipe_writer::close() {
    descriptor.close();
}

bool pipe_writer::closed() const {
    return !descriptor.valid();
}

stdin_feeder::stdin_feeder(writable_stream *stream, string payload, bool close_when_done)
    : stream(stream), payload(move(payload)), close_when_done(close_when_done) {}

void stdin_feeder::start() {
    if (!stream) {
        done = true;
        return;
    }
    if (stream->is_closing()) {
        // 子进程可能已经退出，再写入只会得到 EPIPE
        was_skipped = !payload.empty();
        finish(true);
        return;
    }
    if (payload.empty()) {
        finish(close_when_done);
        return;
    }
    on_writable();
}

void stdin_feeder::on_writable() {
    if (done) return;
    while (offset < payload.size()) {
        size_t to_write = min(WRITE_CHUNK_SIZE, payload.size() - offset);
        ssize_t nwritten = stream->write_some(payload.data() + offset, to_write);
        if (nwritten < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno != EPIPE)
                PLOG(WARNING) << "writing stdin of child process";
            abandon();
            return;
        }
        offset += nwritten;
    }
    finish(close_when_done);
}

void stdin_feeder::abandon() {
    finish(true);
}

bool stdin_feeder::finished() const {
    return done;
}

bool stdin_feeder::skipped() const {
    return was_skipped;
}

size_t stdin_feeder::written() const {
    return offset;
}

void stdin_feeder::finish(bool close_stream) {
    if (close_stream && stream && !stream->closed()) stream->close();
    done = true;
}

}  // namespace sandbox::process

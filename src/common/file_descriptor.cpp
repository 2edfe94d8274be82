#include "common/file_descriptor.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <utility>
#include "common/exceptions.hpp"

namespace bayview {
using namespace std;

file_descriptor::file_descriptor() : fd(-1) {}

file_descriptor::file_descriptor(int fd) : fd(fd) {}

file_descriptor::file_descriptor(file_descriptor &&other) noexcept : fd(other.release()) {}

file_descriptor::~file_descriptor() {
    close();
}

file_descriptor &file_descriptor::operator=(file_descriptor &&other) noexcept {
    if (this != &other) {
        close();
        fd = other.release();
    }
    return *this;
}

bool file_descriptor::is_open() const noexcept {
    return fd >= 0;
}

int file_descriptor::get() const noexcept {
    return fd;
}

int file_descriptor::release() noexcept {
    return exchange(fd, -1);
}

int file_descriptor::close() noexcept {
    if (fd < 0) return 0;
    return ::close(exchange(fd, -1));
}

void make_pipe(file_descriptor &read_end, file_descriptor &write_end) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw internal_error(string("unable to create pipe: ") + strerror(errno));
    read_end = file_descriptor(fds[0]);
    write_end = file_descriptor(fds[1]);
}

void set_nonblocking(const file_descriptor &fd) {
    int flags = fcntl(fd.get(), F_GETFL);
    if (flags == -1 || fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK) == -1)
        throw internal_error(string("unable to set O_NONBLOCK: ") + strerror(errno));
}

}  // namespace bayview

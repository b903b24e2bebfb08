#include "EvdevSource.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <sys/eventfd.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <unistd.h>

namespace hotmacro {

EvdevSource::EvdevSource(const std::string& devicePath) : path(devicePath) {
    fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        int err = errno;
        if (err == EACCES) {
            throw DeviceError(fmt::format(
                "Failed to read device '{}'. You must be in the 'input' group to access global events.", path));
        }
        throw DeviceError(fmt::format("Failed to open device {}: {}", path, strerror(err)));
    }

    char buf[256] = "Unknown";
    if (ioctl(fd, EVIOCGNAME(sizeof(buf)), buf) >= 0) {
        name = buf;
    }

    shutdownFd = eventfd(0, EFD_NONBLOCK);
    if (shutdownFd < 0) {
        int err = errno;
        close(fd);
        fd = -1;
        throw DeviceError(fmt::format("Failed to create eventfd: {}", strerror(err)));
    }

    info("Opened input device: {} ({})", name, path);
}

EvdevSource::~EvdevSource() {
    if (fd >= 0) {
        close(fd);
    }
    if (shutdownFd >= 0) {
        close(shutdownFd);
    }
}

void EvdevSource::Interrupt() {
    interrupted.store(true);
    uint64_t val = 1;
    if (write(shutdownFd, &val, sizeof(val)) < 0) {
        warning("EvdevSource: failed to signal shutdown: {}", strerror(errno));
    }
}

std::optional<KeyEvent> EvdevSource::ReadEvent() {
    while (!interrupted.load()) {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(fd, &readfds);
        FD_SET(shutdownFd, &readfds);
        int maxFd = std::max(fd, shutdownFd);

        int ret = select(maxFd + 1, &readfds, nullptr, nullptr, nullptr);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            error("select() failed: {}", strerror(errno));
            return std::nullopt;
        }

        if (FD_ISSET(shutdownFd, &readfds))
            return std::nullopt;

        if (!FD_ISSET(fd, &readfds))
            continue;

        struct input_event ev;
        ssize_t n = read(fd, &ev, sizeof(ev));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR)
                continue;
            // ENODEV when the keyboard is unplugged
            error("Failed to read from {}: {}", path, strerror(errno));
            return std::nullopt;
        }
        if (n != sizeof(ev))
            continue;

        if (ev.type != EV_KEY)
            continue;

        return KeyEvent{ev.code, ev.value};
    }
    return std::nullopt;
}

} // namespace hotmacro

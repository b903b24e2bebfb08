#include "UinputSink.hpp"
#include "core/Errors.hpp"
#include "utils/Logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <sys/time.h>
#include <thread>
#include <unistd.h>

namespace hotmacro {

UinputSink::UinputSink(const std::string& deviceName) : name(deviceName) {
    uinputFd = open("/dev/uinput", O_WRONLY | O_NONBLOCK);
    if (uinputFd < 0) {
        throw DeviceError(fmt::format("uinput: failed to open /dev/uinput: {}", strerror(errno)));
    }

    auto fail = [this](const char* what) {
        std::string message = fmt::format("uinput: {} failed: {}", what, strerror(errno));
        close(uinputFd);
        uinputFd = -1;
        throw DeviceError(message);
    };

    struct uinput_setup usetup = {};
    usetup.id.bustype = BUS_USB;
    usetup.id.vendor = 0x1234;
    usetup.id.product = 0x5678;
    strncpy(usetup.name, name.c_str(), UINPUT_MAX_NAME_SIZE - 1);

    if (ioctl(uinputFd, UI_SET_EVBIT, EV_KEY) < 0)
        fail("UI_SET_EVBIT EV_KEY");
    if (ioctl(uinputFd, UI_SET_EVBIT, EV_SYN) < 0)
        fail("UI_SET_EVBIT EV_SYN");
    if (ioctl(uinputFd, UI_SET_EVBIT, EV_REL) < 0)
        fail("UI_SET_EVBIT EV_REL");

    // Every keyboard key code plus the mouse buttons the macros can use
    for (int i = 1; i < 256; ++i)
        ioctl(uinputFd, UI_SET_KEYBIT, i);
    ioctl(uinputFd, UI_SET_KEYBIT, BTN_LEFT);
    ioctl(uinputFd, UI_SET_KEYBIT, BTN_RIGHT);
    ioctl(uinputFd, UI_SET_KEYBIT, BTN_MIDDLE);

    ioctl(uinputFd, UI_SET_RELBIT, REL_X);
    ioctl(uinputFd, UI_SET_RELBIT, REL_Y);
    ioctl(uinputFd, UI_SET_RELBIT, REL_WHEEL);

    if (ioctl(uinputFd, UI_DEV_SETUP, &usetup) < 0)
        fail("UI_DEV_SETUP");
    if (ioctl(uinputFd, UI_DEV_CREATE) < 0)
        fail("UI_DEV_CREATE");

    // Give udev a moment to register the node before the first event
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    info("uinput: created virtual device '{}'", name);
}

UinputSink::~UinputSink() {
    if (uinputFd >= 0) {
        ioctl(uinputFd, UI_DEV_DESTROY);
        close(uinputFd);
        uinputFd = -1;
    }
}

void UinputSink::Emit(uint16_t type, uint16_t code, int32_t value) {
    std::lock_guard<std::mutex> lock(writeMutex);
    Write(type, code, value);
}

void UinputSink::Sync() {
    std::lock_guard<std::mutex> lock(writeMutex);
    Write(EV_SYN, SYN_REPORT, 0);
}

void UinputSink::Write(uint16_t type, uint16_t code, int32_t value) {
    struct input_event ev{};
    gettimeofday(&ev.time, nullptr);
    ev.type = type;
    ev.code = code;
    ev.value = value;

    ssize_t written = write(uinputFd, &ev, sizeof(ev));
    if (written != static_cast<ssize_t>(sizeof(ev))) {
        int err = written < 0 ? errno : EIO;
        throw DeviceWriteError(fmt::format("uinput: write type={} code={} value={} failed: {}",
                                           type, code, value, strerror(err)));
    }
}

} // namespace hotmacro

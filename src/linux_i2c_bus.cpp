#include "linux_i2c_bus.hpp"
#include "errors.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c-dev.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace qmi8658c {

static BusError errnoError(const std::string& what, int err) {
    return BusError(what + ": " + std::strerror(err));
}

// -1 carries errno; anything else is a short transfer.
static BusError transferError(const std::string& what, ssize_t got, size_t wanted) {
    if (got < 0)
        return errnoError(what, errno);
    return BusError(what + ": transferred " + std::to_string(got) +
                    " of " + std::to_string(wanted) + " bytes");
}

LinuxI2CBus::LinuxI2CBus(const std::string& device) : path(device) {
    fd = open(path.c_str(), O_RDWR);
    if (fd < 0) {
        int err = errno;
        throw errnoError("Failed to open I2C device " + path, err);
    }
}

LinuxI2CBus::~LinuxI2CBus() {
    if (fd >= 0) close(fd);
}

void LinuxI2CBus::select(uint8_t address) {
    if (selected == address) return;

    if (ioctl(fd, I2C_SLAVE, address) < 0)
        throw errnoError("Failed to set I2C address", errno);
    selected = address;
}

void LinuxI2CBus::read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) {
    select(address);

    ssize_t n = ::write(fd, &reg, 1);
    if (n != 1)
        throw transferError("I2C write(reg) failed", n, 1);

    n = ::read(fd, buffer, length);
    if (n != (ssize_t)length)
        throw transferError("I2C read failed", n, length);
}

void LinuxI2CBus::write(uint8_t address, uint8_t reg, const uint8_t* data, size_t length) {
    select(address);

    std::vector<uint8_t> buf(length + 1);
    buf[0] = reg;
    if (length > 0)
        std::memcpy(buf.data() + 1, data, length);

    ssize_t n = ::write(fd, buf.data(), buf.size());
    if (n != (ssize_t)buf.size())
        throw transferError("I2C write failed", n, buf.size());
}

} // namespace qmi8658c

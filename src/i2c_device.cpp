#include "i2c_device.hpp"

namespace qmi8658c {

I2CDevice::I2CDevice(I2CBus& bus, uint8_t address) : bus(bus), addr(address) {}

uint8_t I2CDevice::readReg(uint8_t reg) {
    uint8_t value{};
    bus.read(addr, reg, &value, 1);
    return value;
}

void I2CDevice::writeReg(uint8_t reg, uint8_t value) {
    bus.write(addr, reg, &value, 1);
}

void I2CDevice::readBytes(uint8_t reg, uint8_t* buffer, size_t length) {
    bus.read(addr, reg, buffer, length);
}

} // namespace qmi8658c

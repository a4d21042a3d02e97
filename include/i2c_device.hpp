#pragma once
#include "i2c_bus.hpp"
#include <cstdint>
#include <cstddef>

namespace qmi8658c {

// One slave on a shared bus. Does not own the bus.
class I2CDevice {
public:
    I2CDevice(I2CBus& bus, uint8_t address);

    uint8_t readReg(uint8_t reg);
    void writeReg(uint8_t reg, uint8_t value);
    void readBytes(uint8_t reg, uint8_t* buffer, size_t length);

    uint8_t address() const { return addr; }

private:
    I2CBus& bus;
    uint8_t addr;
};

} // namespace qmi8658c

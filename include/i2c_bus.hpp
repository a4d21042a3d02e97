#pragma once
#include <cstddef>
#include <cstdint>

namespace qmi8658c {

// Blocking register transactions addressed to a 7-bit slave.
// Implementations throw BusError on failure.
class I2CBus {
public:
    virtual ~I2CBus() = default;

    virtual void read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) = 0;
    virtual void write(uint8_t address, uint8_t reg, const uint8_t* data, size_t length) = 0;
};

} // namespace qmi8658c

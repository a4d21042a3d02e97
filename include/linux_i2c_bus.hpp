#pragma once
#include "i2c_bus.hpp"
#include <string>

namespace qmi8658c {

class LinuxI2CBus : public I2CBus {
public:
    explicit LinuxI2CBus(const std::string& device = "/dev/i2c-1");
    ~LinuxI2CBus() override;

    LinuxI2CBus(const LinuxI2CBus&) = delete;
    LinuxI2CBus& operator=(const LinuxI2CBus&) = delete;

    void read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) override;
    void write(uint8_t address, uint8_t reg, const uint8_t* data, size_t length) override;

    const std::string& device() const { return path; }

private:
    void select(uint8_t address);

    std::string path;
    int fd{-1};
    int selected{-1};   // address last passed to I2C_SLAVE
};

} // namespace qmi8658c

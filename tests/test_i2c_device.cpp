#include "i2c_device.hpp"
#include "linux_i2c_bus.hpp"
#include "errors.hpp"
#include "fake_i2c_bus.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace qmi8658c;

TEST(I2CDevice, ReadRegUsesItsAddress) {
    FakeI2CBus bus(0x1e);
    bus.regs[0x0F] = 0x3D;
    I2CDevice dev(bus, 0x1e);

    EXPECT_EQ(dev.readReg(0x0F), 0x3D);
    EXPECT_EQ(bus.lastAddress, 0x1e);
    EXPECT_EQ(dev.address(), 0x1e);
}

TEST(I2CDevice, WriteRegWritesOneByte) {
    FakeI2CBus bus;
    I2CDevice dev(bus, 0x6B);

    dev.writeReg(0x20, 0x70);
    ASSERT_EQ(bus.log.size(), 1u);
    EXPECT_EQ(bus.log[0].first, 0x20);
    EXPECT_EQ(bus.log[0].second, 0x70);
}

TEST(I2CDevice, ReadBytesAutoIncrements) {
    FakeI2CBus bus;
    bus.set(0x28, {1, 2, 3, 4});
    I2CDevice dev(bus, 0x6B);

    uint8_t buf[4] = {};
    dev.readBytes(0x28, buf, 4);
    EXPECT_EQ(buf[0], 1);
    EXPECT_EQ(buf[3], 4);
    EXPECT_EQ(bus.reads, 1);
}

TEST(I2CDevice, BusErrorPropagates) {
    FakeI2CBus bus;
    I2CDevice dev(bus, 0x6A);

    EXPECT_THROW(dev.readReg(0x00), BusError);
    EXPECT_THROW(dev.writeReg(0x02, 0x40), BusError);
}

TEST(LinuxI2CBus, MissingDeviceNodeThrowsBusError) {
    EXPECT_THROW(LinuxI2CBus("/dev/does-not-exist-i2c-99"), BusError);
}

TEST(LinuxI2CBus, OpenFailureCarriesErrnoText) {
    try {
        LinuxI2CBus bus("/dev/does-not-exist-i2c-99");
        FAIL() << "expected BusError";
    } catch (const BusError& e) {
        EXPECT_NE(std::string(e.what()).find("No such file or directory"), std::string::npos);
    }
}

TEST(I2CDevice, ReadBytesWrapsAtEndOfRegisterFile) {
    FakeI2CBus bus;
    bus.set(0xFE, {0xAA, 0xBB, 0xCC});
    I2CDevice dev(bus, 0x6B);

    uint8_t buf[3] = {};
    dev.readBytes(0xFE, buf, 3);
    EXPECT_EQ(buf[0], 0xAA);
    EXPECT_EQ(buf[1], 0xBB);
    EXPECT_EQ(buf[2], 0xCC);
    EXPECT_EQ(bus.regs[0x00], 0xCC);
}

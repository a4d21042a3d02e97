#include "qmi8658c.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <thread>

namespace qmi8658c {

static constexpr uint8_t REG_WHO_AM_I = 0x00;
static constexpr uint8_t REG_REVISION_ID = 0x01;

// Control registers
static constexpr uint8_t REG_CTRL1 = 0x02;
static constexpr uint8_t REG_CTRL2 = 0x03;   // accel range [6:4], ODR [3:0]
static constexpr uint8_t REG_CTRL3 = 0x04;   // gyro range [6:4], ODR [3:0]
static constexpr uint8_t REG_CTRL4 = 0x05;
static constexpr uint8_t REG_CTRL5 = 0x06;
static constexpr uint8_t REG_CTRL6 = 0x07;
static constexpr uint8_t REG_CTRL7 = 0x08;

static constexpr uint8_t CTRL1_ADDR_AI = 0x40;   // auto-increment, little-endian
static constexpr uint8_t CTRL7_ACC_EN = 0x01;
static constexpr uint8_t CTRL7_GYRO_EN = 0x02;

// Output registers (little-endian, X/Y/Z)
static constexpr uint8_t REG_TIMESTAMP_L = 0x30;
static constexpr uint8_t REG_TEMP_L = 0x33;
static constexpr uint8_t REG_ACC_X_L = 0x35;
static constexpr uint8_t REG_GYRO_X_L = 0x3B;

static constexpr float FULL_SCALE_COUNTS = 32768.0f;
static constexpr float DEG2RAD = (float)M_PI / 180.0f;

static std::string hexByte(uint8_t value) {
    std::ostringstream os;
    os << "0x" << std::hex << (int)value;
    return os.str();
}

float accRangeG(AccRange range) {
    switch (range) {
        case AccRange::G2:  return 2.0f;
        case AccRange::G4:  return 4.0f;
        case AccRange::G8:  return 8.0f;
        case AccRange::G16: return 16.0f;
    }
    throw InvalidArgumentError("accelerometer range must be an AccRange, got " +
                               hexByte((uint8_t)range));
}

float gyroRangeDps(GyroRange range) {
    switch (range) {
        case GyroRange::DPS16:   return 16.0f;
        case GyroRange::DPS32:   return 32.0f;
        case GyroRange::DPS64:   return 64.0f;
        case GyroRange::DPS128:  return 128.0f;
        case GyroRange::DPS256:  return 256.0f;
        case GyroRange::DPS512:  return 512.0f;
        case GyroRange::DPS1024: return 1024.0f;
        case GyroRange::DPS2048: return 2048.0f;
    }
    throw InvalidArgumentError("gyro range must be a GyroRange, got " +
                               hexByte((uint8_t)range));
}

bool isLowPower(AccRate rate) {
    switch (rate) {
        case AccRate::Hz8000:
        case AccRate::Hz4000:
        case AccRate::Hz2000:
        case AccRate::Hz1000:
        case AccRate::Hz500:
        case AccRate::Hz250:
        case AccRate::Hz125:
        case AccRate::Hz62:
        case AccRate::Hz31:
            return false;
        case AccRate::LowPower128Hz:
        case AccRate::LowPower21Hz:
        case AccRate::LowPower11Hz:
        case AccRate::LowPower3Hz:
            return true;
    }
    throw InvalidArgumentError("accelerometer rate must be an AccRate, got " +
                               hexByte((uint8_t)rate));
}

void validate(GyroRate rate) {
    switch (rate) {
        case GyroRate::Hz8000:
        case GyroRate::Hz4000:
        case GyroRate::Hz2000:
        case GyroRate::Hz1000:
        case GyroRate::Hz500:
        case GyroRate::Hz250:
        case GyroRate::Hz125:
        case GyroRate::Hz62:
        case GyroRate::Hz31:
            return;
    }
    throw InvalidArgumentError("gyro rate must be a GyroRate, got " +
                               hexByte((uint8_t)rate));
}

int16_t QMI8658C::combine(uint8_t lo, uint8_t hi) {
    return (int16_t)((uint16_t)lo | ((uint16_t)hi << 8));
}

QMI8658C::QMI8658C(I2CBus& bus, uint8_t address, std::chrono::milliseconds startupDelay)
    : dev(bus, address), cfg{}, startupDelay(startupDelay) {
    uint8_t who = dev.readReg(REG_WHO_AM_I);
    if (who != CHIP_ID) {
        throw DeviceNotFoundError("Failed to find QMI8658C at " + hexByte(address) +
                                  ": WHO_AM_I " + hexByte(who) +
                                  ", expected " + hexByte(CHIP_ID));
    }

    dev.writeReg(REG_CTRL1, CTRL1_ADDR_AI);

    // +/-8 g at 125 Hz, +/-512 dps at 125 Hz
    writeCtrl2(AccRange::G8, AccRate::Hz125);
    cfg.accRange = AccRange::G8;
    cfg.accRate = AccRate::Hz125;

    writeCtrl3(GyroRange::DPS512, GyroRate::Hz125);
    cfg.gyroRange = GyroRange::DPS512;
    cfg.gyroRate = GyroRate::Hz125;

    // No magnetometer, low-pass filters off, motion on demand off
    dev.writeReg(REG_CTRL4, 0x00);
    dev.writeReg(REG_CTRL5, 0x00);
    dev.writeReg(REG_CTRL6, 0x00);

    writeCtrl7(true, true);
    cfg.accEnabled = true;
    cfg.gyroEnabled = true;
    std::this_thread::sleep_for(startupDelay);
}

std::array<int16_t, 3> QMI8658C::readAxes(uint8_t reg) {
    uint8_t buf[6];
    dev.readBytes(reg, buf, 6);
    return {combine(buf[0], buf[1]), combine(buf[2], buf[3]), combine(buf[4], buf[5])};
}

Vector3 QMI8658C::acceleration() {
    // Scale is taken before the read so a sample always matches its own range.
    const float scale = accRangeG(cfg.accRange) / FULL_SCALE_COUNTS * STANDARD_GRAVITY;
    auto raw = readAxes(REG_ACC_X_L);
    return {raw[0] * scale, raw[1] * scale, raw[2] * scale};
}

Vector3 QMI8658C::gyro() {
    if (!cfg.gyroEnabled)
        throw GyroDisabledError("gyroscope is disabled");

    const float scale = gyroRangeDps(cfg.gyroRange) / FULL_SCALE_COUNTS * DEG2RAD;
    auto raw = readAxes(REG_GYRO_X_L);
    return {raw[0] * scale, raw[1] * scale, raw[2] * scale};
}

float QMI8658C::temperature() {
    uint8_t buf[2];
    dev.readBytes(REG_TEMP_L, buf, 2);
    return combine(buf[0], buf[1]) / 256.0f;
}

uint32_t QMI8658C::timestamp() {
    uint8_t buf[3];
    dev.readBytes(REG_TIMESTAMP_L, buf, 3);
    return (uint32_t)buf[0] | ((uint32_t)buf[1] << 8) | ((uint32_t)buf[2] << 16);
}

std::array<int16_t, 6> QMI8658C::rawAccGyro() {
    uint8_t buf[12];
    dev.readBytes(REG_ACC_X_L, buf, 12);

    std::array<int16_t, 6> out{};
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = combine(buf[2 * i], buf[2 * i + 1]);
    return out;
}

std::array<uint8_t, 12> QMI8658C::rawAccGyroBytes() {
    std::array<uint8_t, 12> out{};
    dev.readBytes(REG_ACC_X_L, out.data(), out.size());
    return out;
}

uint8_t QMI8658C::revisionId() {
    return dev.readReg(REG_REVISION_ID);
}

void QMI8658C::writeCtrl2(AccRange range, AccRate rate) {
    dev.writeReg(REG_CTRL2, (uint8_t)(((uint8_t)range << 4) | (uint8_t)rate));
}

void QMI8658C::writeCtrl3(GyroRange range, GyroRate rate) {
    dev.writeReg(REG_CTRL3, (uint8_t)(((uint8_t)range << 4) | (uint8_t)rate));
}

void QMI8658C::writeCtrl7(bool accEnabled, bool gyroEnabled) {
    uint8_t value = (accEnabled ? CTRL7_ACC_EN : 0) | (gyroEnabled ? CTRL7_GYRO_EN : 0);
    dev.writeReg(REG_CTRL7, value);
}

void QMI8658C::setAccelerometerRange(AccRange range) {
    accRangeG(range);
    writeCtrl2(range, cfg.accRate);
    cfg.accRange = range;
}

void QMI8658C::setGyroRange(GyroRange range) {
    gyroRangeDps(range);
    writeCtrl3(range, cfg.gyroRate);
    cfg.gyroRange = range;
}

void QMI8658C::setFullScaleRanges(AccRange accRange, GyroRange gyroRange) {
    // Validate both before touching the bus
    accRangeG(accRange);
    gyroRangeDps(gyroRange);

    writeCtrl2(accRange, cfg.accRate);
    try {
        writeCtrl3(gyroRange, cfg.gyroRate);
    } catch (const BusError& e) {
        try {
            writeCtrl2(cfg.accRange, cfg.accRate);
        } catch (const BusError& restore) {
            throw BusError(std::string(e.what()) + "; restoring CTRL2 failed: " + restore.what());
        }
        throw;
    }

    cfg.accRange = accRange;
    cfg.gyroRange = gyroRange;
}

void QMI8658C::setAccelerometerRate(AccRate rate) {
    // The gyroscope goes off first so low-power mode never coexists with it.
    const bool disableGyro = isLowPower(rate) && cfg.gyroEnabled;
    if (disableGyro)
        writeCtrl7(cfg.accEnabled, false);

    try {
        writeCtrl2(cfg.accRange, rate);
    } catch (const BusError& e) {
        if (disableGyro) {
            try {
                writeCtrl7(cfg.accEnabled, cfg.gyroEnabled);
            } catch (const BusError& restore) {
                throw BusError(std::string(e.what()) + "; restoring CTRL7 failed: " + restore.what());
            }
        }
        throw;
    }

    if (disableGyro)
        cfg.gyroEnabled = false;
    cfg.accRate = rate;
}

void QMI8658C::setGyroRate(GyroRate rate) {
    validate(rate);
    writeCtrl3(cfg.gyroRange, rate);
    cfg.gyroRate = rate;
}

void QMI8658C::setAccelerometerEnable(bool enabled) {
    writeCtrl7(enabled, cfg.gyroEnabled);
    cfg.accEnabled = enabled;
    if (enabled)
        std::this_thread::sleep_for(startupDelay);
}

void QMI8658C::setGyroEnable(bool enabled) {
    if (enabled && isLowPower(cfg.accRate))
        throw ConfigConflictError("accelerometer low power mode requires the gyroscope disabled");

    writeCtrl7(cfg.accEnabled, enabled);
    cfg.gyroEnabled = enabled;
    if (enabled)
        std::this_thread::sleep_for(startupDelay);
}

} // namespace qmi8658c

#pragma once
#include "i2c_bus.hpp"
#include "i2c_device.hpp"
#include <array>
#include <chrono>
#include <cstdint>

namespace qmi8658c {

constexpr uint8_t DEFAULT_ADDRESS = 0x6B;
constexpr uint8_t ALTERNATE_ADDRESS = 0x6A;
constexpr uint8_t CHIP_ID = 0x05;

constexpr float STANDARD_GRAVITY = 9.80665f;   // m/s^2 per g

// Enum values are the register bit patterns.
enum class AccRange : uint8_t {
    G2 = 0,
    G4 = 1,
    G8 = 2,
    G16 = 3
};

enum class GyroRange : uint8_t {
    DPS16 = 0,
    DPS32 = 1,
    DPS64 = 2,
    DPS128 = 3,
    DPS256 = 4,
    DPS512 = 5,
    DPS1024 = 6,
    DPS2048 = 7
};

// Low-power rates require the gyroscope to be disabled.
enum class AccRate : uint8_t {
    Hz8000 = 0,
    Hz4000 = 1,
    Hz2000 = 2,
    Hz1000 = 3,
    Hz500 = 4,
    Hz250 = 5,
    Hz125 = 6,
    Hz62 = 7,
    Hz31 = 8,
    LowPower128Hz = 12,
    LowPower21Hz = 13,
    LowPower11Hz = 14,
    LowPower3Hz = 15
};

enum class GyroRate : uint8_t {
    Hz8000 = 0,
    Hz4000 = 1,
    Hz2000 = 2,
    Hz1000 = 3,
    Hz500 = 4,
    Hz250 = 5,
    Hz125 = 6,
    Hz62 = 7,
    Hz31 = 8
};

// These throw InvalidArgumentError for values outside the enumeration.
float accRangeG(AccRange range);
float gyroRangeDps(GyroRange range);
bool isLowPower(AccRate rate);
void validate(GyroRate rate);

struct Vector3 {
    float x, y, z;
};

struct SensorConfig {
    AccRange accRange;
    AccRate accRate;
    GyroRange gyroRange;
    GyroRate gyroRate;
    bool accEnabled;
    bool gyroEnabled;
};

class QMI8658C {
public:
    // Throws DeviceNotFoundError if WHO_AM_I does not read CHIP_ID.
    explicit QMI8658C(I2CBus& bus, uint8_t address = DEFAULT_ADDRESS,
                      std::chrono::milliseconds startupDelay = std::chrono::milliseconds(100));

    Vector3 acceleration();          // m/s^2
    Vector3 gyro();                  // rad/s, throws GyroDisabledError
    float temperature();             // degrees C
    uint32_t timestamp();            // 24-bit sample counter
    std::array<int16_t, 6> rawAccGyro();
    std::array<uint8_t, 12> rawAccGyroBytes();   // ACC_X_L..GYR_Z_H as read
    uint8_t revisionId();

    void setAccelerometerRange(AccRange range);
    void setGyroRange(GyroRange range);
    void setFullScaleRanges(AccRange accRange, GyroRange gyroRange);
    void setAccelerometerRate(AccRate rate);
    void setGyroRate(GyroRate rate);
    void setAccelerometerEnable(bool enabled);
    void setGyroEnable(bool enabled);

    AccRange accelerometerRange() const { return cfg.accRange; }
    AccRate accelerometerRate() const { return cfg.accRate; }
    GyroRange gyroRange() const { return cfg.gyroRange; }
    GyroRate gyroRate() const { return cfg.gyroRate; }
    bool accelerometerEnabled() const { return cfg.accEnabled; }
    bool gyroEnabled() const { return cfg.gyroEnabled; }
    const SensorConfig& config() const { return cfg; }
    uint8_t address() const { return dev.address(); }

private:
    std::array<int16_t, 3> readAxes(uint8_t reg);
    void writeCtrl2(AccRange range, AccRate rate);
    void writeCtrl3(GyroRange range, GyroRate rate);
    void writeCtrl7(bool accEnabled, bool gyroEnabled);

    static int16_t combine(uint8_t lo, uint8_t hi);

    I2CDevice dev;
    SensorConfig cfg;
    std::chrono::milliseconds startupDelay;
};

} // namespace qmi8658c

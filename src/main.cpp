#include "linux_i2c_bus.hpp"
#include "qmi8658c.hpp"

#include <iostream>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <unistd.h>

using namespace qmi8658c;

int main(int argc, char** argv) {
    const std::string device = argc > 1 ? argv[1] : "/dev/i2c-1";
    const uint8_t address = argc > 2 ? (uint8_t)std::strtoul(argv[2], nullptr, 0) : DEFAULT_ADDRESS;

    try {
        LinuxI2CBus bus(device);
        QMI8658C sensor(bus, address);

        std::cout << "QMI8658C rev 0x" << std::hex << (int)sensor.revisionId() << std::dec
                  << " on " << device << "\n";
        std::cout << std::fixed << std::setprecision(2);

        while (true) {
            Vector3 ac = sensor.acceleration();
            Vector3 gy = sensor.gyro();

            std::cout << "Acceleration: X:" << ac.x << ", Y:" << ac.y << ", Z:" << ac.z << " m/s^2\n"
                      << "Gyro X:" << gy.x << ", Y:" << gy.y << ", Z:" << gy.z << " rad/s\n"
                      << "Temperature: " << sensor.temperature() << " C\n"
                      << "Timestamp: " << sensor.timestamp() << "\n";

            sleep(1);
        }
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}

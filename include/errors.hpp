#pragma once
#include <stdexcept>
#include <string>

namespace qmi8658c {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Transport failure; never retried.
class BusError : public Error {
public:
    using Error::Error;
};

// WHO_AM_I did not match at construction.
class DeviceNotFoundError : public Error {
public:
    using Error::Error;
};

class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

// Accelerometer low-power mode and gyroscope enable are mutually exclusive.
class ConfigConflictError : public Error {
public:
    using Error::Error;
};

class GyroDisabledError : public Error {
public:
    using Error::Error;
};

} // namespace qmi8658c

#pragma once

#include <stdexcept>
#include <string>

/// Thrown by start/terminate/kill once a supervised process has been killed
class KilledProcessError : public std::runtime_error {
public:
    explicit KilledProcessError(const std::string& name)
        : std::runtime_error("Process '" + name + "' has already been killed") {}
};

/// Thrown when a command could not be launched (fork, setpgid or exec failed)
class SpawnError : public std::runtime_error {
public:
    explicit SpawnError(const std::string& msg)
        : std::runtime_error(msg) {}
};

#pragma once

#include <stdexcept>
#include <string>

namespace autoviz {

class AutovizError : public std::runtime_error {
public:
    explicit AutovizError(const std::string& message) : std::runtime_error(message) {}
};

// Caller handed the core something it cannot work with: empty table,
// unknown column, duplicate column, misaligned rows
class InputError : public AutovizError {
public:
    explicit InputError(const std::string& message) : AutovizError("Input error: " + message) {}
};

}  // namespace autoviz

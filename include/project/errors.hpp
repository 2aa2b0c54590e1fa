#pragma once

#include <stdexcept>
#include <string>

namespace pith::project {

// Structural fault: unknown attribute, bad control file, failing configure hook.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

}

#include "filefuse/environment.h"

#include <cstdlib>

namespace filefuse {

std::optional<std::string> getEnv(std::string_view key) {
    if (key.empty()) {
        return std::nullopt;
    }
    const auto *value = std::getenv(std::string(key).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue) {
    auto value = getEnv(key);
    if (!value.has_value() || value->empty()) {
        return std::string(defaultValue);
    }
    return *value;
}

}  // namespace filefuse

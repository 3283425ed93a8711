#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace filefuse {

std::optional<std::string> getEnv(std::string_view key);
// Unset and empty variables both yield the default.
std::string getEnvOrDefault(std::string_view key, std::string_view defaultValue);

}  // namespace filefuse

#include "tnsprobe/utils/env.hpp"

#include <cstdlib>
#include <cstring>

extern char** environ;

namespace tnsprobe::utils {

std::optional<std::string> getenv_os(const std::string& key) {
    std::string os_key = key;
    if (key == "HOME" && std::getenv("HOME") == nullptr) {
        os_key = "USERPROFILE"; // WindowsのHOME相当
    }
    const char* value = std::getenv(os_key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::pair<std::string, std::string>> environment_with_prefix(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> out;
    if (environ == nullptr) return out;
    for (char** p = environ; *p != nullptr; ++p) {
        const char* entry = *p;
        if (std::strncmp(entry, prefix.c_str(), prefix.size()) != 0) continue;
        const char* eq = std::strchr(entry, '=');
        if (eq == nullptr) continue;
        out.emplace_back(std::string(entry, eq), std::string(eq + 1));
    }
    return out;
}

} // namespace tnsprobe::utils

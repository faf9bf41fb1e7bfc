#include "tnsprobe/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>

#include "tnsprobe/utils/env.hpp"

namespace tnsprobe::utils {

bool ConfigLoader::load_from_file(const std::string& file_path) {
    std::ifstream ifs(file_path);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return load_from_string(ss.str());
}

bool ConfigLoader::load_from_string(const std::string& content) {
    std::istringstream in(content);
    std::string line;
    bool ok = true;
    while (std::getline(in, line)) {
        std::string t = config_utils::trim(line);
        if (t.empty() || t[0] == '#') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            // 不正な行はスキップして続行する
            ok = false;
            continue;
        }
        std::string key = config_utils::trim(t.substr(0, eq));
        std::string value = config_utils::trim(t.substr(eq + 1));
        if (key.empty()) {
            ok = false;
            continue;
        }
        set(key, value);
    }
    return ok;
}

size_t ConfigLoader::load_from_environment(const std::string& prefix) {
    size_t n = 0;
    for (const auto& [name, value] : environment_with_prefix(prefix)) {
        std::string key = config_utils::env_var_to_key(name, prefix);
        if (key.empty()) continue;
        set(key, value);
        ++n;
    }
    return n;
}

size_t ConfigLoader::load_from_command_line(int argc, const char* const argv[]) {
    size_t n = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            positional_.push_back(a);
            continue;
        }
        auto eq = a.find('=');
        if (eq == std::string::npos) {
            set(a.substr(2), std::string("true"));
        } else {
            set(a.substr(2, eq - 2), a.substr(eq + 1));
        }
        ++n;
    }
    return n;
}

std::optional<ConfigValue> ConfigLoader::find_value(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    auto it = config_data_.find(key);
    if (it == config_data_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* s = std::get_if<std::string>(&*v)) return *s;
    if (auto* i = std::get_if<int64_t>(&*v)) return std::to_string(*i);
    if (auto* b = std::get_if<bool>(&*v)) return *b ? "true" : "false";
    return def;
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i;
    if (auto* s = std::get_if<std::string>(&*v)) {
        // 10進 または 0x 付き16進
        std::string_view sv(*s);
        int base = 10;
        if (sv.size() > 2 && sv[0] == '0' && (sv[1] == 'x' || sv[1] == 'X')) {
            sv.remove_prefix(2);
            base = 16;
        }
        int64_t out = 0;
        auto [p, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out, base);
        if (ec == std::errc{} && p == sv.data() + sv.size() && !sv.empty()) return out;
    }
    return def;
}

bool ConfigLoader::get_bool(const std::string& key, bool def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* b = std::get_if<bool>(&*v)) return *b;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i != 0;
    if (auto* s = std::get_if<std::string>(&*v)) {
        if (auto parsed = config_utils::parse_bool(*s)) return *parsed;
    }
    return def;
}

void ConfigLoader::set(const std::string& key, ConfigValue value) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_[key] = std::move(value);
}

bool ConfigLoader::has(const std::string& key) const { return find_value(key).has_value(); }

bool ConfigLoader::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return config_data_.erase(key) > 0;
}

void ConfigLoader::clear() {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_.clear();
    positional_.clear();
}

std::vector<std::string> ConfigLoader::get_all_keys() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    std::vector<std::string> keys;
    keys.reserve(config_data_.size());
    for (const auto& [k, _] : config_data_) keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& d) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : d) config_data_[k] = v;
}

std::string ConfigLoader::get_debug_info() const {
    std::ostringstream ss;
    ss << "config_keys=" << get_all_keys().size();
    for (const auto& k : get_all_keys()) ss << ' ' << k << '=' << get_string(k);
    return ss.str();
}

namespace config_utils {

std::string normalize_env_var_name(const std::string& key, const std::string& prefix) {
    std::string r = prefix;
    for (char c : key) {
        r += (c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return r;
}

std::string env_var_to_key(const std::string& env_var_name, const std::string& prefix) {
    if (env_var_name.rfind(prefix, 0) != 0) return {};
    std::string r;
    for (char c : env_var_name.substr(prefix.size())) {
        r += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return r;
}

std::optional<bool> parse_bool(const std::string& str) {
    std::string s;
    for (char c : str) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

std::string trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto b = std::find_if_not(str.begin(), str.end(), is_space);
    auto e = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return b < e ? std::string(b, e) : std::string();
}

} // namespace config_utils

} // namespace tnsprobe::utils

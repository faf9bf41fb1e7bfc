#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tnsprobe::utils {

// OSごとの環境変数名の違いを吸収するgetenvラッパー
std::optional<std::string> getenv_os(const std::string& key);

// prefix で始まる環境変数を (名前, 値) で列挙する
std::vector<std::pair<std::string, std::string>> environment_with_prefix(const std::string& prefix);

} // namespace tnsprobe::utils

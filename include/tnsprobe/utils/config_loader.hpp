#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tnsprobe::utils {

/**
 * @brief 設定値の型
 *
 * ファイル・環境変数・コマンドラインから読んだ値は文字列のまま保持し、
 * get_int / get_bool で取り出すときに変換する。
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    bool
>;

/**
 * @brief 設定ローダー
 *
 * 後から読み込んだ値が先の値を上書きする。想定する順序は
 * load_defaults -> load_from_file -> load_from_environment -> load_from_command_line。
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief key=value 形式のファイルを読み込む
     * @param file_path ファイルパス
     * @return 開けなかった場合、または不正な行があった場合 false
     *
     * 空行と '#' で始まる行は無視する。キーと値の前後の空白は取り除く。
     */
    bool load_from_file(const std::string& file_path);

    /**
     * @brief key=value 形式の文字列を読み込む（load_from_file と同じ書式）
     */
    bool load_from_string(const std::string& content);

    /**
     * @brief 環境変数を読み込む
     * @param prefix 例: "TNSPROBE_"。TNSPROBE_TIMEOUT_MS は timeout_ms になる
     * @return 読み込んだ件数
     */
    size_t load_from_environment(const std::string& prefix = "TNSPROBE_");

    /**
     * @brief --key=value 形式の引数を読み込む
     * @return 読み込んだ件数
     *
     * 値なしの --key は "true" として扱う。それ以外の引数は positional_args() に残る。
     */
    size_t load_from_command_line(int argc, const char* const argv[]);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

    void set(const std::string& key, ConfigValue value);
    bool has(const std::string& key) const;
    bool remove(const std::string& key);
    void clear();

    std::vector<std::string> get_all_keys() const;
    const std::vector<std::string>& positional_args() const { return positional_; }

    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    std::string get_debug_info() const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;
    std::vector<std::string> positional_;

    std::optional<ConfigValue> find_value(const std::string& key) const;
};

namespace config_utils {
    /**
     * @brief 設定キーを環境変数名に変換 ("timeout_ms" -> "TNSPROBE_TIMEOUT_MS")
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "TNSPROBE_");

    /**
     * @brief 環境変数名を設定キーに変換 ("TNSPROBE_LOG_LEVEL" -> "log_level")
     *
     * prefix を取り除き、英字を小文字にする。
     */
    std::string env_var_to_key(const std::string& env_var_name, const std::string& prefix = "TNSPROBE_");

    /**
     * @brief 真偽値の解析（1/true/yes/on、大文字小文字は無視）
     */
    std::optional<bool> parse_bool(const std::string& str);

    std::string trim(const std::string& str);
}

} // namespace tnsprobe::utils

// File: src/utils/ConfigManager.cpp

#include "ConfigManager.hpp"
#include "LoggingSystem/LogMacros.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

extern char** environ;

namespace datasync {
namespace utils {

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// 移除成对的引号
std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

// ==================== ConfigManager::Builder 实现 ====================

ConfigManager::Builder& ConfigManager::Builder::add_file(const std::string& filepath, bool optional) {
    ConfigSource source;
    source.format = ConfigFormat::KEY_VALUE;
    source.source = filepath;
    source.priority = next_priority_++;
    source.optional = optional;
    sources_.push_back(source);
    return *this;
}

ConfigManager::Builder& ConfigManager::Builder::add_env_vars(const std::string& prefix) {
    ConfigSource source;
    source.format = ConfigFormat::ENV_VARS;
    source.source = prefix;
    source.priority = next_priority_++;
    sources_.push_back(source);
    return *this;
}

ConfigManager::Builder& ConfigManager::Builder::add_command_line(int argc, char* argv[], const std::string& prefix) {
    ConfigSource source;
    source.format = ConfigFormat::COMMAND_LINE;
    source.source = prefix;
    source.priority = next_priority_++;
    for (int i = 1; i < argc; ++i) {
        source.arguments.emplace_back(argv[i]);
    }
    sources_.push_back(source);
    return *this;
}

ConfigManager::Builder& ConfigManager::Builder::set_default(const std::string& key, const ConfigValue& value) {
    defaults_[key] = value;
    return *this;
}

ConfigManager::Builder& ConfigManager::Builder::on_error(ErrorCallback callback) {
    error_callback_ = std::move(callback);
    return *this;
}

std::shared_ptr<ConfigManager> ConfigManager::Builder::build() {
    auto manager = std::shared_ptr<ConfigManager>(new ConfigManager());
    manager->sources_ = sources_;
    manager->defaults_ = defaults_;
    manager->error_callback_ = error_callback_;

    std::stable_sort(manager->sources_.begin(), manager->sources_.end(),
                     [](const ConfigSource& a, const ConfigSource& b) {
                         return a.priority < b.priority;
                     });
    return manager;
}

// ==================== ConfigManager 静态方法 ====================

ConfigManager::Builder ConfigManager::create() {
    return Builder();
}

std::shared_ptr<ConfigManager> ConfigManager::load_default() {
    auto manager = Builder()
        .add_file("datasync.conf")
        .add_env_vars("DATASYNC_")
        .build();
    manager->load();
    return manager;
}

// ==================== ConfigManager 实现 ====================

bool ConfigManager::load() {
    bool ok = true;
    size_t total_keys = 0;
    std::vector<std::pair<std::string, std::error_code>> errors;
    {
        std::unique_lock<std::shared_mutex> lock(config_mutex_);
        config_map_.clear();
        pending_errors_.clear();

        for (const auto& source : sources_) {
            if (!load_source(source) && !source.optional) {
                ok = false;
                pending_errors_.emplace_back("Failed to load config source: " + source.source,
                                             std::make_error_code(std::errc::io_error));
            }
        }
        total_keys = config_map_.size();
        errors.swap(pending_errors_);
    }

    // 回调可能回读配置，必须在锁外报告
    for (const auto& error : errors) {
        report_error(error.first, error.second);
    }
    LOG_DEBUG("CONFIG", "Loaded " + std::to_string(total_keys) + " keys from " +
                        std::to_string(sources_.size()) + " sources");
    return ok;
}

bool ConfigManager::load_source(const ConfigSource& source) {
    switch (source.format) {
        case ConfigFormat::KEY_VALUE:
            return load_file(source.source);
        case ConfigFormat::ENV_VARS:
            load_from_env(source.source);
            return true;
        case ConfigFormat::COMMAND_LINE:
            load_from_arguments(source.arguments, source.source);
            return true;
    }
    return false;
}

bool ConfigManager::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        // 跳过空行和注释
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            pending_errors_.emplace_back("Ignoring malformed config line in " + path + ": " + line,
                                         std::make_error_code(std::errc::invalid_argument));
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = unquote(trim(line.substr(eq_pos + 1)));

        if (!key.empty()) {
            config_map_[key] = parse_value(value);
        }
    }
    return true;
}

size_t ConfigManager::load_from_env(const std::string& prefix) {
    size_t count = 0;
    if (environ == nullptr) {
        return 0;
    }

    for (char** env = environ; *env != nullptr; ++env) {
        std::string env_str(*env);
        const auto eq_pos = env_str.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = env_str.substr(0, eq_pos);
        if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string config_key = to_lower(key.substr(prefix.size()));
        std::replace(config_key.begin(), config_key.end(), '_', '.');
        config_map_[config_key] = ConfigValue(env_str.substr(eq_pos + 1));
        count++;
    }
    return count;
}

size_t ConfigManager::load_from_arguments(const std::vector<std::string>& args, const std::string& prefix) {
    size_t count = 0;
    for (const auto& arg : args) {
        if (arg.size() <= prefix.size() || arg.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        const std::string key_value = arg.substr(prefix.size());
        const auto eq_pos = key_value.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key = key_value.substr(0, eq_pos);
        std::replace(key.begin(), key.end(), '-', '.');
        config_map_[key] = ConfigValue(key_value.substr(eq_pos + 1));
        count++;
    }
    return count;
}

bool ConfigManager::merge_key_value(const std::string& content) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, eq_pos));
        if (!key.empty()) {
            config_map_[key] = parse_value(unquote(trim(line.substr(eq_pos + 1))));
        }
    }
    return true;
}

std::optional<ConfigValue> ConfigManager::get_value(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);

    auto it = config_map_.find(key);
    if (it != config_map_.end()) {
        return it->second;
    }

    auto default_it = defaults_.find(key);
    if (default_it != defaults_.end()) {
        return default_it->second;
    }
    return std::nullopt;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get<std::string>(key);
    return value ? *value : default_value;
}

bool ConfigManager::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_map_.count(key) > 0 || defaults_.count(key) > 0;
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_map_[key] = value;
}

bool ConfigManager::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    return config_map_.erase(key) > 0;
}

std::vector<std::string> ConfigManager::keys() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    std::map<std::string, bool> merged;
    for (const auto& pair : defaults_) {
        merged[pair.first] = true;
    }
    for (const auto& pair : config_map_) {
        merged[pair.first] = true;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& pair : merged) {
        result.push_back(pair.first);
    }
    return result;
}

std::string ConfigManager::export_to_string() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    std::map<std::string, ConfigValue> merged = defaults_;
    for (const auto& pair : config_map_) {
        merged[pair.first] = pair.second;
    }

    std::ostringstream oss;
    for (const auto& pair : merged) {
        oss << pair.first << " = " << value_to_string(pair.second) << "\n";
    }
    return oss.str();
}

void ConfigManager::report_error(const std::string& message, const std::error_code& ec) const {
    LOG_ERROR("CONFIG", message);
    if (error_callback_) {
        error_callback_(message, ec);
    }
}

ConfigValue ConfigManager::parse_value(const std::string& str) {
    const std::string lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on") {
        return ConfigValue(true);
    }
    if (lower == "false" || lower == "no" || lower == "off") {
        return ConfigValue(false);
    }

    // 整数或浮点数，必须整串都能解析
    if (!str.empty()) {
        char* end = nullptr;
        const long long as_int = std::strtoll(str.c_str(), &end, 10);
        if (end != nullptr && *end == '\0') {
            return ConfigValue(static_cast<int64_t>(as_int));
        }
        const double as_double = std::strtod(str.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            return ConfigValue(as_double);
        }
    }
    return ConfigValue(str);
}

std::string ConfigManager::value_to_string(const ConfigValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + v + "\"";
        } else if constexpr (std::is_arithmetic_v<T>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else {
            return "";
        }
    }, value);
}

// ==================== 类型转换特化 ====================

template<>
std::optional<bool> ConfigManager::get<bool>(const std::string& key) const {
    auto value = get_value(key);
    if (!value) return std::nullopt;
    if (auto p = std::get_if<bool>(&*value)) return *p;
    if (auto p = std::get_if<int64_t>(&*value)) return *p != 0;
    if (auto p = std::get_if<std::string>(&*value)) {
        auto parsed = parse_value(*p);
        if (auto b = std::get_if<bool>(&parsed)) return *b;
        if (auto i = std::get_if<int64_t>(&parsed)) return *i != 0;
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigManager::get<int64_t>(const std::string& key) const {
    auto value = get_value(key);
    if (!value) return std::nullopt;
    if (auto p = std::get_if<int64_t>(&*value)) return *p;
    if (auto p = std::get_if<double>(&*value)) return static_cast<int64_t>(*p);
    if (auto p = std::get_if<std::string>(&*value)) {
        auto parsed = parse_value(*p);
        if (auto i = std::get_if<int64_t>(&parsed)) return *i;
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigManager::get<double>(const std::string& key) const {
    auto value = get_value(key);
    if (!value) return std::nullopt;
    if (auto p = std::get_if<double>(&*value)) return *p;
    if (auto p = std::get_if<int64_t>(&*value)) return static_cast<double>(*p);
    if (auto p = std::get_if<std::string>(&*value)) {
        auto parsed = parse_value(*p);
        if (auto d = std::get_if<double>(&parsed)) return *d;
        if (auto i = std::get_if<int64_t>(&parsed)) return static_cast<double>(*i);
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigManager::get<std::string>(const std::string& key) const {
    auto value = get_value(key);
    if (!value) return std::nullopt;
    if (auto p = std::get_if<std::string>(&*value)) return *p;
    if (std::holds_alternative<std::monostate>(*value)) return std::nullopt;
    std::string s = value_to_string(*value);
    return s;
}

} // namespace utils
} // namespace datasync

#ifndef DATASYNC_CONFIG_MANAGER_HPP
#define DATASYNC_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace datasync {
namespace utils {

// 配置值类型
using ConfigValue = std::variant<
    std::monostate,        // 未设置
    bool,                  // 布尔值
    int64_t,               // 整数
    double,                // 浮点数
    std::string            // 字符串（环境变量、命令行取值的原始形式）
>;

// 配置格式
enum class ConfigFormat {
    KEY_VALUE,      // 键值对文件：key = value
    ENV_VARS,       // 环境变量
    COMMAND_LINE    // 命令行参数 --key=value
};

// 配置来源
struct ConfigSource {
    ConfigFormat format;
    std::string source;        // 文件路径或环境变量前缀
    int priority = 0;          // 加载顺序（数值小的先加载，后加载的覆盖先加载的）
    bool optional = true;      // 缺失时是否视为错误
    std::vector<std::string> arguments; // COMMAND_LINE 使用
};

/**
 * @brief 分层配置管理器
 * @details 依次合并 默认值 -> 键值文件 -> 环境变量 -> 命令行，后者覆盖前者。
 *          读取是线程安全的；加载后通常只读。
 */
class ConfigManager {
public:
    using ErrorCallback = std::function<void(const std::string&, const std::error_code&)>;

    // 构建器
    class Builder {
    public:
        Builder& add_file(const std::string& filepath, bool optional = true);
        // DATASYNC_LOCK_TIMEOUT_MS -> lock.timeout.ms
        Builder& add_env_vars(const std::string& prefix = "DATASYNC_");
        Builder& add_command_line(int argc, char* argv[], const std::string& prefix = "--");
        Builder& set_default(const std::string& key, const ConfigValue& value);
        Builder& on_error(ErrorCallback callback);
        std::shared_ptr<ConfigManager> build();

    private:
        std::vector<ConfigSource> sources_;
        std::map<std::string, ConfigValue> defaults_;
        ErrorCallback error_callback_;
        int next_priority_ = 0;
    };

    static Builder create();

    /**
     * @brief 默认加载：环境变量 + 当前目录的 datasync.conf（可选）
     */
    static std::shared_ptr<ConfigManager> load_default();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // 加载全部来源；任何非可选来源失败时返回 false（其余来源仍会加载）
    bool load();

    // 类型安全访问
    template<typename T>
    std::optional<T> get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    std::optional<ConfigValue> get_value(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    bool has(const std::string& key) const;

    // 运行期覆盖
    void set(const std::string& key, const ConfigValue& value);
    bool remove(const std::string& key);

    std::vector<std::string> keys() const;

    // 以键值格式导出
    std::string export_to_string() const;

    // 解析一段键值格式文本并合并
    bool merge_key_value(const std::string& content);

private:
    ConfigManager() = default;

    bool load_source(const ConfigSource& source);
    bool load_file(const std::string& path);
    size_t load_from_env(const std::string& prefix);
    size_t load_from_arguments(const std::vector<std::string>& args, const std::string& prefix);
    void report_error(const std::string& message, const std::error_code& ec = {}) const;

    static ConfigValue parse_value(const std::string& str);
    static std::string value_to_string(const ConfigValue& value);

    std::map<std::string, ConfigValue> config_map_;
    std::map<std::string, ConfigValue> defaults_;
    std::vector<ConfigSource> sources_;
    ErrorCallback error_callback_;
    // load() 期间收集，解锁后统一报告
    std::vector<std::pair<std::string, std::error_code>> pending_errors_;

    mutable std::shared_mutex config_mutex_;
};

// 类型转换：字符串来源（环境变量/命令行）按目标类型解析
template<> std::optional<bool> ConfigManager::get<bool>(const std::string& key) const;
template<> std::optional<int64_t> ConfigManager::get<int64_t>(const std::string& key) const;
template<> std::optional<double> ConfigManager::get<double>(const std::string& key) const;
template<> std::optional<std::string> ConfigManager::get<std::string>(const std::string& key) const;

} // namespace utils
} // namespace datasync

#endif // DATASYNC_CONFIG_MANAGER_HPP

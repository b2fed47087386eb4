// File: src/transaction/include/LockKey.hpp
// 键到等待图节点标识的映射
#pragma once

#include "Transaction.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

namespace datasync {
namespace transaction {

/**
 * NodeIdentity - 键 -> ResourceID 的单射映射
 *
 * 不同的键必须得到不同的标识，否则两个键会共用一把锁。
 * 主模板不提供定义：没有特化的键类型在编译期报错，
 * 不会退化为任意的文本转换。
 */
template<typename Key, typename Enable = void>
struct NodeIdentity;

// 有符号整数
template<typename Key>
struct NodeIdentity<Key, std::enable_if_t<std::is_integral<Key>::value && std::is_signed<Key>::value>> {
    static ResourceID of(Key key) {
        return "i:" + std::to_string(static_cast<long long>(key));
    }
};

// 无符号整数（含 bool、size_t）
template<typename Key>
struct NodeIdentity<Key, std::enable_if_t<std::is_integral<Key>::value && !std::is_signed<Key>::value>> {
    static ResourceID of(Key key) {
        return "u:" + std::to_string(static_cast<unsigned long long>(key));
    }
};

// 字符串：长度前缀，"s3:abc"
template<>
struct NodeIdentity<std::string, void> {
    static ResourceID of(const std::string& key) {
        return "s" + std::to_string(key.size()) + ":" + key;
    }
};

/**
 * DataSourceKey - 复合键：数据源 + 数据源内的键
 */
template<typename K>
struct DataSourceKey {
    std::string data_source;
    K key;

    DataSourceKey() = default;
    DataSourceKey(std::string source, K k)
        : data_source(std::move(source)), key(std::move(k)) {}

    bool operator==(const DataSourceKey& other) const {
        return data_source == other.data_source && key == other.key;
    }
    bool operator!=(const DataSourceKey& other) const {
        return !(*this == other);
    }
};

// 数据源名长度前缀 + 内层键的标识："d5:users/u:42"
template<typename K>
struct NodeIdentity<DataSourceKey<K>, void> {
    static ResourceID of(const DataSourceKey<K>& key) {
        return "d" + std::to_string(key.data_source.size()) + ":" + key.data_source + "/" +
               NodeIdentity<K>::of(key.key);
    }
};

} // namespace transaction
} // namespace datasync

namespace std {

template<typename K>
struct hash<datasync::transaction::DataSourceKey<K>> {
    size_t operator()(const datasync::transaction::DataSourceKey<K>& k) const noexcept {
        size_t h = std::hash<std::string>()(k.data_source);
        // boost::hash_combine
        h ^= std::hash<K>()(k.key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std

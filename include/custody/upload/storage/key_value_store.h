/**
 * @file key_value_store.h
 * @brief Persistent key-value collaborator and its in-memory implementation
 */

#ifndef CUSTODY_UPLOAD_STORAGE_KEY_VALUE_STORE_H
#define CUSTODY_UPLOAD_STORAGE_KEY_VALUE_STORE_H

#include <custody/upload/core/types.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace custody::upload {

/**
 * @brief Durable string storage keyed by string
 */
class key_value_store {
public:
    virtual ~key_value_store() = default;

    /**
     * @brief Read a value
     * @return std::nullopt when the key is absent, or an error on I/O failure
     */
    virtual auto get(const std::string& key) -> result<std::optional<std::string>> = 0;

    virtual auto set(const std::string& key, const std::string& value) -> result<void> = 0;

    /**
     * @brief Remove a value; removing an absent key succeeds
     */
    virtual auto remove(const std::string& key) -> result<void> = 0;
};

/**
 * @brief Thread-safe store kept in process memory
 */
class memory_key_value_store : public key_value_store {
public:
    auto get(const std::string& key) -> result<std::optional<std::string>> override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::optional<std::string>{};
        }
        return std::optional<std::string>{it->second};
    }

    auto set(const std::string& key, const std::string& value) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
        return {};
    }

    auto remove(const std::string& key) -> result<void> override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.erase(key);
        return {};
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_STORAGE_KEY_VALUE_STORE_H

/**
 * @file file_key_value_store.h
 * @brief File-backed key-value store for session snapshots
 */

#ifndef CUSTODY_UPLOAD_STORAGE_FILE_KEY_VALUE_STORE_H
#define CUSTODY_UPLOAD_STORAGE_FILE_KEY_VALUE_STORE_H

#include <custody/upload/storage/key_value_store.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief Configuration for file_key_value_store
 */
struct file_store_config {
    /// Directory holding one file per key
    std::filesystem::path directory;

    /// Appended to each encoded key
    std::string extension = ".json";

    file_store_config();
    explicit file_store_config(std::filesystem::path dir);
};

/**
 * @brief Stores each key in its own file
 *
 * Keys are percent-encoded into file names. Writes go to a temporary file
 * that is renamed over the target, so a crash never leaves a torn value.
 * Values are cached after the first read.
 *
 * @code
 * file_key_value_store store(file_store_config{"/var/lib/capture/upload_state"});
 * auto saved = store.set("upload_state_cap-1", json);
 * @endcode
 */
class file_key_value_store : public key_value_store {
public:
    explicit file_key_value_store(const file_store_config& config = file_store_config{});
    ~file_key_value_store() override;

    file_key_value_store(const file_key_value_store&) = delete;
    auto operator=(const file_key_value_store&) -> file_key_value_store& = delete;
    file_key_value_store(file_key_value_store&&) noexcept;
    auto operator=(file_key_value_store&&) noexcept -> file_key_value_store&;

    [[nodiscard]] auto get(const std::string& key)
        -> result<std::optional<std::string>> override;

    [[nodiscard]] auto set(const std::string& key, const std::string& value)
        -> result<void> override;

    [[nodiscard]] auto remove(const std::string& key) -> result<void> override;

    /**
     * @brief Keys currently present on disk
     */
    [[nodiscard]] auto list_keys() const -> std::vector<std::string>;

    /**
     * @brief Path of the file that holds a key
     */
    [[nodiscard]] auto path_for(const std::string& key) const -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const file_store_config&;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_STORAGE_FILE_KEY_VALUE_STORE_H

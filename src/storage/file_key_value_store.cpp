/**
 * @file file_key_value_store.cpp
 * @brief Implementation of the file-backed key-value store
 */

#include <custody/upload/storage/file_key_value_store.h>

#include <custody/upload/core/logging.h>

#include <cctype>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <unordered_map>

namespace custody::upload {

// ============================================================================
// file_store_config implementation
// ============================================================================

file_store_config::file_store_config()
    : directory(std::filesystem::temp_directory_path() / "custody_upload_state") {}

file_store_config::file_store_config(std::filesystem::path dir)
    : directory(std::move(dir)) {}

namespace {

auto encode_key(const std::string& key) -> std::string {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2)
                << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

auto decode_key(const std::string& name) -> std::string {
    std::string key;
    key.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '%' && i + 2 < name.size() &&
            std::isxdigit(static_cast<unsigned char>(name[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(name[i + 2]))) {
            key += static_cast<char>(std::stoi(name.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            key += name[i];
        }
    }
    return key;
}

}  // namespace

// ============================================================================
// file_key_value_store::impl
// ============================================================================

class file_key_value_store::impl {
public:
    explicit impl(const file_store_config& cfg) : config_(cfg) {
        std::error_code ec;
        std::filesystem::create_directories(config_.directory, ec);
        if (ec) {
            CU_LOG_WARN(log_category::state,
                        "Failed to create state directory: " + config_.directory.string() +
                            " (" + ec.message() + ")");
        }
    }

    auto path_for(const std::string& key) const -> std::filesystem::path {
        return config_.directory / (encode_key(key) + config_.extension);
    }

    auto get(const std::string& key) -> result<std::optional<std::string>> {
        {
            std::shared_lock lock(mutex_);
            auto it = cache_.find(key);
            if (it != cache_.end()) {
                return std::optional<std::string>{it->second};
            }
        }

        std::unique_lock lock(mutex_);
        auto path = path_for(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::optional<std::string>{};
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            CU_LOG_ERROR(log_category::state, "Failed to open state file: " + path.string());
            return unexpected{error{error_code::state_store_failure,
                                    "failed to open state file: " + path.string()}};
        }

        std::ostringstream oss;
        oss << file.rdbuf();
        auto value = oss.str();
        cache_[key] = value;

        CU_LOG_TRACE(log_category::state, "State loaded from: " + path.string());
        return std::optional<std::string>{std::move(value)};
    }

    auto set(const std::string& key, const std::string& value) -> result<void> {
        std::unique_lock lock(mutex_);

        auto path = path_for(key);
        auto tmp_path = path;
        tmp_path += ".tmp";

        {
            std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                CU_LOG_ERROR(log_category::state,
                             "Failed to open state file for writing: " + tmp_path.string());
                return unexpected{error{error_code::state_store_failure,
                                        "failed to open state file for writing"}};
            }
            file << value;
            file.flush();
            if (!file) {
                CU_LOG_ERROR(log_category::state, "Failed to write state file: " + tmp_path.string());
                return unexpected{error{error_code::state_store_failure,
                                        "failed to write state file"}};
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            CU_LOG_ERROR(log_category::state,
                         "Failed to replace state file: " + path.string() + " (" + ec.message() + ")");
            return unexpected{error{error_code::state_store_failure,
                                    "failed to replace state file: " + ec.message()}};
        }

        cache_[key] = value;
        CU_LOG_TRACE(log_category::state, "State persisted to: " + path.string());
        return {};
    }

    auto remove(const std::string& key) -> result<void> {
        std::unique_lock lock(mutex_);

        cache_.erase(key);

        auto path = path_for(key);
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            CU_LOG_ERROR(log_category::state,
                         "Failed to delete state file: " + path.string() + " (" + ec.message() + ")");
            return unexpected{error{error_code::state_store_failure,
                                    "failed to delete state file: " + ec.message()}};
        }
        return {};
    }

    auto list_keys() const -> std::vector<std::string> {
        std::shared_lock lock(mutex_);

        std::vector<std::string> keys;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(config_.directory, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            auto name = entry.path().filename().string();
            if (name.size() <= config_.extension.size() ||
                name.compare(name.size() - config_.extension.size(),
                             config_.extension.size(), config_.extension) != 0) {
                continue;
            }
            keys.push_back(decode_key(name.substr(0, name.size() - config_.extension.size())));
        }
        return keys;
    }

    auto config() const -> const file_store_config& { return config_; }

private:
    file_store_config config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> cache_;
};

// ============================================================================
// file_key_value_store
// ============================================================================

file_key_value_store::file_key_value_store(const file_store_config& config)
    : impl_(std::make_unique<impl>(config)) {}

file_key_value_store::~file_key_value_store() = default;

file_key_value_store::file_key_value_store(file_key_value_store&&) noexcept = default;

auto file_key_value_store::operator=(file_key_value_store&&) noexcept
    -> file_key_value_store& = default;

auto file_key_value_store::get(const std::string& key) -> result<std::optional<std::string>> {
    return impl_->get(key);
}

auto file_key_value_store::set(const std::string& key, const std::string& value)
    -> result<void> {
    return impl_->set(key, value);
}

auto file_key_value_store::remove(const std::string& key) -> result<void> {
    return impl_->remove(key);
}

auto file_key_value_store::list_keys() const -> std::vector<std::string> {
    return impl_->list_keys();
}

auto file_key_value_store::path_for(const std::string& key) const -> std::filesystem::path {
    return impl_->path_for(key);
}

auto file_key_value_store::config() const -> const file_store_config& {
    return impl_->config();
}

}  // namespace custody::upload

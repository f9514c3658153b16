/**
 * @file chunk_chain.cpp
 * @brief Implementation of the unit hash chain and Merkle root
 */

#include <custody/upload/core/chunk_chain.h>

#include <custody/upload/core/checksum.h>
#include <custody/upload/core/logging.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace custody::upload {

namespace {

auto iso8601_now() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

// ============================================================================
// chunk_chain
// ============================================================================

auto chunk_chain::append(uint64_t index, std::span<const std::byte> data)
    -> result<chain_entry> {
    if (index != entries_.size()) {
        return unexpected{error{error_code::chain_sequence_error,
                                "Unit index out of sequence: expected " +
                                    std::to_string(entries_.size()) + ", got " +
                                    std::to_string(index)}};
    }

    chain_entry entry;
    entry.index = index;
    entry.hash = checksum::sha256(data);
    entry.previous_hash = last_hash();
    entry.size_bytes = data.size();
    entry.timestamp = iso8601_now();

    total_size_ += entry.size_bytes;
    entries_.push_back(entry);

    CU_LOG_TRACE(log_category::accumulator,
                 "Chained unit " + std::to_string(index) + " (" +
                     std::to_string(entry.size_bytes) + " bytes)");
    return entry;
}

auto chunk_chain::verify_integrity() const -> bool {
    return verify(entries_);
}

auto chunk_chain::verify(const std::vector<chain_entry>& entries) -> bool {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (entry.index != i) {
            return false;
        }
        if (i == 0) {
            if (entry.previous_hash.has_value()) {
                return false;
            }
            continue;
        }
        if (entry.previous_hash != entries[i - 1].hash) {
            return false;
        }
    }
    return true;
}

auto chunk_chain::merkle_root() const -> result<std::string> {
    std::vector<std::string> leaves;
    leaves.reserve(entries_.size());
    for (const auto& entry : entries_) {
        leaves.push_back(entry.hash);
    }
    return compute_merkle_root(leaves);
}

auto chunk_chain::last_hash() const -> std::optional<std::string> {
    if (entries_.empty()) {
        return std::nullopt;
    }
    return entries_.back().hash;
}

void chunk_chain::clear() {
    entries_.clear();
    total_size_ = 0;
}

// ============================================================================
// Merkle root
// ============================================================================

auto compute_merkle_root(const std::vector<std::string>& leaves) -> result<std::string> {
    if (leaves.empty()) {
        return unexpected{error{error_code::empty_chain, "No leaves to build a Merkle root"}};
    }

    std::vector<std::string> level;
    level.reserve(leaves.size() + 1);
    for (const auto& leaf : leaves) {
        if (!checksum::is_sha256_hex(leaf)) {
            return unexpected{error{error_code::invalid_hash,
                                    "Invalid SHA-256 leaf: " + leaf}};
        }
        level.push_back(to_lower(leaf));
    }

    if (level.size() > 1 && level.size() % 2 != 0) {
        level.push_back(checksum::sha256(std::string_view(merkle_null_leaf_marker)));
    }

    while (level.size() > 1) {
        std::vector<std::string> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            const auto& left = level[i];
            const auto& right = (i + 1 < level.size()) ? level[i + 1] : left;
            next.push_back(checksum::sha256(left + right));
        }
        level = std::move(next);
    }

    return level.front();
}

}  // namespace custody::upload

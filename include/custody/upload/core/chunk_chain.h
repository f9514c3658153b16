/**
 * @file chunk_chain.h
 * @brief Hash-chained capture units and Merkle root calculation
 */

#ifndef CUSTODY_UPLOAD_CORE_CHUNK_CHAIN_H
#define CUSTODY_UPLOAD_CORE_CHUNK_CHAIN_H

#include <custody/upload/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief Manifest record of one captured unit
 */
struct chain_entry {
    uint64_t index = 0;
    std::string hash;
    std::optional<std::string> previous_hash;
    uint64_t size_bytes = 0;
    std::string timestamp;
};

/**
 * @brief Producer-side chain of custody for captured units
 *
 * Each appended unit is hashed with SHA-256 and linked to the hash of the
 * unit before it. Indices are 0-based and must arrive in order. The first
 * unit has no previous hash.
 *
 * @code
 * chunk_chain chain;
 * auto entry = chain.append(0, bytes);
 * session.add_unit(bytes, entry.value().hash, entry.value().previous_hash);
 * @endcode
 */
class chunk_chain {
public:
    chunk_chain() = default;

    /**
     * @brief Hash a unit and link it to the chain
     * @param index Expected to equal size()
     * @param data Unit bytes
     * @return The new manifest entry, or chain_sequence_error
     */
    [[nodiscard]] auto append(uint64_t index, std::span<const std::byte> data)
        -> result<chain_entry>;

    /**
     * @brief Check that every entry links to its predecessor
     */
    [[nodiscard]] auto verify_integrity() const -> bool;

    /**
     * @brief Check an externally supplied manifest
     */
    [[nodiscard]] static auto verify(const std::vector<chain_entry>& entries) -> bool;

    /**
     * @brief Merkle root over all unit hashes
     */
    [[nodiscard]] auto merkle_root() const -> result<std::string>;

    [[nodiscard]] auto manifest() const -> const std::vector<chain_entry>& { return entries_; }
    [[nodiscard]] auto last_hash() const -> std::optional<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto total_size() const -> uint64_t { return total_size_; }

    void clear();

private:
    std::vector<chain_entry> entries_;
    uint64_t total_size_ = 0;
};

/**
 * @brief Marker hashed to produce the padding leaf of a Merkle tree
 */
inline constexpr const char* merkle_null_leaf_marker = "CUSTODY_MERKLE_NULL_LEAF";

/**
 * @brief Compute a Merkle root over SHA-256 hex leaves
 *
 * Leaves are lowercased. A tree with an odd number of leaves (more than one)
 * is padded with SHA-256(merkle_null_leaf_marker). Parents are
 * SHA-256(left_hex + right_hex); an odd level duplicates its last node.
 *
 * @param leaves 64-character hex hashes
 * @return Root hash, empty_chain for no leaves, invalid_hash for a bad leaf
 */
[[nodiscard]] auto compute_merkle_root(const std::vector<std::string>& leaves)
    -> result<std::string>;

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_CORE_CHUNK_CHAIN_H

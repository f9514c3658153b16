/**
 * @file chunk_accumulator.h
 * @brief Buffers captured units until a transferable part size is reached
 */

#ifndef CUSTODY_UPLOAD_SESSION_CHUNK_ACCUMULATOR_H
#define CUSTODY_UPLOAD_SESSION_CHUNK_ACCUMULATOR_H

#include <custody/upload/core/types.h>
#include <custody/upload/session/upload_types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace custody::upload {

/**
 * @brief A flushed buffer ready for transfer
 */
struct assembled_block {
    /// Concatenation of every unit's bytes, in arrival order
    std::vector<std::byte> data;

    /// SHA-256 hex of data
    std::string content_hash;

    /// Previous-unit hash of the first unit in the block
    std::optional<std::string> previous_unit_hash;

    std::size_t unit_count = 0;
};

/**
 * @brief Ordered buffer of pending units
 *
 * Not synchronized; the owning session guards it with its state mutex.
 */
class chunk_accumulator {
public:
    explicit chunk_accumulator(std::size_t threshold = min_part_size);

    /**
     * @brief Append a unit and grow the buffered size
     */
    void add(pending_unit unit);

    /**
     * @brief Check whether buffered bytes reached the flush threshold
     */
    [[nodiscard]] auto threshold_reached() const -> bool;

    /**
     * @brief Take every buffered unit, leaving the buffer empty
     */
    [[nodiscard]] auto drain() -> std::vector<pending_unit>;

    void clear();

    [[nodiscard]] auto empty() const -> bool { return units_.empty(); }
    [[nodiscard]] auto unit_count() const -> std::size_t { return units_.size(); }
    [[nodiscard]] auto buffered_bytes() const -> std::size_t { return buffered_bytes_; }
    [[nodiscard]] auto threshold() const -> std::size_t { return threshold_; }

    /**
     * @brief Concatenate units into one block and hash the result
     *
     * The block hash covers the concatenated bytes. It is never derived from
     * the individual unit hashes.
     */
    [[nodiscard]] static auto assemble(std::vector<pending_unit> units)
        -> result<assembled_block>;

private:
    std::size_t threshold_;
    std::vector<pending_unit> units_;
    std::size_t buffered_bytes_ = 0;
};

}  // namespace custody::upload

#endif  // CUSTODY_UPLOAD_SESSION_CHUNK_ACCUMULATOR_H

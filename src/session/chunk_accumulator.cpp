/**
 * @file chunk_accumulator.cpp
 * @brief Implementation of the pending unit buffer
 */

#include <custody/upload/session/chunk_accumulator.h>

#include <custody/upload/core/checksum.h>

#include <utility>

namespace custody::upload {

chunk_accumulator::chunk_accumulator(std::size_t threshold) : threshold_(threshold) {}

void chunk_accumulator::add(pending_unit unit) {
    buffered_bytes_ += unit.data.size();
    units_.push_back(std::move(unit));
}

auto chunk_accumulator::threshold_reached() const -> bool {
    return !units_.empty() && buffered_bytes_ >= threshold_;
}

auto chunk_accumulator::drain() -> std::vector<pending_unit> {
    std::vector<pending_unit> drained;
    drained.swap(units_);
    buffered_bytes_ = 0;
    return drained;
}

void chunk_accumulator::clear() {
    units_.clear();
    buffered_bytes_ = 0;
}

auto chunk_accumulator::assemble(std::vector<pending_unit> units) -> result<assembled_block> {
    if (units.empty()) {
        return unexpected{error{error_code::internal_error, "No units to assemble"}};
    }

    std::size_t total = 0;
    for (const auto& unit : units) {
        total += unit.data.size();
    }

    assembled_block block;
    block.previous_unit_hash = units.front().previous_unit_hash;
    block.unit_count = units.size();
    block.data.reserve(total);

    sha256_hasher hasher;
    for (auto& unit : units) {
        auto updated = hasher.update(unit.data);
        if (!updated) {
            return unexpected{updated.error()};
        }
        block.data.insert(block.data.end(), unit.data.begin(), unit.data.end());
        std::vector<std::byte>().swap(unit.data);
    }

    auto digest = hasher.finalize();
    if (!digest) {
        return unexpected{digest.error()};
    }
    block.content_hash = std::move(digest.value());
    return block;
}

}  // namespace custody::upload

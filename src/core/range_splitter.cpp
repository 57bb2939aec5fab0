/**
 * @file range_splitter.cpp
 * @brief Implementation of byte-range splitting
 */

#include <kcenon/transfer_engine/core/range_splitter.h>

#include <algorithm>

namespace kcenon::transfer_engine {

range_splitter::range_splitter(const range_split_policy& policy) : policy_(policy) {}

auto range_splitter::component_count_for(uint64_t object_size) const -> uint64_t {
    if (object_size == 0 || object_size < policy_.threshold) {
        return 1;
    }
    auto by_min_size = std::max<uint64_t>(1, object_size / policy_.min_component_size);
    return std::min<uint64_t>(policy_.component_count, by_min_size);
}

auto range_splitter::should_split(uint64_t object_size) const -> bool {
    return component_count_for(object_size) > 1;
}

auto range_splitter::split(uint64_t object_size) const -> std::vector<byte_range> {
    std::vector<byte_range> ranges;
    auto count = component_count_for(object_size);
    if (count <= 1) {
        return ranges;
    }

    auto component_size = (object_size + count - 1) / count;
    ranges.reserve(static_cast<std::size_t>(count));
    for (uint64_t start = 0; start < object_size; start += component_size) {
        ranges.emplace_back(start, std::min(start + component_size, object_size));
    }
    return ranges;
}

auto range_splitter::policy() const -> const range_split_policy& {
    return policy_;
}

}  // namespace kcenon::transfer_engine

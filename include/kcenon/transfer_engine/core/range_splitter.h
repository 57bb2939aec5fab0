/**
 * @file range_splitter.h
 * @brief Splitting of large objects into byte-range transfer units
 */

#ifndef KCENON_TRANSFER_ENGINE_CORE_RANGE_SPLITTER_H
#define KCENON_TRANSFER_ENGINE_CORE_RANGE_SPLITTER_H

#include <kcenon/transfer_engine/core/transfer_unit.h>
#include <kcenon/transfer_engine/core/types.h>

#include <cstdint>
#include <vector>

namespace kcenon::transfer_engine {

/**
 * @brief Policy for sliced transfers of large objects
 */
struct range_split_policy {
    /// Objects at or above this size are split (150MiB)
    static constexpr uint64_t default_threshold = 150ULL * 1024 * 1024;

    /// Default number of components per object
    static constexpr uint32_t default_component_count = 4;

    /// Components are never smaller than this (8MiB)
    static constexpr uint64_t default_min_component_size = 8ULL * 1024 * 1024;

    uint64_t threshold = default_threshold;
    uint32_t component_count = default_component_count;
    uint64_t min_component_size = default_min_component_size;

    range_split_policy() = default;

    range_split_policy(uint64_t threshold_bytes, uint32_t components)
        : threshold(threshold_bytes), component_count(components) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (threshold == 0) {
            return unexpected(
                error(error_code::invalid_configuration, "split threshold must be positive"));
        }
        if (component_count == 0) {
            return unexpected(
                error(error_code::invalid_configuration, "component count must be positive"));
        }
        if (min_component_size == 0) {
            return unexpected(error(error_code::invalid_configuration,
                                    "minimum component size must be positive"));
        }
        return {};
    }
};

/**
 * @brief Splits an object into equal, contiguous byte ranges
 *
 * @code
 * range_split_policy policy{100, 4};
 * policy.min_component_size = 1;
 * range_splitter splitter(policy);
 * auto ranges = splitter.split(400);  // [0,100) [100,200) [200,300) [300,400)
 * @endcode
 */
class range_splitter {
public:
    range_splitter() = default;

    explicit range_splitter(const range_split_policy& policy);

    /**
     * @brief Check if an object of this size is split at all
     */
    [[nodiscard]] auto should_split(uint64_t object_size) const -> bool;

    /**
     * @brief Compute the component ranges of an object
     * @return Ranges covering [0, object_size) in order, or an empty vector
     *         when the object stays whole
     */
    [[nodiscard]] auto split(uint64_t object_size) const -> std::vector<byte_range>;

    [[nodiscard]] auto policy() const -> const range_split_policy&;

private:
    [[nodiscard]] auto component_count_for(uint64_t object_size) const -> uint64_t;

    range_split_policy policy_;
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_CORE_RANGE_SPLITTER_H

/**
 * @file transfer_engine.h
 * @brief Main header for transfer_engine_system library
 * @version 0.1.0
 *
 * This is the primary include file for the transfer_engine_system library.
 * Include this header to access all transfer engine functionality.
 *
 * @code
 * #include <kcenon/transfer_engine/transfer_engine.h>
 *
 * using namespace kcenon::transfer_engine;
 *
 * auto coordinator = batch_coordinator::builder(
 *         std::make_shared<local_storage_backend>(),
 *         std::make_shared<local_storage_backend>())
 *     .with_max_concurrency(8)
 *     .with_manifest("copy.csv")
 *     .build();
 * @endcode
 */

#ifndef KCENON_TRANSFER_ENGINE_TRANSFER_ENGINE_H
#define KCENON_TRANSFER_ENGINE_TRANSFER_ENGINE_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/transfer_engine/core/types.h"
#include "kcenon/transfer_engine/core/transfer_unit.h"
#include "kcenon/transfer_engine/core/checksum.h"
#include "kcenon/transfer_engine/core/logging.h"
#include "kcenon/transfer_engine/core/range_splitter.h"
#include "kcenon/transfer_engine/core/unit_runner.h"

// Backends
#include "kcenon/transfer_engine/backend/storage_backend.h"
#include "kcenon/transfer_engine/backend/local_storage_backend.h"
#include "kcenon/transfer_engine/backend/memory_storage_backend.h"

// Batch pipeline
#include "kcenon/transfer_engine/manifest/manifest_store.h"
#include "kcenon/transfer_engine/progress/progress_reporter.h"
#include "kcenon/transfer_engine/executor/task_executor.h"
#include "kcenon/transfer_engine/batch/batch_coordinator.h"

// Adapters
#include "kcenon/transfer_engine/adapters/thread_pool_adapter.h"

namespace kcenon::transfer_engine {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::transfer_engine

#endif  // KCENON_TRANSFER_ENGINE_TRANSFER_ENGINE_H

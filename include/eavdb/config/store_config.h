#pragma once

#include <eavdb/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>

#include <spdlog/common.h>

namespace eavdb::config {

/**
 * @brief Settings for one entity store instance
 *
 * Loaded from the [store] section of a TOML file:
 * @code
 * [store]
 * path = "~/data/ents.db"
 * busy_timeout_ms = 5000
 * wal = true
 * table_prefix = "app_"
 * log_level = "info"
 * @endcode
 */
struct StoreConfig {
    std::string dbPath = ":memory:";
    std::chrono::milliseconds busyTimeout{5000};
    bool enableWAL = false;
    std::string tablePrefix;
    spdlog::level::level_enum logLevel = spdlog::level::info;
};

/**
 * @brief Load a StoreConfig, keeping defaults for keys that are absent
 *
 * Fails with FileNotFound when the file does not exist and InvalidArgument
 * when a present key cannot be parsed.
 */
Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath);

} // namespace eavdb::config

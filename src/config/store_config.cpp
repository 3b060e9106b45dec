#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <eavdb/config/config_helpers.h>
#include <eavdb/config/store_config.h>

namespace eavdb::config {

namespace {
constexpr const char* kSection = "store";
} // namespace

Result<StoreConfig> loadStoreConfig(const std::filesystem::path& configPath) {
    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + configPath.string()};
    }

    StoreConfig cfg;

    if (auto path = parse_config_value(configPath, kSection, "path"); !path.empty()) {
        cfg.dbPath = expand_tilde(path).string();
    }

    if (auto raw = parse_config_value(configPath, kSection, "busy_timeout_ms"); !raw.empty()) {
        auto timeout = parse_ms(raw);
        if (!timeout) {
            return Error{ErrorCode::InvalidArgument, "Invalid busy_timeout_ms: " + raw};
        }
        cfg.busyTimeout = *timeout;
    }

    if (auto raw = parse_config_value(configPath, kSection, "wal"); !raw.empty()) {
        auto wal = parse_bool(raw);
        if (!wal) {
            return Error{ErrorCode::InvalidArgument, "Invalid wal flag: " + raw};
        }
        cfg.enableWAL = *wal;
    }

    cfg.tablePrefix = parse_config_value(configPath, kSection, "table_prefix");
    // Spliced into identifiers
    if (!std::all_of(cfg.tablePrefix.begin(), cfg.tablePrefix.end(), [](unsigned char ch) {
            return std::isalnum(ch) || ch == '_';
        })) {
        return Error{ErrorCode::InvalidArgument, "Invalid table_prefix: " + cfg.tablePrefix};
    }

    if (auto raw = parse_config_value(configPath, kSection, "log_level"); !raw.empty()) {
        auto level = spdlog::level::from_str(raw);
        // from_str maps unknown names to off
        if (level == spdlog::level::off && raw != "off") {
            return Error{ErrorCode::InvalidArgument, "Invalid log_level: " + raw};
        }
        cfg.logLevel = level;
    }

    return cfg;
}

} // namespace eavdb::config

#include <charconv>
#include <fstream>
#include <eavdb/config/config_helpers.h>

namespace eavdb::config {

std::optional<std::chrono::milliseconds> parse_ms(std::string_view s) {
    std::string text(s);
    trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || value < 0) {
        return std::nullopt;
    }

    // Optional unit suffix: ms (default), s, m
    std::string_view unit(ptr, static_cast<size_t>(text.data() + text.size() - ptr));
    if (unit.empty() || unit == "ms") {
        return std::chrono::milliseconds(value);
    }
    if (unit == "s") {
        return std::chrono::milliseconds(value * 1000);
    }
    if (unit == "m") {
        return std::chrono::milliseconds(value * 60 * 1000);
    }
    return std::nullopt;
}

std::optional<bool> parse_bool(std::string_view s) {
    std::string text(s);
    trim(text);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    return std::nullopt;
}

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        if (!in_target_section) {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Inline comments only outside quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            size_t closing = v.find(v.front(), 1);
            if (closing != std::string::npos) {
                v = v.substr(0, closing + 1);
            }
        }

        if (k == key) {
            return unquote(v);
        }
    }

    return "";
}

} // namespace eavdb::config

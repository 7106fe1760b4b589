#include "settings.hpp"
#include "../utils.hpp"

#include <sstream>

namespace rdinit {

static bool parse_seconds(const std::string& key, const std::string& value, unsigned* out) {
    auto parsed = parse_unsigned(value);
    if (!parsed || *parsed > UINT32_MAX) {
        LOGW("settings: invalid %s=%s", key.c_str(), value.c_str());
        return false;
    }
    *out = static_cast<unsigned>(*parsed);
    return true;
}

Settings Settings::load_default() {
    return Settings{};
}

Settings Settings::from_string(const std::string& content) {
    Settings settings;

    std::istringstream iss(content);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOGW("settings: line %d has no '=': %s", lineno, line.c_str());
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        if (key == "device_timeout") {
            parse_seconds(key, value, &settings.device_timeout);
        } else if (key == "network_timeout") {
            parse_seconds(key, value, &settings.network_timeout);
        } else if (key == "settle_seconds") {
            parse_seconds(key, value, &settings.settle_seconds);
        } else if (key == "toram_headroom_mb") {
            parse_seconds(key, value, &settings.toram_headroom_mb);
        } else if (key == "overlay_size") {
            auto size = parse_size(value);
            if (size) {
                settings.overlay_size = *size;
            } else {
                LOGW("settings: invalid overlay_size=%s", value.c_str());
            }
        } else if (key == "modules") {
            settings.modules.clear();
            for (const auto& module : split(value, ',')) {
                std::string name = trim(module);
                if (!name.empty())
                    settings.modules.push_back(name);
            }
        } else if (key == "rescue_shell") {
            if (!value.empty())
                settings.rescue_shell = value;
        } else if (key == "log_level") {
            if (!log_parse_level(value, &settings.log_level)) {
                LOGW("settings: invalid log_level=%s", value.c_str());
            }
        } else {
            LOGW("settings: unknown key '%s'", key.c_str());
        }
    }

    return settings;
}

Settings Settings::from_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        LOGD("settings: %s not present, using defaults", path.c_str());
        return load_default();
    }
    return from_string(*content);
}

}  // namespace rdinit

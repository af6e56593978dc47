// ==============================================================================
// config.cpp - Конфигурация (YAML)
// ==============================================================================

#include <auditview/config.hpp>
#include <auditview/platform.hpp>
#include <yaml-cpp/yaml.h>

namespace auditview::config {

namespace {

/// Ошибка с именем ключа вместо сообщения yaml-cpp "bad conversion"
struct KeyError {
    std::string message;
};

template <typename T>
void read_value(const YAML::Node& parent, const char* section, const char* key, T& out) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw KeyError{std::string("invalid value for '") + section + "." + key + "'"};
    }
}

void read_columns(const YAML::Node& display, std::vector<Column>& out) {
    const YAML::Node node = display["columns"];
    if (!node || node.IsNull()) {
        return;
    }

    std::string list;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                throw KeyError{"invalid value for 'display.columns'"};
            }
            if (!list.empty()) {
                list += ',';
            }
            list += item.as<std::string>();
        }
    } else if (node.IsScalar()) {
        list = node.as<std::string>();
    } else {
        throw KeyError{"invalid value for 'display.columns'"};
    }

    auto columns = parse_columns(list);
    if (!columns || columns->empty()) {
        throw KeyError{"unknown column in 'display.columns': " + list};
    }
    out = std::move(*columns);
}

void apply(const YAML::Node& root, Config& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw KeyError{"configuration root must be a mapping"};
    }

    if (const YAML::Node geo = root["geo"]) {
        if (!geo.IsMap()) {
            throw KeyError{"'geo' must be a mapping"};
        }
        read_value(geo, "geo", "enabled", config.geo.enabled);
        read_value(geo, "geo", "endpoint", config.geo.endpoint);
        read_value(geo, "geo", "timeout_ms", config.geo.timeout_ms);
        if (config.geo.timeout_ms < 0) {
            throw KeyError{"invalid value for 'geo.timeout_ms'"};
        }
    }

    if (const YAML::Node display = root["display"]) {
        if (!display.IsMap()) {
            throw KeyError{"'display' must be a mapping"};
        }
        read_columns(display, config.display.columns);
        read_value(display, "display", "column_width", config.display.column_width);
        read_value(display, "display", "max_rule_ids", config.display.max_rule_ids);
        read_value(display, "display", "newest_first", config.display.newest_first);
    }
}

}  // anonymous namespace

ConfigResult parse_config(std::string_view text) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::Load(std::string(text));
        apply(root, result.config);
        result.ok = true;
    } catch (const KeyError& e) {
        result.error = e.message;
    } catch (const YAML::Exception& e) {
        result.error = e.what();
    }
    return result;
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::LoadFile(platform::path_to_utf8(path));
        apply(root, result.config);
        result.config.source = path;
        result.ok = true;
    } catch (const KeyError& e) {
        result.error = platform::path_to_utf8(path) + ": " + e.message;
    } catch (const YAML::BadFile&) {
        result.error = "could not open configuration file '" + platform::path_to_utf8(path) + "'";
    } catch (const YAML::Exception& e) {
        result.error = platform::path_to_utf8(path) + ": " + e.what();
    }
    return result;
}

ConfigResult resolve_config(const std::optional<std::filesystem::path>& explicit_path,
                            const std::filesystem::path& search_dir) {
    if (explicit_path) {
        return load_config(*explicit_path);
    }

    std::error_code ec;
    auto candidate = search_dir / kDefaultConfigFile;
    if (std::filesystem::is_regular_file(candidate, ec)) {
        return load_config(candidate);
    }

    ConfigResult result;
    result.ok = true;
    return result;
}

}  // namespace auditview::config

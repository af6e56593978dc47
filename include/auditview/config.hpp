// ==============================================================================
// auditview/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Чтение auditview.yml (yaml-cpp)
// - Значения по умолчанию для всех ключей
// - Неизвестные ключи игнорируются, неверный тип значения: ошибка
//
// Формат:
// @code
//   geo:
//     enabled: true
//     endpoint: http://ip-api.com/json
//     timeout_ms: 5000
//   display:
//     columns: [id, timestamp, domain, address, status, rules]
//     column_width: 40
//     max_rule_ids: 3
//     newest_first: false
// @endcode
//
// ==============================================================================

#ifndef AUDITVIEW_CONFIG_HPP
#define AUDITVIEW_CONFIG_HPP

#include <auditview/audit.hpp>
#include <auditview/geo.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditview::config {

/// Имя файла, который ищется в текущем каталоге
constexpr const char* kDefaultConfigFile = "auditview.yml";

struct GeoConfig {
    bool enabled = true;
    std::string endpoint = geo::kDefaultEndpoint;
    long timeout_ms = 5000;
};

struct DisplayConfig {
    std::vector<Column> columns = default_columns();
    /// Максимальная ширина колонки таблицы; 0: без ограничения
    std::size_t column_width = 40;
    std::size_t max_rule_ids = 3;
    bool newest_first = false;
};

struct Config {
    GeoConfig geo;
    DisplayConfig display;
    /// Откуда загружена конфигурация (nullopt: значения по умолчанию)
    std::optional<std::filesystem::path> source;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML из строки
ConfigResult parse_config(std::string_view text);

/// Загрузить файл конфигурации
ConfigResult load_config(const std::filesystem::path& path);

/// Явный путь (--config) обязан существовать; без него используется
/// auditview.yml из каталога search_dir, если он есть, иначе значения по умолчанию.
ConfigResult resolve_config(const std::optional<std::filesystem::path>& explicit_path,
                            const std::filesystem::path& search_dir = ".");

}  // namespace auditview::config

#endif  // AUDITVIEW_CONFIG_HPP

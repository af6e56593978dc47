// ==============================================================================
// auditview/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef AUDITVIEW_CLI_HPP
#define AUDITVIEW_CLI_HPP

#include <auditview/audit.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace auditview::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;                       // --no-banner
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // --config
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// list - таблица транзакций
struct ListCommand {
    std::filesystem::path path;
    std::optional<std::string> search;                // -s, --search
    std::optional<std::vector<Column>> columns;       // --columns
    std::optional<Timestamp> from;                    // --from
    std::optional<Timestamp> to;                      // --to
    std::optional<std::uint32_t> column_width;        // -w, --column-width
    std::optional<std::size_t> max_rule_ids;          // --max-rule-ids
    bool newest_first = false;                        // --newest-first
    bool full = false;                                // -F, --full
};

/// show - одна транзакция целиком
struct ShowCommand {
    std::filesystem::path path;
    std::string audit_id;
    std::optional<bool> ip_api;  // --ip-api <BOOL>, --no-ip-api
    bool json = false;           // -j, --json
};

/// dump - экспорт транзакций
struct DumpCommand {
    std::filesystem::path path;
    std::optional<std::string> search;            // -s, --search
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    bool sections = false;                        // --sections
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// geo - геолокация адресов
struct GeoCommand {
    std::vector<std::string> addresses;
};

/// browse - построчный интерактивный просмотр
struct BrowseCommand {
    std::filesystem::path path;
    std::optional<bool> ip_api;
    std::optional<std::size_t> page_size;  // --page-size
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<ListCommand, ShowCommand, DumpCommand, GeoCommand, BrowseCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

/// Разобрать метку времени из командной строки: ISO 8601 или формат аудит-лога
std::optional<Timestamp> parse_time_argument(std::string_view text);

/// "true"/"false"/"yes"/"no"/"1"/"0"
std::optional<bool> parse_bool_argument(std::string_view text);

constexpr const char* VERSION = "0.3.0";

constexpr const char* ABOUT = "Index, search and inspect ModSecurity serial audit logs";

}  // namespace auditview::cli

#endif  // AUDITVIEW_CLI_HPP

// ==============================================================================
// auditview/audit.hpp - Модель транзакций аудит-лога и извлечение полей
// ==============================================================================
//
// Назначение:
// - Timestamp: момент времени в UTC (метка из секции A)
// - AuditEntry: одна секция транзакции (буква + содержимое)
// - AuditGroup: одна транзакция с извлечёнными полями
// - GroupIndex: упорядоченный набор транзакций в порядке появления в файле
// - Field Extractor: позиционное извлечение полей из секций A/B/F/H
// - Column: проекции полей группы для табличного вывода
//
// Формат секций (serial audit log):
//   --<id>-A--   [timestamp] unique-id src-addr src-port dst-addr dst-port
//   --<id>-B--   request line + request headers
//   --<id>-C--   request body
//   --<id>-F--   response status line + response headers
//   --<id>-H--   audit trail (сообщения движка правил)
//   --<id>-Z--   конец транзакции (пустое тело)
//
// ==============================================================================

#ifndef AUDITVIEW_AUDIT_HPP
#define AUDITVIEW_AUDIT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditview {

// ----------------------------------------------------------------------------
// Timestamp: дата и время в UTC
// ----------------------------------------------------------------------------

/// Момент времени без timezone (всегда UTC)
struct Timestamp {
    int year = 0;
    int month = 1;        // 1-12
    int day = 1;          // 1-31
    int hour = 0;         // 0-23
    int minute = 0;       // 0-59
    int second = 0;       // 0-59
    int microsecond = 0;  // 0-999999

    /// Парсить метку аудит-лога: "19/Oct/2026:18:52:07 +0200"
    /// Смещение применяется, результат нормализуется к UTC.
    /// Также принимает дробные секунды: "19/Oct/2026:18:52:07.123456 +0200"
    static std::optional<Timestamp> parse_log(std::string_view str);

    /// Парсить ISO 8601: %Y-%m-%dT%H:%M:%S[.f][Z] или с пробелом вместо 'T'
    static std::optional<Timestamp> parse_iso(std::string_view str);

    bool operator<(const Timestamp& other) const;
    bool operator<=(const Timestamp& other) const;
    bool operator>(const Timestamp& other) const;
    bool operator>=(const Timestamp& other) const;
    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }

    /// ISO 8601: "2026-10-19T16:52:07Z" (микросекунды только если ненулевые)
    std::string to_string() const;

    /// Для таблиц: "2026-10-19 16:52:07"
    std::string to_display_string() const;
};

// ----------------------------------------------------------------------------
// Секции
// ----------------------------------------------------------------------------

/// Буквы секций, которые разбирает Field Extractor
namespace section {
constexpr char kMetadata = 'A';
constexpr char kRequestHeaders = 'B';
constexpr char kRequestBody = 'C';
constexpr char kResponseHeaders = 'F';
constexpr char kAuditTrail = 'H';
constexpr char kTerminal = 'Z';
}  // namespace section

/// Секция A..Z распознаётся как буква секции
bool is_section_letter(char c);

/// Человекочитаемое имя секции ("request headers", ...)
const char* section_name(char letter);

/// Одна секция транзакции. Неизменяема после захвата.
struct AuditEntry {
    char letter = '\0';
    /// Строки секции без завершающих \r, каждая с '\n' в конце
    std::string content;
};

// ----------------------------------------------------------------------------
// AuditGroup: транзакция
// ----------------------------------------------------------------------------

/// Значение host по умолчанию, если заголовок Host отсутствует
constexpr const char* kUnknownHost = "unknown";

/// Значение адреса клиента, если секция A отсутствует или повреждена
constexpr const char* kUnknownAddress = "0.0.0.0";

struct AuditGroup {
    /// Boundary id из маркеров секций
    std::string transaction_id;
    std::optional<Timestamp> timestamp;
    std::string client_address = kUnknownAddress;
    std::string host = kUnknownHost;
    std::optional<std::uint16_t> status;
    /// Порядок срабатывания, без дубликатов
    std::vector<std::string> rule_ids;

    // Дополнительные поля метаданных (секции A/H)
    std::optional<std::string> unique_id;
    std::optional<std::uint16_t> client_port;
    std::optional<std::string> server_address;
    std::optional<std::uint16_t> server_port;
    std::optional<std::string> rule_file;

    /// Секции в порядке появления; последняя: всегда Z
    std::vector<AuditEntry> sections;

    /// Найти первую секцию с буквой (nullptr если нет)
    const AuditEntry* find_section(char letter) const;
};

/// Сводка по проходу разбора
struct IngestStats {
    std::uint64_t bytes = 0;
    std::uint64_t lines = 0;
    std::uint64_t sections = 0;
    std::uint64_t transactions = 0;
    /// Транзакции без закрывающего маркера Z (отброшены)
    std::uint64_t incomplete_discarded = 0;
};

/// Упорядоченный набор транзакций. Порядок: порядок появления в файле.
/// После построения не изменяется; refresh создаёт новый индекс.
struct GroupIndex {
    std::vector<AuditGroup> groups;
    IngestStats stats;

    std::size_t size() const { return groups.size(); }
    bool empty() const { return groups.empty(); }
    const AuditGroup& operator[](std::size_t pos) const { return groups[pos]; }
    std::vector<AuditGroup>::const_iterator begin() const { return groups.begin(); }
    std::vector<AuditGroup>::const_iterator end() const { return groups.end(); }

    /// Позиция транзакции по boundary id
    std::optional<std::size_t> find(std::string_view transaction_id) const;
};

/// Позиции в GroupIndex, прошедшие фильтр; порядок: порядок индекса
using FilteredView = std::vector<std::size_t>;

// ----------------------------------------------------------------------------
// Field Extractor
// ----------------------------------------------------------------------------
//
// Поля секций берутся по фиксированным позициям, а не поиском по шаблону:
// формат гарантирует порядок полей. Повреждённые поля деградируют
// в значения по умолчанию и никогда не прерывают разбор.
//

namespace fields {

/// Разобранная первая строка секции A
struct Metadata {
    std::string timestamp_text;  // содержимое [...] без скобок
    std::string unique_id;
    std::string client_address;
    std::optional<std::uint16_t> client_port;
    std::optional<std::string> server_address;
    std::optional<std::uint16_t> server_port;
};

/// Разбить строку на поля по пробелам вне квадратных скобок.
/// "[19/Oct/2026:18:52:07 +0200] abc 10.0.0.1 5555" → 4 поля
std::vector<std::string_view> split_fields(std::string_view line);

/// Разобрать секцию A. Адрес клиента: третье поле (после метки и id),
/// поэтому IPv4 и IPv6 обрабатываются одинаково.
std::optional<Metadata> parse_metadata(std::string_view content);

/// Значение заголовка Host из секции B (регистр имени не важен)
std::optional<std::string> extract_host(std::string_view content);

/// Код ответа из первой строки вида "HTTP/<ver> <ddd>" в секции F
std::optional<std::uint16_t> extract_status(std::string_view content);

/// Все [id "<digits>"] секции H; дубликаты схлопываются к первому вхождению
std::vector<std::string> extract_rule_ids(std::string_view content);

/// Первое значение [file "<path>"] секции H
std::optional<std::string> extract_rule_file(std::string_view content);

/// Построить AuditGroup из секций одной транзакции
AuditGroup extract(std::string transaction_id, std::vector<AuditEntry> sections);

}  // namespace fields

// ----------------------------------------------------------------------------
// Проекции для вывода
// ----------------------------------------------------------------------------

/// Полный текст транзакции: каждая секция со своим маркером, в исходном порядке
std::string raw_content(const AuditGroup& group);

/// Колонки табличного вывода
enum class Column { AuditId, Timestamp, Domain, ClientAddress, Status, RuleIds, RuleFile };

struct ColumnOptions {
    /// Сколько rule id показывать до сокращения "(+N)"; 0 = все
    std::size_t max_rule_ids = 3;
};

/// Колонки по умолчанию: id, timestamp, domain, address, status, rules
std::vector<Column> default_columns();

/// Разобрать список колонок "id,timestamp,domain"
/// @return nullopt если встретилось неизвестное имя
std::optional<std::vector<Column>> parse_columns(std::string_view list);

/// Имя колонки в конфигурации/CLI ("id", "domain", ...)
const char* column_name(Column column);

/// Заголовок колонки ("Audit ID", "Client IP", ...)
const char* column_header(Column column);

/// Значение колонки для группы
std::string column_value(const AuditGroup& group, Column column, const ColumnOptions& opts = {});

/// Строка таблицы для набора колонок
std::vector<std::string> column_values(const AuditGroup& group, const std::vector<Column>& columns,
                                       const ColumnOptions& opts = {});

}  // namespace auditview

#endif  // AUDITVIEW_AUDIT_HPP

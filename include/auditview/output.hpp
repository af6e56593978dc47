// ==============================================================================
// auditview/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) только для TTY
// - Прогресс-индикатор загрузки
// - Таблицы (Unicode box-drawing) и JSON (RapidJSON)
// - Вывод в файл (--output)
//
// Ядро (splitter, extractor, query, geo) в терминал не пишет: сообщения
// формирует приложение и выводит через Writer.
//
// ==============================================================================

#ifndef AUDITVIEW_OUTPUT_HPP
#define AUDITVIEW_OUTPUT_HPP

#include <auditview/audit.hpp>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace auditview::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

enum class Format {
    Std,   // Таблица / текст
    Json,  // JSON массив
    Jsonl  // JSON Lines
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

struct OutputConfig {
    bool quiet = false;      // -q: подавить [+] и [!]
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner
    bool full_output = false;
    Format format = Format::Std;

    /// --output: stdout перенаправляется в файл
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Строка stdout с цветом (без цвета при выводе в файл или не в TTY)
    void colored_line(std::string_view message, Color color);

    // JSON
    // -------------------------------------------------------------------------

    void write_json_line(const rapidjson::Value& value);
    void write_json_pretty(const rapidjson::Value& value);

    // Прогресс-индикатор (stderr, только TTY, скрыт при -q и -v)
    // -------------------------------------------------------------------------

    void progress_begin(std::string_view label, std::uint64_t total);
    void progress_tick(std::uint64_t current);
    void progress_end();

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    /// Открыть файл для вывода (при заданном output_path)
    bool open_output_file();
    void close_output_file();

private:
    void write_impl(Stream s, std::string_view bytes);
    void write_prefix(std::string_view prefix, Color color);
    void write_colored(Stream s, std::string_view message, Color color);
    void draw_progress();
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;

    std::string progress_label_;
    std::uint64_t progress_total_ = 0;
    std::uint64_t progress_current_ = 0;
    int progress_percent_ = -1;
    bool progress_active_ = false;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

/// Таблица с Unicode box-drawing. Ячейки могут быть многострочными ('\n').
class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);
    void add_row(const std::vector<std::string>& cells);

    void print(Writer& w);
    std::string to_string() const;

private:
    std::string format_line(char kind) const;
    std::string format_row(const std::vector<std::string>& cells) const;
    std::vector<size_t> calculate_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    mutable std::vector<size_t> col_widths_;
};

// ----------------------------------------------------------------------------
// Транзакции
// ----------------------------------------------------------------------------

/// Заполнить out JSON-объектом транзакции
void group_to_json(const AuditGroup& group, rapidjson::Value& out,
                   rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc,
                   bool include_sections);

/// Подробный текстовый вид: поля транзакции + исходные секции
std::string format_group_detail(const AuditGroup& group);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Нормализовать поле для таблицы: \n \r \t и повторные пробелы → один
/// пробел, перенос по col_width символов (0: без переноса); при
/// !full_output длинные значения обрезаются.
std::string format_field_length(std::string_view field, size_t col_width, bool full_output);

/// Число символов UTF-8 (не байтов)
size_t display_width(std::string_view text);

}  // namespace auditview::output

#endif  // AUDITVIEW_OUTPUT_HPP

// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны: без std::endl,
// всё идёт через fwrite.
//
// ==============================================================================

#include <algorithm>
#include <auditview/output.hpp>
#include <auditview/platform.hpp>
#include <cstdio>
#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace auditview::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";
constexpr const char* ANSI_CLEAR_LINE = "\r\x1b[2K";

// Unicode box-drawing (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼

// Лимит длины поля при !full_output
constexpr size_t FIELD_LENGTH_LIMIT = 496;

constexpr int PROGRESS_BAR_WIDTH = 30;

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// Разбить строку на строки по '\n'
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    progress_end();
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    // Сообщение посреди прогресс-бара: сначала стереть строку
    if (progress_active_ && progress_percent_ >= 0) {
        write(Stream::Stderr, ANSI_CLEAR_LINE);
        progress_percent_ = -1;
    }
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::colored_line(std::string_view message, Color color) {
    write_colored(Stream::Stdout, message, color);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл: без ANSI codes
    bool use_color = color != Color::Default &&
                     ((s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                      (s == Stream::Stderr && supports_color(s)));

    if (use_color) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
}

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

void Writer::progress_begin(std::string_view label, std::uint64_t total) {
    // Прогресс скрыт при verbose/quiet и когда stderr не терминал
    if (config_.verbose > 0 || config_.quiet || !supports_color(Stream::Stderr)) {
        return;
    }
    if (progress_active_) {
        progress_end();
    }

    progress_label_ = std::string(label);
    progress_total_ = total;
    progress_current_ = 0;
    progress_percent_ = -1;
    progress_active_ = true;
    draw_progress();
}

void Writer::progress_tick(std::uint64_t current) {
    if (!progress_active_) {
        return;
    }
    progress_current_ = std::min(current, progress_total_);
    draw_progress();
}

void Writer::progress_end() {
    if (!progress_active_) {
        return;
    }
    write(Stream::Stderr, ANSI_CLEAR_LINE);
    std::fflush(stderr);

    progress_active_ = false;
    progress_percent_ = -1;
    progress_label_.clear();
}

void Writer::draw_progress() {
    int percent = progress_total_ == 0
                      ? 100
                      : static_cast<int>(progress_current_ * 100 / progress_total_);
    // Перерисовка только при изменении процента
    if (percent == progress_percent_) {
        return;
    }
    progress_percent_ = percent;

    int filled = percent * PROGRESS_BAR_WIDTH / 100;
    std::string line = "\r";
    line += ANSI_CYAN;
    line += "[*] ";
    line += ANSI_RESET;
    line += progress_label_;
    line += " [";
    line.append(static_cast<size_t>(filled), '#');
    line.append(static_cast<size_t>(PROGRESS_BAR_WIDTH - filled), '.');
    line += "] ";
    line += std::to_string(percent);
    line += '%';

    write(Stream::Stderr, line);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Управление
// ----------------------------------------------------------------------------

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }
    close_output_file();

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::calculate_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);

    auto measure = [&](const std::vector<std::string>& cells) {
        for (size_t i = 0; i < cells.size(); ++i) {
            for (auto line : split_lines(cells[i])) {
                widths[i] = std::max(widths[i], display_width(line));
            }
        }
    };

    measure(headers_);
    for (const auto& row : rows_) {
        measure(row);
    }
    return widths;
}

std::string Table::format_line(char kind) const {
    // kind: 'T' верх, 'M' разделитель заголовка, 'B' низ
    const char* left = kind == 'T' ? BOX_TL : (kind == 'M' ? BOX_LT : BOX_BL);
    const char* middle = kind == 'T' ? BOX_TT : (kind == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = kind == 'T' ? BOX_TR : (kind == 'M' ? BOX_RT : BOX_BR);

    std::string line = left;
    for (size_t i = 0; i < col_widths_.size(); ++i) {
        for (size_t j = 0; j < col_widths_[i] + 2; ++j) {
            line += BOX_H;
        }
        line += (i + 1 < col_widths_.size()) ? middle : right;
    }
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::vector<std::vector<std::string_view>> cell_lines(col_widths_.size());
    size_t height = 1;
    for (size_t i = 0; i < col_widths_.size(); ++i) {
        if (i < cells.size()) {
            cell_lines[i] = split_lines(cells[i]);
        }
        height = std::max(height, cell_lines[i].size());
    }

    std::string out;
    for (size_t row = 0; row < height; ++row) {
        if (row > 0) {
            out += '\n';
        }
        out += BOX_V;
        for (size_t i = 0; i < col_widths_.size(); ++i) {
            std::string_view text = row < cell_lines[i].size() ? cell_lines[i][row] : "";
            out += ' ';
            out.append(text.data(), text.size());
            size_t width = display_width(text);
            if (width < col_widths_[i]) {
                out.append(col_widths_[i] - width, ' ');
            }
            out += ' ';
            out += BOX_V;
        }
    }
    return out;
}

std::string Table::to_string() const {
    col_widths_ = calculate_widths();
    if (col_widths_.empty()) {
        return std::string();
    }

    std::string result;
    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Транзакции
// ----------------------------------------------------------------------------

void group_to_json(const AuditGroup& group, rapidjson::Value& out,
                   rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>& alloc,
                   bool include_sections) {
    out.SetObject();

    auto str = [&](const std::string& s) {
        return rapidjson::Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    };
    auto opt_str = [&](const std::optional<std::string>& s) {
        return s ? str(*s) : rapidjson::Value(rapidjson::kNullType);
    };
    auto opt_port = [&](const std::optional<std::uint16_t>& p) {
        return p ? rapidjson::Value(static_cast<unsigned>(*p))
                 : rapidjson::Value(rapidjson::kNullType);
    };

    out.AddMember("transaction_id", str(group.transaction_id), alloc);
    out.AddMember("timestamp",
                  group.timestamp ? str(group.timestamp->to_string())
                                  : rapidjson::Value(rapidjson::kNullType),
                  alloc);
    out.AddMember("unique_id", opt_str(group.unique_id), alloc);
    out.AddMember("client_address", str(group.client_address), alloc);
    out.AddMember("client_port", opt_port(group.client_port), alloc);
    out.AddMember("server_address", opt_str(group.server_address), alloc);
    out.AddMember("server_port", opt_port(group.server_port), alloc);
    out.AddMember("host", str(group.host), alloc);
    out.AddMember("status", opt_port(group.status), alloc);

    rapidjson::Value rules(rapidjson::kArrayType);
    for (const auto& id : group.rule_ids) {
        rules.PushBack(str(id), alloc);
    }
    out.AddMember("rule_ids", rules, alloc);
    out.AddMember("rule_file", opt_str(group.rule_file), alloc);

    if (include_sections) {
        rapidjson::Value sections(rapidjson::kArrayType);
        for (const auto& entry : group.sections) {
            rapidjson::Value section(rapidjson::kObjectType);
            section.AddMember("letter", str(std::string(1, entry.letter)), alloc);
            section.AddMember("name", rapidjson::StringRef(section_name(entry.letter)), alloc);
            section.AddMember("content", str(entry.content), alloc);
            sections.PushBack(section, alloc);
        }
        out.AddMember("sections", sections, alloc);
    }
}

std::string format_group_detail(const AuditGroup& group) {
    std::string out = "Audit Chain: " + group.transaction_id + " | " + group.host + " | " +
                      group.client_address + "\n";

    auto field = [&](const char* name, const std::string& value) {
        out += "  ";
        out += name;
        out.append(12 - std::min<size_t>(11, std::strlen(name)), ' ');
        out += value;
        out += '\n';
    };

    field("Timestamp", column_value(group, Column::Timestamp));
    if (group.unique_id) {
        field("Unique ID", *group.unique_id);
    }
    std::string client = group.client_address;
    if (group.client_port) {
        client += ":" + std::to_string(*group.client_port);
    }
    field("Client", client);
    if (group.server_address) {
        std::string server = *group.server_address;
        if (group.server_port) {
            server += ":" + std::to_string(*group.server_port);
        }
        field("Server", server);
    }
    field("Host", group.host);
    field("Status", column_value(group, Column::Status));
    ColumnOptions all_rules;
    all_rules.max_rule_ids = 0;
    field("Rule IDs", column_value(group, Column::RuleIds, all_rules));
    field("Sections", std::to_string(group.sections.size()));
    return out;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

size_t display_width(std::string_view text) {
    size_t width = 0;
    for (char c : text) {
        if (!is_continuation(c)) {
            ++width;
        }
    }
    return width;
}

std::string format_field_length(std::string_view field, size_t col_width, bool full_output) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    // Обрезка при !full_output (по границе символа UTF-8)
    bool truncated = false;
    if (!full_output && result.size() > FIELD_LENGTH_LIMIT) {
        size_t cut = FIELD_LENGTH_LIMIT;
        while (cut > 0 && is_continuation(result[cut])) {
            --cut;
        }
        result.resize(cut);
        truncated = true;
    }

    // Перенос по col_width символов
    if (col_width > 0 && display_width(result) > col_width) {
        std::string chunked;
        size_t count = 0;
        for (char c : result) {
            if (!is_continuation(c)) {
                if (count == col_width) {
                    chunked += '\n';
                    count = 0;
                }
                ++count;
            }
            chunked += c;
        }
        result = std::move(chunked);
    }

    if (truncated) {
        result += "...";
    }
    return result;
}

}  // namespace auditview::output

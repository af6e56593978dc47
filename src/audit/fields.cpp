// ==============================================================================
// fields.cpp - Field Extractor: позиционное извлечение полей транзакции
// ==============================================================================
//
// Поля читаются по известным позициям секций A/B/F/H. Любая ошибка
// деградирует к значению по умолчанию (unknown / 0.0.0.0 / нет значения).
//
// ==============================================================================

#include <algorithm>
#include <auditview/audit.hpp>
#include <cctype>
#include <unordered_set>

namespace auditview::fields {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// Вызвать fn(line) для каждой строки (без '\n' и завершающих '\r')
template <typename Fn>
void for_each_line(std::string_view content, Fn&& fn) {
    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t nl = content.find('\n', start);
        std::string_view line = content.substr(
            start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
        while (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!fn(line))
            return;
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }
}

std::optional<std::uint16_t> parse_port(std::string_view s) {
    if (s.empty() || s.size() > 5)
        return std::nullopt;
    unsigned value = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return std::nullopt;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if (value > 65535)
        return std::nullopt;
    return static_cast<std::uint16_t>(value);
}

/// Все значения [<name> "<value>"] в порядке появления
std::vector<std::string_view> bracket_values(std::string_view content, std::string_view name) {
    std::vector<std::string_view> out;
    std::string needle = "[" + std::string(name) + " \"";
    std::size_t pos = 0;
    while ((pos = content.find(needle, pos)) != std::string_view::npos) {
        std::size_t value_start = pos + needle.size();
        std::size_t close = content.find("\"]", value_start);
        if (close == std::string_view::npos)
            break;
        std::string_view value = content.substr(value_start, close - value_start);
        // Значение не пересекает границу строки
        if (value.find('\n') == std::string_view::npos) {
            out.push_back(value);
        }
        pos = value_start;
    }
    return out;
}

}  // anonymous namespace

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i]))
            ++i;
        if (i >= line.size())
            break;

        std::size_t start = i;
        int depth = 0;
        while (i < line.size() && (depth > 0 || !is_space(line[i]))) {
            if (line[i] == '[') {
                ++depth;
            } else if (line[i] == ']' && depth > 0) {
                --depth;
            }
            ++i;
        }
        out.push_back(line.substr(start, i - start));
    }
    return out;
}

std::optional<Metadata> parse_metadata(std::string_view content) {
    // Первая непустая строка секции
    std::string_view header;
    for_each_line(content, [&](std::string_view line) {
        if (!trim(line).empty()) {
            header = trim(line);
            return false;
        }
        return true;
    });

    if (header.empty() || header.front() != '[') {
        return std::nullopt;
    }

    auto parts = split_fields(header);
    // [timestamp] unique-id client-addr: минимум три поля
    if (parts.size() < 3) {
        return std::nullopt;
    }

    std::string_view ts = parts[0];
    if (ts.size() < 2 || ts.back() != ']') {
        return std::nullopt;
    }

    Metadata meta;
    meta.timestamp_text = std::string(ts.substr(1, ts.size() - 2));
    meta.unique_id = std::string(parts[1]);
    meta.client_address = std::string(parts[2]);
    if (parts.size() > 3) {
        meta.client_port = parse_port(parts[3]);
    }
    if (parts.size() > 4) {
        meta.server_address = std::string(parts[4]);
    }
    if (parts.size() > 5) {
        meta.server_port = parse_port(parts[5]);
    }
    return meta;
}

std::optional<std::string> extract_host(std::string_view content) {
    std::optional<std::string> host;
    bool first = true;
    for_each_line(content, [&](std::string_view line) {
        // Первая строка: request line
        if (first) {
            first = false;
            return true;
        }
        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return true;
        }
        if (!iequals(trim(line.substr(0, colon)), "host")) {
            return true;
        }
        std::string_view value = trim(line.substr(colon + 1));
        if (!value.empty()) {
            host = std::string(value);
        }
        return false;
    });
    return host;
}

std::optional<std::uint16_t> extract_status(std::string_view content) {
    std::optional<std::uint16_t> status;
    for_each_line(content, [&](std::string_view line) {
        std::size_t pos = line.find("HTTP/");
        while (pos != std::string_view::npos) {
            std::size_t i = pos + 5;
            std::size_t ver_start = i;
            while (i < line.size() && (std::isdigit(static_cast<unsigned char>(line[i])) ||
                                       line[i] == '.')) {
                ++i;
            }
            bool has_version = i > ver_start;
            std::size_t ws_start = i;
            while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
                ++i;
            bool has_space = i > ws_start;

            if (has_version && has_space && i + 3 <= line.size() &&
                std::isdigit(static_cast<unsigned char>(line[i])) &&
                std::isdigit(static_cast<unsigned char>(line[i + 1])) &&
                std::isdigit(static_cast<unsigned char>(line[i + 2])) &&
                (i + 3 == line.size() || !std::isdigit(static_cast<unsigned char>(line[i + 3])))) {
                status = static_cast<std::uint16_t>((line[i] - '0') * 100 +
                                                    (line[i + 1] - '0') * 10 + (line[i + 2] - '0'));
                return false;
            }
            pos = line.find("HTTP/", pos + 5);
        }
        return true;
    });
    return status;
}

std::vector<std::string> extract_rule_ids(std::string_view content) {
    std::vector<std::string> ids;
    std::unordered_set<std::string_view> seen;
    for (std::string_view value : bracket_values(content, "id")) {
        if (value.empty())
            continue;
        bool digits = std::all_of(value.begin(), value.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (!digits)
            continue;
        if (seen.insert(value).second) {
            ids.emplace_back(value);
        }
    }
    return ids;
}

std::optional<std::string> extract_rule_file(std::string_view content) {
    auto values = bracket_values(content, "file");
    if (values.empty()) {
        return std::nullopt;
    }
    return std::string(values.front());
}

AuditGroup extract(std::string transaction_id, std::vector<AuditEntry> sections) {
    AuditGroup group;
    group.transaction_id = std::move(transaction_id);
    group.sections = std::move(sections);

    // Если буква повторяется, используется первая секция
    if (const AuditEntry* a = group.find_section(section::kMetadata)) {
        if (auto meta = parse_metadata(a->content)) {
            group.timestamp = Timestamp::parse_log(meta->timestamp_text);
            group.client_address = std::move(meta->client_address);
            group.unique_id = std::move(meta->unique_id);
            group.client_port = meta->client_port;
            group.server_address = std::move(meta->server_address);
            group.server_port = meta->server_port;
        }
    }

    if (const AuditEntry* b = group.find_section(section::kRequestHeaders)) {
        if (auto host = extract_host(b->content)) {
            group.host = std::move(*host);
        }
    }

    if (const AuditEntry* f = group.find_section(section::kResponseHeaders)) {
        group.status = extract_status(f->content);
    }

    if (const AuditEntry* h = group.find_section(section::kAuditTrail)) {
        group.rule_ids = extract_rule_ids(h->content);
        group.rule_file = extract_rule_file(h->content);
    }

    return group;
}

}  // namespace auditview::fields

// ==============================================================================
// audit.cpp - Модель транзакций: Timestamp, GroupIndex, проекции для вывода
// ==============================================================================

#include <algorithm>
#include <auditview/audit.hpp>
#include <cctype>
#include <cstdio>

namespace auditview {

// ============================================================================
// Timestamp
// ============================================================================

namespace {

constexpr const char* kMonthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                       "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

bool parse_int(std::string_view s, int& out) {
    if (s.empty())
        return false;
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9')
            return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

// Дни от 1970-01-01 (алгоритм Howard Hinnant, days_from_civil)
std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

bool valid_fields(const Timestamp& ts) {
    if (ts.month < 1 || ts.month > 12)
        return false;
    if (ts.day < 1 || ts.day > days_in_month(ts.year, ts.month))
        return false;
    if (ts.hour > 23 || ts.minute > 59 || ts.second > 59)
        return false;
    return true;
}

/// Дробная часть секунд ".123" → микросекунды; pos указывает на '.'
bool parse_fraction(std::string_view str, std::size_t& pos, int& microsecond) {
    if (pos >= str.size() || str[pos] != '.') {
        return true;
    }
    ++pos;
    std::size_t frac_start = pos;
    while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
        ++pos;
    }
    if (pos == frac_start) {
        return false;
    }
    std::string_view frac = str.substr(frac_start, pos - frac_start);
    int value = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        value = value * 10 + (i < frac.size() ? frac[i] - '0' : 0);
    }
    microsecond = value;
    return true;
}

}  // anonymous namespace

std::optional<Timestamp> Timestamp::parse_log(std::string_view str) {
    // dd/Mon/YYYY:HH:MM:SS +hhmm: минимум 26 символов
    if (str.size() < 26) {
        return std::nullopt;
    }

    Timestamp ts;
    if (!parse_int(str.substr(0, 2), ts.day) || str[2] != '/')
        return std::nullopt;

    std::string_view mon = str.substr(3, 3);
    ts.month = 0;
    for (int i = 0; i < 12; ++i) {
        if (mon == kMonthNames[i]) {
            ts.month = i + 1;
            break;
        }
    }
    if (ts.month == 0 || str[6] != '/')
        return std::nullopt;

    if (!parse_int(str.substr(7, 4), ts.year) || str[11] != ':')
        return std::nullopt;
    if (!parse_int(str.substr(12, 2), ts.hour) || str[14] != ':')
        return std::nullopt;
    if (!parse_int(str.substr(15, 2), ts.minute) || str[17] != ':')
        return std::nullopt;
    if (!parse_int(str.substr(18, 2), ts.second))
        return std::nullopt;

    std::size_t pos = 20;
    if (!parse_fraction(str, pos, ts.microsecond))
        return std::nullopt;

    // Смещение " +hhmm"
    if (pos + 6 > str.size() || str[pos] != ' ')
        return std::nullopt;
    char sign = str[pos + 1];
    if (sign != '+' && sign != '-')
        return std::nullopt;
    int off_h = 0;
    int off_m = 0;
    if (!parse_int(str.substr(pos + 2, 2), off_h) || !parse_int(str.substr(pos + 4, 2), off_m))
        return std::nullopt;
    if (off_m > 59)
        return std::nullopt;

    if (!valid_fields(ts))
        return std::nullopt;

    // Нормализация к UTC
    std::int64_t offset = (off_h * 60 + off_m) * 60;
    if (sign == '-')
        offset = -offset;
    std::int64_t secs = days_from_civil(ts.year, ts.month, ts.day) * 86400 + ts.hour * 3600 +
                        ts.minute * 60 + ts.second - offset;
    std::int64_t days = secs / 86400;
    std::int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }
    civil_from_days(days, ts.year, ts.month, ts.day);
    ts.hour = static_cast<int>(rem / 3600);
    ts.minute = static_cast<int>((rem % 3600) / 60);
    ts.second = static_cast<int>(rem % 60);
    return ts;
}

std::optional<Timestamp> Timestamp::parse_iso(std::string_view str) {
    // YYYY-MM-DDTHH:MM:SS = 19 символов
    if (str.size() < 19) {
        return std::nullopt;
    }

    Timestamp ts;
    if (!parse_int(str.substr(0, 4), ts.year) || str[4] != '-')
        return std::nullopt;
    if (!parse_int(str.substr(5, 2), ts.month) || str[7] != '-')
        return std::nullopt;
    if (!parse_int(str.substr(8, 2), ts.day))
        return std::nullopt;
    if (str[10] != 'T' && str[10] != ' ')
        return std::nullopt;
    if (!parse_int(str.substr(11, 2), ts.hour) || str[13] != ':')
        return std::nullopt;
    if (!parse_int(str.substr(14, 2), ts.minute) || str[16] != ':')
        return std::nullopt;
    if (!parse_int(str.substr(17, 2), ts.second))
        return std::nullopt;
    if (!valid_fields(ts))
        return std::nullopt;

    std::size_t pos = 19;
    if (!parse_fraction(str, pos, ts.microsecond))
        return std::nullopt;
    if (pos < str.size() && str[pos] == 'Z') {
        ++pos;
    }
    if (pos != str.size()) {
        return std::nullopt;
    }
    return ts;
}

bool Timestamp::operator<(const Timestamp& other) const {
    if (year != other.year)
        return year < other.year;
    if (month != other.month)
        return month < other.month;
    if (day != other.day)
        return day < other.day;
    if (hour != other.hour)
        return hour < other.hour;
    if (minute != other.minute)
        return minute < other.minute;
    if (second != other.second)
        return second < other.second;
    return microsecond < other.microsecond;
}

bool Timestamp::operator<=(const Timestamp& other) const {
    return !(other < *this);
}

bool Timestamp::operator>(const Timestamp& other) const {
    return other < *this;
}

bool Timestamp::operator>=(const Timestamp& other) const {
    return !(*this < other);
}

bool Timestamp::operator==(const Timestamp& other) const {
    return year == other.year && month == other.month && day == other.day && hour == other.hour &&
           minute == other.minute && second == other.second && microsecond == other.microsecond;
}

std::string Timestamp::to_string() const {
    char buf[64];
    if (microsecond > 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ", year, month, day,
                      hour, minute, second, microsecond);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", year, month, day, hour,
                      minute, second);
    }
    return buf;
}

std::string Timestamp::to_display_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d", year, month, day, hour, minute,
                  second);
    return buf;
}

// ============================================================================
// Секции
// ============================================================================

bool is_section_letter(char c) {
    return c >= 'A' && c <= 'Z';
}

const char* section_name(char letter) {
    switch (letter) {
    case 'A':
        return "audit log header";
    case 'B':
        return "request headers";
    case 'C':
        return "request body";
    case 'D':
        return "intended response headers";
    case 'E':
        return "intended response body";
    case 'F':
        return "response headers";
    case 'G':
        return "response body";
    case 'H':
        return "audit log trailer";
    case 'I':
        return "reduced multipart request body";
    case 'J':
        return "multipart files information";
    case 'K':
        return "matched rules";
    case 'Z':
        return "audit log footer";
    default:
        return "unknown section";
    }
}

const AuditEntry* AuditGroup::find_section(char letter) const {
    for (const auto& entry : sections) {
        if (entry.letter == letter) {
            return &entry;
        }
    }
    return nullptr;
}

std::optional<std::size_t> GroupIndex::find(std::string_view transaction_id) const {
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (groups[i].transaction_id == transaction_id) {
            return i;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Проекции для вывода
// ============================================================================

std::string raw_content(const AuditGroup& group) {
    std::string out;
    for (const auto& entry : group.sections) {
        out += "--";
        out += group.transaction_id;
        out += '-';
        out += entry.letter;
        out += "--\n";
        out += entry.content;
    }
    return out;
}

std::vector<Column> default_columns() {
    return {Column::AuditId, Column::Timestamp, Column::Domain,
            Column::ClientAddress, Column::Status, Column::RuleIds};
}

const char* column_name(Column column) {
    switch (column) {
    case Column::AuditId:
        return "id";
    case Column::Timestamp:
        return "timestamp";
    case Column::Domain:
        return "domain";
    case Column::ClientAddress:
        return "address";
    case Column::Status:
        return "status";
    case Column::RuleIds:
        return "rules";
    case Column::RuleFile:
        return "file";
    }
    return "unknown";
}

const char* column_header(Column column) {
    switch (column) {
    case Column::AuditId:
        return "Audit ID";
    case Column::Timestamp:
        return "Timestamp";
    case Column::Domain:
        return "Domain";
    case Column::ClientAddress:
        return "Client IP";
    case Column::Status:
        return "Status";
    case Column::RuleIds:
        return "Rule IDs";
    case Column::RuleFile:
        return "Rule File";
    }
    return "";
}

std::optional<std::vector<Column>> parse_columns(std::string_view list) {
    static const Column kAll[] = {Column::AuditId, Column::Timestamp, Column::Domain,
                                  Column::ClientAddress, Column::Status, Column::RuleIds,
                                  Column::RuleFile};

    std::vector<Column> columns;
    std::size_t start = 0;
    while (start <= list.size()) {
        std::size_t comma = list.find(',', start);
        std::string_view part =
            list.substr(start, comma == std::string_view::npos ? std::string_view::npos
                                                                : comma - start);
        // trim
        while (!part.empty() && std::isspace(static_cast<unsigned char>(part.front())))
            part.remove_prefix(1);
        while (!part.empty() && std::isspace(static_cast<unsigned char>(part.back())))
            part.remove_suffix(1);

        if (!part.empty()) {
            std::string lower;
            for (char c : part) {
                lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
            // Синонимы в духе префиксов поиска
            if (lower == "auditid")
                lower = "id";
            else if (lower == "ip")
                lower = "address";
            else if (lower == "host")
                lower = "domain";

            bool found = false;
            for (Column c : kAll) {
                if (lower == column_name(c)) {
                    columns.push_back(c);
                    found = true;
                    break;
                }
            }
            if (!found) {
                return std::nullopt;
            }
        }

        if (comma == std::string_view::npos)
            break;
        start = comma + 1;
    }

    if (columns.empty()) {
        return std::nullopt;
    }
    return columns;
}

std::string column_value(const AuditGroup& group, Column column, const ColumnOptions& opts) {
    switch (column) {
    case Column::AuditId:
        return group.transaction_id;
    case Column::Timestamp:
        return group.timestamp ? group.timestamp->to_display_string() : "N/A";
    case Column::Domain:
        return group.host;
    case Column::ClientAddress:
        return group.client_address;
    case Column::Status:
        return group.status ? std::to_string(*group.status) : "N/A";
    case Column::RuleIds: {
        const auto& ids = group.rule_ids;
        std::size_t shown = ids.size();
        if (opts.max_rule_ids > 0 && ids.size() > opts.max_rule_ids) {
            shown = opts.max_rule_ids;
        }
        std::string out;
        for (std::size_t i = 0; i < shown; ++i) {
            if (i > 0)
                out += ", ";
            out += ids[i];
        }
        if (shown < ids.size()) {
            out += " (+" + std::to_string(ids.size() - shown) + ")";
        }
        return out;
    }
    case Column::RuleFile:
        return group.rule_file.value_or("N/A");
    }
    return "";
}

std::vector<std::string> column_values(const AuditGroup& group, const std::vector<Column>& columns,
                                       const ColumnOptions& opts) {
    std::vector<std::string> row;
    row.reserve(columns.size());
    for (Column c : columns) {
        row.push_back(column_value(group, c, opts));
    }
    return row;
}

}  // namespace auditview

// ==============================================================================
// query.cpp - Query Engine
// ==============================================================================

#include <algorithm>
#include <auditview/query.hpp>
#include <cctype>

namespace auditview::query {

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        c = lower(c);
    }
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

bool status_matches(const AuditGroup& group, std::string_view value) {
    if (!group.status) {
        return false;
    }
    return std::to_string(*group.status).find(value) != std::string::npos;
}

bool any_rule_matches(const AuditGroup& group, std::string_view value) {
    return std::any_of(group.rule_ids.begin(), group.rule_ids.end(),
                       [&](const std::string& id) { return contains_ci(id, value); });
}

}  // anonymous namespace

bool contains_ci(std::string_view haystack, std::string_view needle_lower) {
    if (needle_lower.empty()) {
        return true;
    }
    if (needle_lower.size() > haystack.size()) {
        return false;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle_lower.begin(),
                          needle_lower.end(), [](char a, char b) { return lower(a) == b; });
    return it != haystack.end();
}

// ============================================================================
// SearchQuery
// ============================================================================

const char* query_field_name(QueryField field) {
    switch (field) {
    case QueryField::Domain:
        return "domain";
    case QueryField::Address:
        return "ip";
    case QueryField::Rule:
        return "rule";
    case QueryField::TransactionId:
        return "auditid";
    case QueryField::Status:
        return "status";
    }
    return "unknown";
}

std::optional<QueryField> query_field_from_prefix(std::string_view prefix) {
    if (prefix == "domain") {
        return QueryField::Domain;
    }
    if (prefix == "ip" || prefix == "address") {
        return QueryField::Address;
    }
    if (prefix == "rule" || prefix == "ruleid" || prefix == "id") {
        return QueryField::Rule;
    }
    if (prefix == "auditid") {
        return QueryField::TransactionId;
    }
    if (prefix == "status" || prefix == "http") {
        return QueryField::Status;
    }
    return std::nullopt;
}

SearchQuery SearchQuery::parse(std::string_view text) {
    SearchQuery q;
    std::size_t colon = text.find(':');
    if (colon != std::string_view::npos) {
        auto field = query_field_from_prefix(to_lower(trim(text.substr(0, colon))));
        if (field) {
            q.field = field;
            q.value = to_lower(trim(text.substr(colon + 1)));
            return q;
        }
    }
    // IPv6 адрес или неизвестный префикс: весь текст целиком
    q.value = to_lower(trim(text));
    return q;
}

bool SearchQuery::matches(const AuditGroup& group) const {
    if (value.empty()) {
        return true;
    }

    if (field) {
        switch (*field) {
        case QueryField::Domain:
            return contains_ci(group.host, value);
        case QueryField::Address:
            return contains_ci(group.client_address, value);
        case QueryField::Rule:
            return any_rule_matches(group, value);
        case QueryField::TransactionId:
            return contains_ci(group.transaction_id, value);
        case QueryField::Status:
            return status_matches(group, value);
        }
        return false;
    }

    return contains_ci(group.host, value) || contains_ci(group.client_address, value) ||
           contains_ci(group.transaction_id, value) || any_rule_matches(group, value) ||
           status_matches(group, value);
}

// ============================================================================
// TimeRange
// ============================================================================

bool TimeRange::contains(const std::optional<Timestamp>& ts) const {
    if (!active()) {
        return true;
    }
    if (!ts) {
        return false;
    }
    if (from && *ts < *from) {
        return false;
    }
    if (to && *ts > *to) {
        return false;
    }
    return true;
}

// ============================================================================
// query
// ============================================================================

FilteredView query(const GroupIndex& index, const SearchQuery& q, const TimeRange& range) {
    FilteredView view;
    for (std::size_t i = 0; i < index.size(); ++i) {
        const auto& group = index[i];
        if (range.contains(group.timestamp) && q.matches(group)) {
            view.push_back(i);
        }
    }
    return view;
}

FilteredView query(const GroupIndex& index, std::string_view text) {
    return query(index, SearchQuery::parse(text), TimeRange{});
}

FilteredView query(const GroupIndex& index, std::string_view text, const TimeRange& range) {
    return query(index, SearchQuery::parse(text), range);
}

void sort_newest_first(const GroupIndex& index, FilteredView& view) {
    std::stable_sort(view.begin(), view.end(), [&](std::size_t a, std::size_t b) {
        const auto& ta = index[a].timestamp;
        const auto& tb = index[b].timestamp;
        if (ta && tb) {
            return *ta > *tb;
        }
        return ta.has_value() && !tb.has_value();
    });
}

}  // namespace auditview::query

// ==============================================================================
// auditview/query.hpp - Query Engine: поиск по GroupIndex
// ==============================================================================
//
// Назначение:
// - SearchQuery: разбор строки запроса ("prefix:value" или свободный текст)
// - query(): построение FilteredView (позиции в порядке индекса)
// - TimeRange: фильтр по метке времени
// - sort_newest_first(): сортировка представления для вывода
//
// Префиксы (регистр не важен):
//   domain:           host
//   ip: address:      адрес клиента
//   rule: ruleid: id: любой rule id
//   auditid:          boundary id транзакции
//   status: http:     десятичная строка кода ответа
// Неизвестный префикс или запрос без ':': поиск по всем полям.
//
// ==============================================================================

#ifndef AUDITVIEW_QUERY_HPP
#define AUDITVIEW_QUERY_HPP

#include <auditview/audit.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace auditview::query {

// ----------------------------------------------------------------------------
// SearchQuery
// ----------------------------------------------------------------------------

enum class QueryField { Domain, Address, Rule, TransactionId, Status };

const char* query_field_name(QueryField field);

/// Распознать префикс запроса (уже в нижнем регистре)
std::optional<QueryField> query_field_from_prefix(std::string_view prefix);

struct SearchQuery {
    /// nullopt: свободный текст по всем полям
    std::optional<QueryField> field;
    /// Значение в нижнем регистре
    std::string value;

    /// Разобрать строку запроса. Никогда не завершается ошибкой.
    static SearchQuery parse(std::string_view text);

    /// Пустой запрос совпадает со всеми группами
    bool empty() const { return value.empty(); }

    bool matches(const AuditGroup& group) const;
};

// ----------------------------------------------------------------------------
// TimeRange
// ----------------------------------------------------------------------------

/// Включительный диапазон. При активном диапазоне группы без метки
/// времени исключаются.
struct TimeRange {
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;

    bool active() const { return from.has_value() || to.has_value(); }
    bool contains(const std::optional<Timestamp>& ts) const;
};

// ----------------------------------------------------------------------------
// FilteredView
// ----------------------------------------------------------------------------

/// Позиции групп, совпавших с запросом, в порядке индекса
FilteredView query(const GroupIndex& index, std::string_view text);

FilteredView query(const GroupIndex& index, const SearchQuery& q, const TimeRange& range = {});

FilteredView query(const GroupIndex& index, std::string_view text, const TimeRange& range);

/// Стабильная сортировка по убыванию метки времени; группы без метки в конце.
/// Сам индекс не меняется.
void sort_newest_first(const GroupIndex& index, FilteredView& view);

/// Регистронезависимое вхождение needle (уже в нижнем регистре) в haystack
bool contains_ci(std::string_view haystack, std::string_view needle_lower);

}  // namespace auditview::query

#endif  // AUDITVIEW_QUERY_HPP

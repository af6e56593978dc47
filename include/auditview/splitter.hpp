// ==============================================================================
// auditview/splitter.hpp - Section Splitter: разбиение лога на транзакции
// ==============================================================================
//
// Назначение:
// - Распознавание маркеров секций --<id>-<letter>--
// - Обучение формы boundary id по первому встреченному маркеру
// - Конечный автомат секций/транзакций
// - Отбрасывание незавершённых транзакций (нет маркера Z)
//
// Использование:
// @code
//   SectionSplitter splitter([&](RawTransaction&& tx) {
//       index.groups.push_back(fields::extract(std::move(tx.id), std::move(tx.sections)));
//   });
//   for (auto line : lines) splitter.feed_line(line);
//   splitter.finish();
// @endcode
//
// ==============================================================================

#ifndef AUDITVIEW_SPLITTER_HPP
#define AUDITVIEW_SPLITTER_HPP

#include <auditview/audit.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auditview::io {

// ----------------------------------------------------------------------------
// Маркеры секций
// ----------------------------------------------------------------------------

/// Разобранный маркер секции
struct Boundary {
    std::string_view id;
    char letter = '\0';
};

/// Разобрать строку как маркер "--<id>-<letter>--"
/// id: [A-Za-z0-9]+, letter: [A-Z]; завершающие \r и пробелы игнорируются
std::optional<Boundary> parse_boundary(std::string_view line);

/// Форма boundary id, выученная по первому маркеру файла.
/// Строка, похожая на маркер, но с id другой формы: содержимое секции.
struct BoundaryShape {
    std::size_t length = 0;

    static BoundaryShape learn(std::string_view id);
    bool matches(std::string_view id) const;
};

// ----------------------------------------------------------------------------
// SectionSplitter
// ----------------------------------------------------------------------------

/// Завершённая транзакция: id и секции, последняя: Z
struct RawTransaction {
    std::string id;
    std::vector<AuditEntry> sections;
};

struct SplitterStats {
    std::uint64_t lines = 0;
    std::uint64_t sections = 0;
    std::uint64_t transactions = 0;
    std::uint64_t incomplete_discarded = 0;
};

/// Потоковый разборщик секций. Строки подаются по одной, завершённые
/// транзакции передаются в sink в порядке появления.
class SectionSplitter {
public:
    using Sink = std::function<void(RawTransaction&&)>;

    explicit SectionSplitter(Sink sink);

    /// Обработать одну строку (без '\n'; '\r' в конце допускается)
    void feed_line(std::string_view line);

    /// Конец ввода: незавершённая транзакция отбрасывается
    void finish();

    const SplitterStats& stats() const { return stats_; }

    /// Выученная форма id (nullopt до первого маркера)
    const std::optional<BoundaryShape>& shape() const { return shape_; }

private:
    /// Закрыть открытую секцию и добавить её в транзакцию
    void close_section();

    /// Отбросить текущую транзакцию целиком
    void discard_transaction();

    /// Передать транзакцию в sink и сбросить состояние
    void complete_transaction();

    Sink sink_;
    SplitterStats stats_;
    std::optional<BoundaryShape> shape_;

    // Текущая транзакция
    std::optional<std::string> current_id_;
    std::vector<AuditEntry> sections_;

    // Открытая секция
    std::optional<char> open_letter_;
    std::string buffer_;

    // id последней завершённой транзакции: повторный маркер Z
    // (закрывающий пустую секцию Z) игнорируется
    std::string last_completed_id_;
};

}  // namespace auditview::io

#endif  // AUDITVIEW_SPLITTER_HPP

// ==============================================================================
// auditview/examiner.hpp - Просмотр индекса: индекс + производное представление
// ==============================================================================
//
// Назначение:
// - Держит неизменяемый GroupIndex и построенный по нему FilteredView
// - refresh() перечитывает файл и заменяет индекс целиком
// - Активный запрос, диапазон времени и порядок вывода
// - Выбранная позиция внутри FilteredView
//
// Использование:
// @code
//   Examiner examiner(path);
//   auto loaded = examiner.refresh();
//   if (!loaded) { writer.error(loaded.error.format()); return 1; }
//   examiner.apply_query("status:50");
//   for (std::size_t pos : examiner.view()) { ... (*examiner.index())[pos] ... }
// @endcode
//
// ==============================================================================

#ifndef AUDITVIEW_EXAMINER_HPP
#define AUDITVIEW_EXAMINER_HPP

#include <auditview/audit.hpp>
#include <auditview/ingest.hpp>
#include <auditview/query.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace auditview::query {

class Examiner {
public:
    explicit Examiner(std::filesystem::path path);

    /// Перечитать файл. При успехе индекс заменяется, представление
    /// пересчитывается, выбор ограничивается новым размером. При ошибке
    /// текущий индекс остаётся без изменений.
    io::IngestResult refresh(const io::ProgressCallback& progress = {});

    /// Заменить индекс готовым (refresh без чтения файла)
    void replace_index(std::shared_ptr<const GroupIndex> index);

    /// Установить запрос; выбор сбрасывается на первую позицию
    void apply_query(std::string_view text);

    void set_time_range(TimeRange range);

    void set_newest_first(bool newest_first);

    const std::filesystem::path& path() const { return path_; }
    const std::shared_ptr<const GroupIndex>& index() const { return index_; }
    const std::string& query_text() const { return query_text_; }
    const SearchQuery& search() const { return search_; }
    const TimeRange& time_range() const { return range_; }
    const FilteredView& view() const { return view_; }

    // -------------------------------------------------------------------------
    // Выбор
    // -------------------------------------------------------------------------

    /// Позиция внутри view(); nullopt если представление пусто
    std::optional<std::size_t> selected() const;

    const AuditGroup* selected_group() const;

    void select(std::size_t position);
    void select_next();
    void select_prev();
    void select_first();
    void select_last();
    void page_down(std::size_t page_size);
    void page_up(std::size_t page_size);

private:
    void recompute_view();
    void clamp_selection();

    std::filesystem::path path_;
    std::shared_ptr<const GroupIndex> index_;

    std::string query_text_;
    SearchQuery search_;
    TimeRange range_;
    bool newest_first_ = false;

    FilteredView view_;
    std::size_t selected_ = 0;
};

}  // namespace auditview::query

#endif  // AUDITVIEW_EXAMINER_HPP

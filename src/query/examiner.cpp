// ==============================================================================
// examiner.cpp - Индекс + представление + выбор
// ==============================================================================

#include <algorithm>
#include <auditview/examiner.hpp>
#include <utility>

namespace auditview::query {

Examiner::Examiner(std::filesystem::path path)
    : path_(std::move(path)), index_(std::make_shared<GroupIndex>()) {}

io::IngestResult Examiner::refresh(const io::ProgressCallback& progress) {
    auto result = io::ingest(path_, progress);
    if (result) {
        replace_index(result.index);
    }
    return result;
}

void Examiner::replace_index(std::shared_ptr<const GroupIndex> index) {
    index_ = index ? std::move(index) : std::make_shared<GroupIndex>();
    recompute_view();
    clamp_selection();
}

void Examiner::apply_query(std::string_view text) {
    query_text_ = std::string(text);
    search_ = SearchQuery::parse(text);
    recompute_view();
    selected_ = 0;
}

void Examiner::set_time_range(TimeRange range) {
    range_ = std::move(range);
    recompute_view();
    selected_ = 0;
}

void Examiner::set_newest_first(bool newest_first) {
    if (newest_first_ == newest_first) {
        return;
    }
    newest_first_ = newest_first;
    recompute_view();
    clamp_selection();
}

void Examiner::recompute_view() {
    view_ = query(*index_, search_, range_);
    if (newest_first_) {
        sort_newest_first(*index_, view_);
    }
}

void Examiner::clamp_selection() {
    if (view_.empty()) {
        selected_ = 0;
    } else {
        selected_ = std::min(selected_, view_.size() - 1);
    }
}

// ============================================================================
// Выбор
// ============================================================================

std::optional<std::size_t> Examiner::selected() const {
    if (view_.empty()) {
        return std::nullopt;
    }
    return selected_;
}

const AuditGroup* Examiner::selected_group() const {
    if (view_.empty()) {
        return nullptr;
    }
    return &(*index_)[view_[selected_]];
}

void Examiner::select(std::size_t position) {
    selected_ = position;
    clamp_selection();
}

void Examiner::select_next() {
    if (selected_ + 1 < view_.size()) {
        ++selected_;
    }
}

void Examiner::select_prev() {
    if (selected_ > 0) {
        --selected_;
    }
}

void Examiner::select_first() {
    selected_ = 0;
}

void Examiner::select_last() {
    selected_ = view_.empty() ? 0 : view_.size() - 1;
}

void Examiner::page_down(std::size_t page_size) {
    if (view_.empty()) {
        return;
    }
    selected_ = std::min(selected_ + page_size, view_.size() - 1);
}

void Examiner::page_up(std::size_t page_size) {
    selected_ = selected_ > page_size ? selected_ - page_size : 0;
}

}  // namespace auditview::query

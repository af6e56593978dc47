// ==============================================================================
// splitter.cpp - Section Splitter
// ==============================================================================
//
// Автомат:
//   маркер с id текущей транзакции, другая буква → закрыть секцию, открыть новую
//   маркер с id и буквой открытой секции         → закрыть секцию
//   маркер Z                                     → транзакция завершена
//   маркер с новым id                            → незавершённая транзакция
//                                                  отбрасывается, начинается новая
//   строка вне секции                            → игнорируется
//
// ==============================================================================

#include <auditview/splitter.hpp>
#include <cctype>

namespace auditview::io {

// ============================================================================
// Маркеры
// ============================================================================

std::optional<Boundary> parse_boundary(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }

    // --X-A-- минимум 7 символов
    if (line.size() < 7) {
        return std::nullopt;
    }
    if (line.substr(0, 2) != "--" || line.substr(line.size() - 2) != "--") {
        return std::nullopt;
    }

    std::string_view inner = line.substr(2, line.size() - 4);  // "<id>-<letter>"
    if (inner.size() < 3 || inner[inner.size() - 2] != '-') {
        return std::nullopt;
    }

    char letter = inner.back();
    if (!is_section_letter(letter)) {
        return std::nullopt;
    }

    std::string_view id = inner.substr(0, inner.size() - 2);
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    return Boundary{id, letter};
}

BoundaryShape BoundaryShape::learn(std::string_view id) {
    BoundaryShape shape;
    shape.length = id.size();
    return shape;
}

bool BoundaryShape::matches(std::string_view id) const {
    return id.size() == length;
}

// ============================================================================
// SectionSplitter
// ============================================================================

SectionSplitter::SectionSplitter(Sink sink) : sink_(std::move(sink)) {}

void SectionSplitter::feed_line(std::string_view line) {
    ++stats_.lines;

    while (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    auto boundary = parse_boundary(line);
    if (boundary) {
        if (!shape_) {
            shape_ = BoundaryShape::learn(boundary->id);
        } else if (!shape_->matches(boundary->id)) {
            // Похоже на маркер, но id другой формы: это данные
            boundary.reset();
        }
    }

    if (!boundary) {
        if (open_letter_) {
            buffer_.append(line.data(), line.size());
            buffer_ += '\n';
        }
        return;
    }

    // Закрывающий маркер пустой секции Z уже завершённой транзакции
    if (!current_id_ && boundary->letter == section::kTerminal &&
        boundary->id == last_completed_id_) {
        return;
    }

    if (current_id_ && boundary->id != *current_id_) {
        // Новый id при незавершённой транзакции: её секции не должны
        // попасть в следующую транзакцию
        discard_transaction();
    }

    if (!current_id_) {
        current_id_ = std::string(boundary->id);
    }

    if (open_letter_ && *open_letter_ == boundary->letter &&
        boundary->letter != section::kTerminal) {
        // Повтор маркера открытой секции: явное закрытие
        close_section();
        return;
    }

    close_section();

    if (boundary->letter == section::kTerminal) {
        sections_.push_back(AuditEntry{section::kTerminal, std::string()});
        ++stats_.sections;
        complete_transaction();
        return;
    }

    open_letter_ = boundary->letter;
    buffer_.clear();
}

void SectionSplitter::finish() {
    if (current_id_) {
        discard_transaction();
    }
}

void SectionSplitter::close_section() {
    if (!open_letter_) {
        return;
    }
    sections_.push_back(AuditEntry{*open_letter_, std::move(buffer_)});
    ++stats_.sections;
    buffer_.clear();
    open_letter_.reset();
}

void SectionSplitter::discard_transaction() {
    if (current_id_) {
        ++stats_.incomplete_discarded;
    }
    current_id_.reset();
    sections_.clear();
    open_letter_.reset();
    buffer_.clear();
}

void SectionSplitter::complete_transaction() {
    RawTransaction tx;
    tx.id = std::move(*current_id_);
    tx.sections = std::move(sections_);
    last_completed_id_ = tx.id;

    current_id_.reset();
    sections_.clear();
    open_letter_.reset();
    buffer_.clear();

    ++stats_.transactions;
    if (sink_) {
        sink_(std::move(tx));
    }
}

}  // namespace auditview::io

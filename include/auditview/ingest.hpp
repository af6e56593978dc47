// ==============================================================================
// auditview/ingest.hpp - Загрузка аудит-лога в GroupIndex
// ==============================================================================
//
// Назначение:
// - Чтение файла лога целиком (блоками, с прогрессом)
// - Разбиение на транзакции (SectionSplitter) и извлечение полей
// - Ошибки уровня файла: IngestResult вместо исключений
//
// Три фазы прогресса: Read (байты файла), Split (байты разобранного текста),
// Extract (транзакции). Callback вызывается на границах фаз и не чаще
// одного раза на kProgressLineInterval строк.
//
// ==============================================================================

#ifndef AUDITVIEW_INGEST_HPP
#define AUDITVIEW_INGEST_HPP

#include <auditview/audit.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace auditview::io {

// ----------------------------------------------------------------------------
// Прогресс
// ----------------------------------------------------------------------------

enum class ProgressPhase { Read, Split, Extract };

const char* progress_phase_name(ProgressPhase phase);

struct Progress {
    ProgressPhase phase = ProgressPhase::Read;
    std::uint64_t current = 0;
    std::uint64_t total = 0;
};

using ProgressCallback = std::function<void(const Progress&)>;

/// Строк между вызовами callback в фазе Split
constexpr std::uint64_t kProgressLineInterval = 1000;

/// Размер блока чтения файла
constexpr std::size_t kReadChunkSize = 1 << 20;

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

enum class IngestErrorKind {
    FileNotFound,
    PermissionDenied,
    NotAFile,
    IoError
};

const char* ingest_error_kind_to_string(IngestErrorKind kind);

struct IngestError {
    IngestErrorKind kind = IngestErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

/// Результат загрузки. При ошибке индекс не создаётся.
struct IngestResult {
    bool ok = false;
    std::shared_ptr<const GroupIndex> index;
    IngestError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить файл лога и построить индекс
IngestResult ingest(const std::filesystem::path& path, const ProgressCallback& progress = {});

/// Построить индекс из текста в памяти (фазы Split и Extract)
std::shared_ptr<const GroupIndex> ingest_text(std::string_view text,
                                              const ProgressCallback& progress = {});

}  // namespace auditview::io

#endif  // AUDITVIEW_INGEST_HPP

// ==============================================================================
// ingest.cpp - Загрузка аудит-лога
// ==============================================================================

#include <auditview/ingest.hpp>
#include <auditview/platform.hpp>
#include <auditview/splitter.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

namespace auditview::io {

const char* progress_phase_name(ProgressPhase phase) {
    switch (phase) {
    case ProgressPhase::Read:
        return "Reading";
    case ProgressPhase::Split:
        return "Splitting";
    case ProgressPhase::Extract:
        return "Indexing";
    }
    return "Unknown";
}

const char* ingest_error_kind_to_string(IngestErrorKind kind) {
    switch (kind) {
    case IngestErrorKind::FileNotFound:
        return "FileNotFound";
    case IngestErrorKind::PermissionDenied:
        return "PermissionDenied";
    case IngestErrorKind::NotAFile:
        return "NotAFile";
    case IngestErrorKind::IoError:
        return "IoError";
    }
    return "Unknown";
}

std::string IngestError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

namespace {

void report(const ProgressCallback& progress, ProgressPhase phase, std::uint64_t current,
            std::uint64_t total) {
    if (progress) {
        progress(Progress{phase, current, total});
    }
}

IngestResult fail(IngestErrorKind kind, std::string message, const std::filesystem::path& path) {
    IngestResult result;
    result.ok = false;
    result.error = IngestError{kind, std::move(message), platform::path_to_utf8(path)};
    return result;
}

}  // anonymous namespace

// ============================================================================
// ingest_text
// ============================================================================

std::shared_ptr<const GroupIndex> ingest_text(std::string_view text,
                                              const ProgressCallback& progress) {
    auto index = std::make_shared<GroupIndex>();
    const std::uint64_t total_bytes = text.size();

    // Split: завершённые транзакции копятся, поля извлекаются отдельной фазой
    std::vector<RawTransaction> pending;
    SectionSplitter splitter([&](RawTransaction&& tx) { pending.push_back(std::move(tx)); });

    report(progress, ProgressPhase::Split, 0, total_bytes);

    std::size_t start = 0;
    std::uint64_t since_report = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        std::size_t end = nl == std::string_view::npos ? text.size() : nl;
        splitter.feed_line(text.substr(start, end - start));
        start = nl == std::string_view::npos ? text.size() : nl + 1;

        if (++since_report >= kProgressLineInterval) {
            since_report = 0;
            report(progress, ProgressPhase::Split, start, total_bytes);
        }
    }
    splitter.finish();
    report(progress, ProgressPhase::Split, total_bytes, total_bytes);

    // Extract
    const std::uint64_t total_tx = pending.size();
    report(progress, ProgressPhase::Extract, 0, total_tx);

    index->groups.reserve(pending.size());
    std::uint64_t done = 0;
    for (auto& tx : pending) {
        index->groups.push_back(fields::extract(std::move(tx.id), std::move(tx.sections)));
        if (++done % kProgressLineInterval == 0) {
            report(progress, ProgressPhase::Extract, done, total_tx);
        }
    }
    report(progress, ProgressPhase::Extract, total_tx, total_tx);

    const auto& stats = splitter.stats();
    index->stats.bytes = total_bytes;
    index->stats.lines = stats.lines;
    index->stats.sections = stats.sections;
    index->stats.transactions = stats.transactions;
    index->stats.incomplete_discarded = stats.incomplete_discarded;

    return index;
}

// ============================================================================
// ingest
// ============================================================================

IngestResult ingest(const std::filesystem::path& path, const ProgressCallback& progress) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        if (ec == std::errc::permission_denied) {
            return fail(IngestErrorKind::PermissionDenied, "permission denied", path);
        }
        return fail(IngestErrorKind::FileNotFound, "file not found", path);
    }
    if (!std::filesystem::is_regular_file(status)) {
        return fail(IngestErrorKind::NotAFile, "not a regular file", path);
    }

    std::uint64_t file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        file_size = 0;
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            return fail(IngestErrorKind::PermissionDenied, "permission denied", path);
        }
        return fail(IngestErrorKind::IoError,
                    err != 0 ? std::string("could not open file: ") + std::strerror(err)
                             : std::string("could not open file"),
                    path);
    }

    // Read
    std::string text;
    text.reserve(static_cast<std::size_t>(file_size));
    std::vector<char> chunk(kReadChunkSize);

    report(progress, ProgressPhase::Read, 0, file_size);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        std::streamsize got = file.gcount();
        if (got > 0) {
            text.append(chunk.data(), static_cast<std::size_t>(got));
            report(progress, ProgressPhase::Read, text.size(), file_size);
        }
    }
    if (file.bad()) {
        return fail(IngestErrorKind::IoError, "read error", path);
    }
    report(progress, ProgressPhase::Read, text.size(), text.size());

    IngestResult result;
    result.ok = true;
    result.index = ingest_text(text, progress);
    return result;
}

}  // namespace auditview::io

// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (config)
// 4. Dispatch команды
// 5. Возврат exit code
//
// ==============================================================================

#include <auditview/audit.hpp>
#include <auditview/cli.hpp>
#include <auditview/config.hpp>
#include <auditview/examiner.hpp>
#include <auditview/geo.hpp>
#include <auditview/ingest.hpp>
#include <auditview/output.hpp>
#include <auditview/platform.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

using namespace auditview;

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
     █████╗ ██╗   ██╗██████╗ ██╗████████╗██╗   ██╗██╗███████╗██╗    ██╗
    ██╔══██╗██║   ██║██╔══██╗██║╚══██╔══╝██║   ██║██║██╔════╝██║    ██║
    ███████║██║   ██║██║  ██║██║   ██║   ██║   ██║██║█████╗  ██║ █╗ ██║
    ██╔══██║██║   ██║██║  ██║██║   ██║   ╚██╗ ██╔╝██║██╔══╝  ██║███╗██║
    ██║  ██║╚██████╔╝██████╔╝██║   ██║    ╚████╔╝ ██║███████╗╚███╔███╔╝
    ╚═╝  ╚═╝ ╚═════╝ ╚═════╝ ╚═╝   ╚═╝     ╚═══╝  ╚═╝╚══════╝ ╚══╝╚══╝
)";

void print_banner(output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

/// Размер в человекочитаемом виде
std::string format_size(std::uint64_t bytes) {
    const char* units[] = {"B", "KiB", "MiB", "GiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), unit == 0 ? "%.0f %s" : "%.1f %s", value, units[unit]);
    return buf;
}

// ----------------------------------------------------------------------------
// Загрузка журнала
// ----------------------------------------------------------------------------

/// Перечитать журнал через Examiner с индикатором прогресса по фазам
io::IngestResult load_log(query::Examiner& examiner, output::Writer& writer) {
    writer.info("Loading audit log: " + platform::path_to_utf8(examiner.path()));

    std::optional<io::ProgressPhase> phase;
    auto progress = [&](const io::Progress& p) {
        if (!phase || *phase != p.phase) {
            writer.progress_begin(io::progress_phase_name(p.phase), p.total);
            phase = p.phase;
        }
        writer.progress_tick(p.current);
    };

    const auto started = std::chrono::steady_clock::now();
    io::IngestResult loaded = examiner.refresh(progress);
    writer.progress_end();

    if (!loaded) {
        writer.error(loaded.error.format());
        return loaded;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    const IngestStats& stats = loaded.index->stats;
    writer.info("Indexed " + std::to_string(stats.transactions) + " transactions (" +
                std::to_string(stats.sections) + " sections, " + std::to_string(stats.lines) +
                " lines, " + format_size(stats.bytes) + ")");
    writer.debug("Load finished in " + std::to_string(elapsed.count()) + " ms");
    if (stats.incomplete_discarded > 0) {
        writer.warn("Discarded " + std::to_string(stats.incomplete_discarded) +
                    " incomplete transaction(s) without a terminating section");
    }
    return loaded;
}

std::unique_ptr<geo::GeoCache> make_geo_cache(const config::Config& cfg) {
    auto transport = std::make_shared<geo::CurlTransport>(cfg.geo.timeout_ms);
    return std::make_unique<geo::GeoCache>(std::move(transport), cfg.geo.endpoint);
}

/// "File: X | Rule ID: Y"
std::string format_rule_line(const AuditGroup& group) {
    std::string out = "File: ";
    out += group.rule_file.value_or("N/A");
    out += " | Rule ID: ";
    out += group.rule_ids.empty() ? std::string("N/A") : group.rule_ids.front();
    return out;
}

/// Геолокация адреса клиента; nullptr если она выключена или не удалась
std::shared_ptr<const geo::GeoRecord> lookup_client(const AuditGroup& group,
                                                    geo::GeoCache* cache,
                                                    output::Writer& writer) {
    if (cache == nullptr) {
        return nullptr;
    }
    if (group.client_address == kUnknownAddress) {
        writer.debug("No client address in transaction " + group.transaction_id);
        return nullptr;
    }
    geo::LookupResult found = geo::lookup_address(*cache, group.client_address);
    if (!found) {
        writer.warn(found.error.format());
        return nullptr;
    }
    writer.trace("Geolocation for " + group.client_address +
                 (found.from_cache ? " (cached)" : " (fetched)"));
    return found.record;
}

/// Подробный вид транзакции: поля, секции, правило и геолокация
void print_group(const AuditGroup& group, geo::GeoCache* cache, output::Writer& writer) {
    writer.write(output::Stream::Stdout, output::format_group_detail(group));
    writer.write_line(output::Stream::Stdout, "");
    writer.write(output::Stream::Stdout, raw_content(group));
    writer.write_line(output::Stream::Stdout, "");
    writer.colored_line(format_rule_line(group), output::Color::Cyan);

    if (auto record = lookup_client(group, cache, writer)) {
        writer.write_line(output::Stream::Stdout, "");
        writer.colored_line("IP Geolocation & Network Information", output::Color::Green);
        writer.write_line(output::Stream::Stdout, geo::geo_record_to_json(*record));
    }
}

// ----------------------------------------------------------------------------
// list
// ----------------------------------------------------------------------------

void print_table(const query::Examiner& examiner, const std::vector<std::size_t>& positions,
                 const std::vector<Column>& columns, std::size_t width, const ColumnOptions& opts,
                 bool full, std::optional<std::size_t> marked, output::Writer& writer) {
    output::Table table;
    std::vector<std::string> headers;
    if (marked) {
        headers.emplace_back("");
    }
    for (Column c : columns) {
        headers.emplace_back(column_header(c));
    }
    table.set_headers(headers);

    const GroupIndex& index = *examiner.index();
    for (std::size_t view_pos : positions) {
        const AuditGroup& group = index[examiner.view()[view_pos]];
        std::vector<std::string> row;
        if (marked) {
            row.emplace_back(view_pos == *marked ? ">" : "");
        }
        for (const auto& cell : column_values(group, columns, opts)) {
            row.push_back(output::format_field_length(cell, width, full));
        }
        table.add_row(row);
    }
    table.print(writer);
}

int run_list(const cli::ListCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    query::Examiner examiner(cmd.path);
    if (!load_log(examiner, writer)) {
        return 1;
    }

    query::TimeRange range;
    range.from = cmd.from;
    range.to = cmd.to;
    examiner.set_time_range(range);
    examiner.set_newest_first(cmd.newest_first || cfg.display.newest_first);
    if (cmd.search) {
        examiner.apply_query(*cmd.search);
    }

    const auto& view = examiner.view();
    if (view.empty()) {
        writer.warn("No matching transactions");
        return 0;
    }

    const std::vector<Column> columns = cmd.columns.value_or(cfg.display.columns);
    const std::size_t width = cmd.column_width ? *cmd.column_width : cfg.display.column_width;
    ColumnOptions opts;
    opts.max_rule_ids = cmd.max_rule_ids.value_or(cfg.display.max_rule_ids);

    std::vector<std::size_t> positions(view.size());
    for (std::size_t i = 0; i < positions.size(); ++i) {
        positions[i] = i;
    }
    print_table(examiner, positions, columns, width, opts, cmd.full, std::nullopt, writer);

    writer.info(std::to_string(view.size()) + " of " + std::to_string(examiner.index()->size()) +
                " transactions shown");
    return 0;
}

// ----------------------------------------------------------------------------
// show
// ----------------------------------------------------------------------------

int run_show(const cli::ShowCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    query::Examiner examiner(cmd.path);
    if (!load_log(examiner, writer)) {
        return 1;
    }

    const GroupIndex& index = *examiner.index();
    auto pos = index.find(cmd.audit_id);
    if (!pos) {
        writer.error("transaction '" + cmd.audit_id + "' not found");
        return 1;
    }
    const AuditGroup& group = index[*pos];

    std::unique_ptr<geo::GeoCache> cache;
    if (cmd.ip_api.value_or(cfg.geo.enabled)) {
        cache = make_geo_cache(cfg);
    }

    if (!cmd.json) {
        print_group(group, cache.get(), writer);
        return 0;
    }

    rapidjson::Document doc;
    auto& alloc = doc.GetAllocator();
    output::group_to_json(group, doc, alloc, true);

    if (auto record = lookup_client(group, cache.get(), writer)) {
        rapidjson::Value geo_value;
        geo::geo_record_to_value(*record, geo_value, alloc);
        doc.AddMember("geo", geo_value, alloc);
    }
    writer.write_json_pretty(doc);
    return 0;
}

// ----------------------------------------------------------------------------
// dump
// ----------------------------------------------------------------------------

int run_dump(const cli::DumpCommand& cmd, const cli::GlobalOptions& global,
             output::Writer& writer) {
    query::Examiner examiner(cmd.path);
    if (!load_log(examiner, writer)) {
        return 1;
    }
    if (cmd.search) {
        examiner.apply_query(*cmd.search);
    }

    // При -o результаты пишутся отдельным Writer в файл
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output) {
        output::OutputConfig file_cfg;
        file_cfg.quiet = global.quiet;
        file_cfg.verbose = global.verbose;
        file_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(file_cfg);
        if (!file_writer->open_output_file()) {
            writer.error("could not create output file '" + platform::path_to_utf8(*cmd.output) +
                         "'");
            return 1;
        }
        out = file_writer.get();
    }

    const GroupIndex& index = *examiner.index();
    const auto& view = examiner.view();

    if (cmd.json || cmd.jsonl) {
        rapidjson::Document doc;
        auto& alloc = doc.GetAllocator();
        if (cmd.json) {
            out->write(output::Stream::Stdout, "[");
        }
        bool first = true;
        for (std::size_t pos : view) {
            rapidjson::Value item;
            output::group_to_json(index[pos], item, alloc, cmd.sections);
            if (cmd.jsonl) {
                out->write_json_line(item);
                continue;
            }
            if (!first) {
                out->write(output::Stream::Stdout, ",\n");
            }
            first = false;
            out->write_json_pretty(item);
        }
        if (cmd.json) {
            out->write_line(output::Stream::Stdout, "]");
        }
    } else {
        for (std::size_t pos : view) {
            out->write(output::Stream::Stdout, raw_content(index[pos]));
        }
    }

    out->flush();
    if (file_writer) {
        file_writer->close_output_file();
        writer.info("Wrote " + std::to_string(view.size()) + " transactions to " +
                    platform::path_to_utf8(*cmd.output));
    } else {
        writer.debug("Dumped " + std::to_string(view.size()) + " transactions");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// geo
// ----------------------------------------------------------------------------

int run_geo(const cli::GeoCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto cache = make_geo_cache(cfg);
    int exit_code = 0;

    for (const auto& address : cmd.addresses) {
        geo::LookupResult found = geo::lookup_address(*cache, address);
        if (!found) {
            writer.error(found.error.format());
            exit_code = 1;
            continue;
        }
        writer.info(address + " -> " + geo::cache_key(address) +
                    (found.from_cache ? " (cached)" : ""));
        writer.write_line(output::Stream::Stdout, geo::geo_record_to_json(*found.record));
    }
    writer.debug("Cache holds " + std::to_string(cache->size()) + " subnet(s)");
    return exit_code;
}

// ----------------------------------------------------------------------------
// browse
// ----------------------------------------------------------------------------

void print_selection(const query::Examiner& examiner, output::Writer& writer) {
    const AuditGroup* group = examiner.selected_group();
    if (group == nullptr) {
        writer.warn("No matching transactions");
        return;
    }
    std::string line = "[" + std::to_string(*examiner.selected() + 1) + "/" +
                       std::to_string(examiner.view().size()) + "] ";
    line += group->transaction_id;
    line += " | " + column_value(*group, Column::Timestamp);
    line += " | " + group->host;
    line += " | " + group->client_address;
    line += " | " + column_value(*group, Column::Status);
    writer.write_line(output::Stream::Stdout, line);
}

int run_browse(const cli::BrowseCommand& cmd, const config::Config& cfg,
               output::Writer& writer) {
    query::Examiner examiner(cmd.path);
    if (!load_log(examiner, writer)) {
        return 1;
    }
    examiner.set_newest_first(cfg.display.newest_first);

    std::unique_ptr<geo::GeoCache> cache;
    if (cmd.ip_api.value_or(cfg.geo.enabled)) {
        cache = make_geo_cache(cfg);
    }

    const std::size_t page = std::max<std::size_t>(1, cmd.page_size.value_or(20));
    ColumnOptions opts;
    opts.max_rule_ids = cfg.display.max_rule_ids;

    print_selection(examiner, writer);

    std::string line;
    while (true) {
        writer.write(output::Stream::Stderr, "auditview> ");
        writer.flush();
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.empty()) {
            continue;
        }
        if (line == "q") {
            break;
        }
        if (line == "h") {
            writer.write(output::Stream::Stdout, cli::render_help(std::string("browse")));
            continue;
        }
        if (line[0] == '/') {
            examiner.apply_query(line.substr(1));
            writer.info(std::to_string(examiner.view().size()) + " of " +
                        std::to_string(examiner.index()->size()) + " transactions match");
            print_selection(examiner, writer);
            continue;
        }
        if (line == "r") {
            if (!load_log(examiner, writer)) {
                writer.warn("Keeping the previously loaded transactions");
            }
            print_selection(examiner, writer);
            continue;
        }
        if (line == "s") {
            if (const AuditGroup* group = examiner.selected_group()) {
                print_group(*group, cache.get(), writer);
            } else {
                writer.warn("No transaction selected");
            }
            continue;
        }
        if (line == "l") {
            auto selected = examiner.selected();
            if (!selected) {
                writer.warn("No matching transactions");
                continue;
            }
            const std::size_t start = (*selected / page) * page;
            const std::size_t stop = std::min(start + page, examiner.view().size());
            std::vector<std::size_t> positions;
            for (std::size_t i = start; i < stop; ++i) {
                positions.push_back(i);
            }
            print_table(examiner, positions, cfg.display.columns, cfg.display.column_width, opts,
                        false, selected, writer);
            continue;
        }

        if (line == "n") {
            examiner.select_next();
        } else if (line == "p") {
            examiner.select_prev();
        } else if (line == "N") {
            examiner.page_down(page);
        } else if (line == "P") {
            examiner.page_up(page);
        } else if (line == "g") {
            examiner.select_first();
        } else if (line == "G") {
            examiner.select_last();
        } else {
            writer.warn("unknown command '" + line + "' (try 'h')");
            continue;
        }
        print_selection(examiner, writer);
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Dispatch
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parsed = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parsed.global.quiet;
    out_cfg.verbose = parsed.global.verbose;
    out_cfg.no_banner = parsed.global.no_banner;
    output::Writer writer(out_cfg);

    if (!parsed.ok) {
        writer.write(output::Stream::Stderr, parsed.diagnostic.stderr_message);
        return parsed.diagnostic.exit_code;
    }

    return std::visit(
        [&](const auto& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                print_banner(writer, parsed.global.no_banner, parsed.global.quiet);
                writer.debug(std::string("auditview ") + cli::VERSION + " on " +
                             platform::os_name());

                config::ConfigResult loaded = config::resolve_config(parsed.global.config);
                if (!loaded) {
                    writer.error(loaded.error);
                    return 1;
                }
                const config::Config& cfg = loaded.config;
                if (cfg.source) {
                    writer.debug("Using configuration: " + platform::path_to_utf8(*cfg.source));
                }

                if constexpr (std::is_same_v<T, cli::ListCommand>) {
                    return run_list(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::ShowCommand>) {
                    return run_show(cmd, cfg, writer);
                } else if constexpr (std::is_same_v<T, cli::DumpCommand>) {
                    return run_dump(cmd, parsed.global, writer);
                } else if constexpr (std::is_same_v<T, cli::GeoCommand>) {
                    return run_geo(cmd, cfg, writer);
                } else {
                    return run_browse(cmd, cfg, writer);
                }
            }
        },
        parsed.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[x] %s\n", e.what());
        return 1;
    } catch (...) {
        std::fprintf(stderr, "[x] Unknown error occurred\n");
        return 1;
    }
}

// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный разбор argv: глобальные опции до подкоманды (а -v/-q/--no-banner
// также после неё), затем опции подкоманды. Опции со значением принимают
// форму "--opt VALUE" и "--opt=VALUE".
//
// ==============================================================================

#include <auditview/cli.hpp>
#include <auditview/platform.hpp>
#include <cctype>
#include <cstring>

namespace auditview::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

std::string usage_line(const std::string& command) {
    if (command == "list") {
        return "Usage: auditview list [OPTIONS] <FILE>";
    }
    if (command == "show") {
        return "Usage: auditview show [OPTIONS] <FILE> <AUDIT_ID>";
    }
    if (command == "dump") {
        return "Usage: auditview dump [OPTIONS] <FILE>";
    }
    if (command == "geo") {
        return "Usage: auditview geo <ADDRESS>...";
    }
    if (command == "browse") {
        return "Usage: auditview browse [OPTIONS] <FILE>";
    }
    return "Usage: auditview [OPTIONS] <COMMAND>";
}

std::string render_usage_error(const std::string& error_msg, const std::string& command = "") {
    return "error: " + error_msg + "\n\n" + usage_line(command) +
           "\n\nFor more information, try '--help'.\n";
}

/// Разбор опций подкоманды с поддержкой "--opt=value"
class ArgCursor {
public:
    ArgCursor(int argc, char** argv, int start) : argc_(argc), argv_(argv), index_(start) {}

    bool next() {
        if (index_ >= argc_) {
            return false;
        }
        const char* raw = argv_[index_++];
        inline_value_.reset();
        const char* eq = raw[0] == '-' && raw[1] == '-' ? std::strchr(raw, '=') : nullptr;
        if (eq != nullptr) {
            name_.assign(raw, static_cast<std::size_t>(eq - raw));
            inline_value_ = std::string(eq + 1);
        } else {
            name_ = raw;
        }
        return true;
    }

    const char* arg() const { return name_.c_str(); }

    bool is(const char* a, const char* b = nullptr) const {
        return str_eq(arg(), a) || (b != nullptr && str_eq(arg(), b));
    }

    bool positional() const { return name_.empty() || name_[0] != '-' || name_ == "-"; }

    /// Значение опции; nullopt если аргументы закончились
    std::optional<std::string> value() {
        if (inline_value_) {
            return inline_value_;
        }
        if (index_ >= argc_) {
            return std::nullopt;
        }
        return std::string(argv_[index_++]);
    }

    /// Индекс следующего аргумента argv
    int index() const { return index_; }

private:
    int argc_;
    char** argv_;
    int index_;
    std::string name_;
    std::optional<std::string> inline_value_;
};

bool apply_global_flag(const ArgCursor& cur, GlobalOptions& global) {
    if (cur.is("--no-banner")) {
        global.no_banner = true;
        return true;
    }
    if (cur.is("-q", "--quiet")) {
        global.quiet = true;
        return true;
    }
    // -v, -vv, -vvv
    const char* a = cur.arg();
    if (a[0] == '-' && a[1] == 'v') {
        int count = 0;
        for (const char* p = a + 1; *p != '\0'; ++p) {
            if (*p != 'v') {
                return false;
            }
            ++count;
        }
        global.verbose += count;
        return true;
    }
    return false;
}

ParseResult usage_error(ParseResult result, const std::string& message,
                        const std::string& command = "") {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, command);
    return result;
}

ParseResult missing_value(ParseResult result, const ArgCursor& cur, const std::string& command) {
    return usage_error(std::move(result),
                       std::string("a value is required for '") + cur.arg() + "' but none was supplied",
                       command);
}

std::optional<std::uint32_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint32_t>(c - '0');
    }
    return value;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Значения аргументов
// ----------------------------------------------------------------------------

std::optional<Timestamp> parse_time_argument(std::string_view text) {
    if (auto ts = Timestamp::parse_iso(text)) {
        return ts;
    }
    return Timestamp::parse_log(text);
}

std::optional<bool> parse_bool_argument(std::string_view text) {
    std::string lower;
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("auditview ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: auditview [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  list    List transactions as a table\n"
               "  show    Show one transaction with all of its sections\n"
               "  dump    Dump transactions as text, JSON or JSON lines\n"
               "  geo     Look up geolocation data for client addresses\n"
               "  browse  Step through transactions interactively\n"
               "  help    Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --no-banner      Hide the banner\n"
               "      --config <FILE>  Configuration file (default: ./auditview.yml)\n"
               "  -v...                Print verbose output\n"
               "  -q                   Suppress informational output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Search queries:\n"
               "    domain:<text>   ip:<text>   rule:<text>   auditid:<text>   status:<text>\n"
               "    Anything else is matched against every field.\n"
               "\n"
               "Examples:\n"
               "\n"
               "    List blocked requests for one site:\n"
               "        ./auditview list modsec_audit.log -s domain:example.com\n"
               "\n"
               "    Show a transaction together with client geolocation:\n"
               "        ./auditview show modsec_audit.log 8a3f9c21\n"
               "\n"
               "    Dump all transactions that triggered a SQL injection rule:\n"
               "        ./auditview dump modsec_audit.log -s rule:942 --jsonl\n";
    } else if (*command == "list") {
        return "List transactions as a table\n"
               "\n"
               "Usage: auditview list [OPTIONS] <FILE>\n"
               "\n"
               "Arguments:\n"
               "  <FILE>  Path to a serial audit log\n"
               "\n"
               "Options:\n"
               "  -s, --search <QUERY>          Only list transactions matching the query\n"
               "      --columns <LIST>          Columns: id,timestamp,domain,address,status,rules,file\n"
               "      --from <TIMESTAMP>        Only list transactions at or after this time\n"
               "      --to <TIMESTAMP>          Only list transactions at or before this time\n"
               "      --newest-first            Sort by timestamp, newest first\n"
               "  -w, --column-width <WIDTH>    Wrap cells at this width (0 = no wrapping)\n"
               "      --max-rule-ids <COUNT>    Rule ids shown before abbreviating (0 = all)\n"
               "  -F, --full                    Do not truncate long cells\n"
               "  -h, --help                    Print help\n";
    } else if (*command == "show") {
        return "Show one transaction with all of its sections\n"
               "\n"
               "Usage: auditview show [OPTIONS] <FILE> <AUDIT_ID>\n"
               "\n"
               "Arguments:\n"
               "  <FILE>      Path to a serial audit log\n"
               "  <AUDIT_ID>  Boundary id of the transaction\n"
               "\n"
               "Options:\n"
               "      --ip-api <BOOL>  Look up the client address [default: true]\n"
               "      --no-ip-api      Same as --ip-api false\n"
               "  -j, --json           Output as JSON\n"
               "  -h, --help           Print help\n";
    } else if (*command == "dump") {
        return "Dump transactions as text, JSON or JSON lines\n"
               "\n"
               "Usage: auditview dump [OPTIONS] <FILE>\n"
               "\n"
               "Arguments:\n"
               "  <FILE>  Path to a serial audit log\n"
               "\n"
               "Options:\n"
               "  -s, --search <QUERY>   Only dump transactions matching the query\n"
               "  -j, --json             Output as JSON\n"
               "      --jsonl            Output as JSON lines\n"
               "      --sections         Include raw sections in JSON output\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -h, --help             Print help\n";
    } else if (*command == "geo") {
        return "Look up geolocation data for client addresses\n"
               "\n"
               "Usage: auditview geo <ADDRESS>...\n"
               "\n"
               "Arguments:\n"
               "  <ADDRESS>...  IPv4 or IPv6 addresses\n"
               "\n"
               "Options:\n"
               "  -h, --help  Print help\n";
    } else if (*command == "browse") {
        return "Step through transactions interactively\n"
               "\n"
               "Usage: auditview browse [OPTIONS] <FILE>\n"
               "\n"
               "Arguments:\n"
               "  <FILE>  Path to a serial audit log\n"
               "\n"
               "Options:\n"
               "      --ip-api <BOOL>       Look up client addresses on show [default: true]\n"
               "      --no-ip-api           Same as --ip-api false\n"
               "      --page-size <ROWS>    Rows per page [default: 20]\n"
               "  -h, --help                Print help\n"
               "\n"
               "Commands read from stdin:\n"
               "  n / p      next / previous transaction\n"
               "  N / P      next / previous page\n"
               "  g / G      first / last transaction\n"
               "  l          list the current page\n"
               "  s          show the selected transaction\n"
               "  /<QUERY>   apply a search query (empty clears it)\n"
               "  r          reload the file\n"
               "  h          print this help\n"
               "  q          quit\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    ArgCursor cur(argc, argv, 1);
    std::string cmd;
    int cmd_next = argc;
    while (cur.next()) {
        if (apply_global_flag(cur, result.global)) {
            continue;
        }
        if (cur.is("--config")) {
            auto value = cur.value();
            if (!value) {
                return missing_value(std::move(result), cur, "");
            }
            result.global.config = platform::path_from_utf8(*value);
        } else if (cur.is("-h", "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (cur.is("-V", "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (cur.positional()) {
            cmd = cur.arg();
            cmd_next = cur.index();
            break;
        } else {
            return usage_error(std::move(result),
                               std::string("unexpected argument '") + cur.arg() + "' found");
        }
    }

    if (cmd.empty()) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    ArgCursor sub(argc, argv, cmd_next);

    if (cmd == "list") {
        ListCommand list;
        bool have_path = false;
        while (sub.next()) {
            if (apply_global_flag(sub, result.global)) {
                continue;
            }
            if (sub.is("-h", "--help")) {
                result.ok = true;
                result.command = HelpCommand{"list"};
                return result;
            } else if (sub.is("-s", "--search")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                list.search = *v;
            } else if (sub.is("--columns")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                auto columns = parse_columns(*v);
                if (!columns || columns->empty()) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '--columns <LIST>'", cmd);
                }
                list.columns = std::move(*columns);
            } else if (sub.is("--from") || sub.is("--to")) {
                bool from = sub.is("--from");
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                auto ts = parse_time_argument(*v);
                if (!ts) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '" +
                                           (from ? "--from" : "--to") + " <TIMESTAMP>'",
                                       cmd);
                }
                (from ? list.from : list.to) = *ts;
            } else if (sub.is("-w", "--column-width")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                auto width = parse_unsigned(*v);
                if (!width) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '--column-width <WIDTH>'",
                                       cmd);
                }
                list.column_width = *width;
            } else if (sub.is("--max-rule-ids")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                auto count = parse_unsigned(*v);
                if (!count) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '--max-rule-ids <COUNT>'",
                                       cmd);
                }
                list.max_rule_ids = *count;
            } else if (sub.is("--newest-first")) {
                list.newest_first = true;
            } else if (sub.is("-F", "--full")) {
                list.full = true;
            } else if (sub.positional() && !have_path) {
                list.path = platform::path_from_utf8(sub.arg());
                have_path = true;
            } else {
                return usage_error(std::move(result),
                                   std::string("unexpected argument '") + sub.arg() + "' found",
                                   cmd);
            }
        }
        if (!have_path) {
            return usage_error(std::move(result),
                               "the following required arguments were not provided:\n  <FILE>",
                               cmd);
        }
        result.ok = true;
        result.command = std::move(list);
    } else if (cmd == "show" || cmd == "browse") {
        ShowCommand show;
        BrowseCommand browse;
        std::vector<std::string> positionals;
        std::optional<bool> ip_api;
        while (sub.next()) {
            if (apply_global_flag(sub, result.global)) {
                continue;
            }
            if (sub.is("-h", "--help")) {
                result.ok = true;
                result.command = HelpCommand{cmd};
                return result;
            } else if (sub.is("--no-ip-api")) {
                ip_api = false;
            } else if (sub.is("--ip-api")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                ip_api = parse_bool_argument(*v);
                if (!ip_api) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '--ip-api <BOOL>'", cmd);
                }
            } else if (cmd == "show" && sub.is("-j", "--json")) {
                show.json = true;
            } else if (cmd == "browse" && sub.is("--page-size")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                auto rows = parse_unsigned(*v);
                if (!rows || *rows == 0) {
                    return usage_error(std::move(result),
                                       "invalid value '" + *v + "' for '--page-size <ROWS>'", cmd);
                }
                browse.page_size = *rows;
            } else if (sub.positional()) {
                positionals.emplace_back(sub.arg());
            } else {
                return usage_error(std::move(result),
                                   std::string("unexpected argument '") + sub.arg() + "' found",
                                   cmd);
            }
        }

        std::size_t expected = cmd == "show" ? 2 : 1;
        if (positionals.size() < expected) {
            std::string missing;
            if (positionals.empty()) {
                missing += "\n  <FILE>";
            }
            if (cmd == "show") {
                missing += "\n  <AUDIT_ID>";
            }
            return usage_error(std::move(result),
                               "the following required arguments were not provided:" + missing,
                               cmd);
        }
        if (positionals.size() > expected) {
            return usage_error(std::move(result),
                               "unexpected argument '" + positionals[expected] + "' found", cmd);
        }

        if (cmd == "show") {
            show.path = platform::path_from_utf8(positionals[0]);
            show.audit_id = positionals[1];
            show.ip_api = ip_api;
            result.command = std::move(show);
        } else {
            browse.path = platform::path_from_utf8(positionals[0]);
            browse.ip_api = ip_api;
            result.command = std::move(browse);
        }
        result.ok = true;
    } else if (cmd == "dump") {
        DumpCommand dump;
        bool have_path = false;
        while (sub.next()) {
            if (apply_global_flag(sub, result.global)) {
                continue;
            }
            if (sub.is("-h", "--help")) {
                result.ok = true;
                result.command = HelpCommand{"dump"};
                return result;
            } else if (sub.is("-s", "--search")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                dump.search = *v;
            } else if (sub.is("-j", "--json")) {
                dump.json = true;
            } else if (sub.is("--jsonl")) {
                dump.jsonl = true;
            } else if (sub.is("--sections")) {
                dump.sections = true;
            } else if (sub.is("-o", "--output")) {
                auto v = sub.value();
                if (!v) {
                    return missing_value(std::move(result), sub, cmd);
                }
                dump.output = platform::path_from_utf8(*v);
            } else if (sub.positional() && !have_path) {
                dump.path = platform::path_from_utf8(sub.arg());
                have_path = true;
            } else {
                return usage_error(std::move(result),
                                   std::string("unexpected argument '") + sub.arg() + "' found",
                                   cmd);
            }
        }
        if (!have_path) {
            return usage_error(std::move(result),
                               "the following required arguments were not provided:\n  <FILE>",
                               cmd);
        }
        if (dump.json && dump.jsonl) {
            return usage_error(std::move(result),
                               "the argument '--json' cannot be used with '--jsonl'", cmd);
        }
        result.ok = true;
        result.command = std::move(dump);
    } else if (cmd == "geo") {
        GeoCommand geo;
        while (sub.next()) {
            if (apply_global_flag(sub, result.global)) {
                continue;
            }
            if (sub.is("-h", "--help")) {
                result.ok = true;
                result.command = HelpCommand{"geo"};
                return result;
            } else if (sub.positional()) {
                geo.addresses.emplace_back(sub.arg());
            } else {
                return usage_error(std::move(result),
                                   std::string("unexpected argument '") + sub.arg() + "' found",
                                   cmd);
            }
        }
        if (geo.addresses.empty()) {
            return usage_error(std::move(result),
                               "the following required arguments were not provided:\n  <ADDRESS>...",
                               cmd);
        }
        result.ok = true;
        result.command = std::move(geo);
    } else if (cmd == "help") {
        result.ok = true;
        if (sub.next()) {
            result.command = HelpCommand{std::string(sub.arg())};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        return usage_error(std::move(result), "unrecognized subcommand '" + cmd + "'");
    }

    return result;
}

}  // namespace auditview::cli

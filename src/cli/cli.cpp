// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный слой CLI без сторонних библиотек: формат справки и ошибок
// полностью под контролем проекта.
//
// ==============================================================================

#include <scanconv/cli.hpp>

#include <scanconv/platform.hpp>

#include <cstring>

namespace scanconv::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

constexpr const char* MAIN_USAGE = "Usage: scanconv [OPTIONS] <COMMAND>";
constexpr const char* CONVERT_USAGE = "Usage: scanconv convert [OPTIONS] <REPORT>";
constexpr const char* CATALOG_USAGE = "Usage: scanconv catalog [OPTIONS]";

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

/// Опция со значением: "-d DIR", "--output-dir DIR" или "--output-dir=DIR"
///
/// Состояние разбора одного аргумента:
///   Matched - опция распознана, значение в value
///   Missing - опция распознана, значения нет (ошибка)
///   NoMatch - другая опция
enum class OptionMatch { NoMatch, Matched, Missing };

OptionMatch match_value_option(int argc, char** argv, int& i, const char* short_name,
                               const char* long_name, std::string& value) {
    const char* arg = argv[i];

    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 >= argc) {
            return OptionMatch::Missing;
        }
        ++i;
        value = argv[i];
        return OptionMatch::Matched;
    }

    const std::size_t long_len = std::strlen(long_name);
    if (starts_with(arg, long_name) && arg[long_len] == '=') {
        value = arg + long_len + 1;
        return value.empty() ? OptionMatch::Missing : OptionMatch::Matched;
    }
    return OptionMatch::NoMatch;
}

struct ValueOption {
    const char* short_name;
    const char* long_name;
    const char* value_name;
};

std::string missing_value_error(const char* long_name, const char* value_name, const char* usage) {
    return render_usage_error(std::string("error: a value is required for '") + long_name + " <" +
                                  value_name + ">' but none was supplied",
                              usage);
}

std::string unexpected_argument_error(const char* arg, const char* usage) {
    return render_usage_error(std::string("error: unexpected argument '") + arg + "' found",
                              usage);
}

/// Разбор аргументов convert начиная с argv[first]
void parse_convert(int argc, char** argv, int first, ParseResult& result) {
    ConvertCommand convert_cmd;
    bool have_report = false;

    static const ValueOption OUTPUT_DIR{"-d", "--output-dir", "DIR"};
    static const ValueOption HTTP{nullptr, "--http", "FILE"};
    static const ValueOption ENV{nullptr, "--env", "FILE"};
    static const ValueOption UNKNOWN{nullptr, "--unknown", "FILE"};
    static const ValueOption RESPONSES{nullptr, "--responses", "DIR"};
    static const ValueOption CATALOG{"-c", "--catalog", "FILE"};
    static const ValueOption ENV_NAME{nullptr, "--env-name", "NAME"};
    static const ValueOption SCHEMA{nullptr, "--schema", "URL"};

    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;
        OptionMatch m = OptionMatch::NoMatch;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"convert"};
            return;
        } else if (str_eq(arg, "--disambiguate")) {
            convert_cmd.disambiguate = true;
            continue;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
            continue;
        } else if (str_eq(arg, "-v")) {
            result.global.verbose++;
            continue;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
            continue;
        }

        // Опции со значением
        const ValueOption* missing = nullptr;
        auto try_option = [&](const ValueOption& opt) {
            if (m != OptionMatch::NoMatch) {
                return false;
            }
            m = match_value_option(argc, argv, i, opt.short_name, opt.long_name, value);
            if (m == OptionMatch::Missing) {
                missing = &opt;
            }
            return m == OptionMatch::Matched;
        };

        if (try_option(OUTPUT_DIR)) {
            convert_cmd.output_dir = platform::path_from_utf8(value);
        } else if (try_option(HTTP)) {
            convert_cmd.http = platform::path_from_utf8(value);
        } else if (try_option(ENV_NAME)) {
            convert_cmd.env_name = value;
        } else if (try_option(ENV)) {
            convert_cmd.env = platform::path_from_utf8(value);
        } else if (try_option(UNKNOWN)) {
            convert_cmd.unknown = platform::path_from_utf8(value);
        } else if (try_option(RESPONSES)) {
            convert_cmd.responses = platform::path_from_utf8(value);
        } else if (try_option(CATALOG)) {
            convert_cmd.catalog = platform::path_from_utf8(value);
        } else if (try_option(SCHEMA)) {
            convert_cmd.schema = value;
        }

        if (missing != nullptr) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                missing_value_error(missing->long_name, missing->value_name, CONVERT_USAGE);
            return;
        }
        if (m == OptionMatch::Matched) {
            continue;
        }

        if (arg[0] == '-' && arg[1] != '\0') {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = unexpected_argument_error(arg, CONVERT_USAGE);
            return;
        }
        if (have_report) {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = unexpected_argument_error(arg, CONVERT_USAGE);
            return;
        }
        convert_cmd.report = platform::path_from_utf8(arg);
        have_report = true;
    }

    if (!have_report) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            render_usage_error("error: the following required arguments were not provided:\n"
                               "  <REPORT>",
                               CONVERT_USAGE);
        return;
    }

    result.ok = true;
    result.command = std::move(convert_cmd);
}

/// Разбор аргументов catalog начиная с argv[first]
void parse_catalog(int argc, char** argv, int first, ParseResult& result) {
    CatalogCommand catalog_cmd;

    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{"catalog"};
            return;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            catalog_cmd.json = true;
            continue;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
            continue;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
            continue;
        }

        switch (match_value_option(argc, argv, i, "-c", "--catalog", value)) {
        case OptionMatch::Matched:
            catalog_cmd.catalog = platform::path_from_utf8(value);
            continue;
        case OptionMatch::Missing:
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message =
                missing_value_error("--catalog", "FILE", CATALOG_USAGE);
            return;
        case OptionMatch::NoMatch:
            break;
        }

        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = unexpected_argument_error(arg, CATALOG_USAGE);
        return;
    }

    result.ok = true;
    result.command = std::move(catalog_cmd);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("scanconv ") + VERSION + "\n";
}

// ----------------------------------------------------------------------------
// render_help
// ----------------------------------------------------------------------------

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: scanconv [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  convert  Convert a trufflehog plain-text report into request templates\n"
               "  catalog  List the detector types with a known request template\n"
               "  help     Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide the banner\n"
               "  -q               Suppress informational output\n"
               "  -v...            Print verbose output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Convert a report into the current directory:\n"
               "        ./scanconv convert trufflehog.txt\n"
               "\n"
               "    Convert with an additional endpoint catalog:\n"
               "        ./scanconv convert trufflehog.txt -d out/ -c endpoints.yml\n"
               "\n"
               "    Show the known detector types as JSON:\n"
               "        ./scanconv catalog --json\n";
    } else if (*command == "convert") {
        return "Convert a trufflehog plain-text report into request templates\n"
               "\n"
               "Usage: scanconv convert [OPTIONS] <REPORT>\n"
               "\n"
               "Arguments:\n"
               "  <REPORT>  Path to the trufflehog plain-text report\n"
               "\n"
               "Options:\n"
               "  -d, --output-dir <DIR>  Base directory for all artifacts [default: .]\n"
               "      --http <FILE>       HTTP templates [default: <DIR>/converted.http]\n"
               "      --env <FILE>        Credential store [default: <DIR>/http-client.env.json]\n"
               "      --unknown <FILE>    Unknown secrets report [default: <DIR>/unknown.txt]\n"
               "      --responses <DIR>   Response root [default: <DIR>/responses]\n"
               "  -c, --catalog <FILE>    Additional endpoint catalog (YAML)\n"
               "      --env-name <NAME>   Environment section name [default: dev]\n"
               "      --schema <URL>      $schema value of the credential store\n"
               "      --disambiguate      Suffix colliding variable names instead of overwriting\n"
               "  -h, --help              Print help\n";
    } else if (*command == "catalog") {
        return "List the detector types with a known request template\n"
               "\n"
               "Usage: scanconv catalog [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -c, --catalog <FILE>  Additional endpoint catalog (YAML)\n"
               "  -j, --json            Output as JSON\n"
               "  -h, --help            Print help\n";
    } else if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: scanconv help [COMMAND]\n";
    } else {
        // Неизвестная подкоманда для help
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
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
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (arg[0] == '-' && arg[1] == 'v' &&
                   std::strspn(arg + 1, "v") == std::strlen(arg + 1)) {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg + 1));
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.exit_code = 2;
            result.diagnostic.stderr_message = unexpected_argument_error(arg, MAIN_USAGE);
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "convert")) {
        parse_convert(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "catalog")) {
        parse_catalog(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        // Неизвестная команда - exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            render_usage_error(std::string("error: unrecognized subcommand '") + cmd + "'",
                               MAIN_USAGE);
    }

    return result;
}

}  // namespace scanconv::cli

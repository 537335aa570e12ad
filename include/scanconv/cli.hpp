// ==============================================================================
// scanconv/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SCANCONV_CLI_HPP
#define SCANCONV_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace scanconv::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// convert - отчёт сканера -> HTTP шаблоны + хранилище + unknown.txt
struct ConvertCommand {
    std::filesystem::path report;                     // positional
    std::filesystem::path output_dir = ".";           // -d, --output-dir
    std::optional<std::filesystem::path> http;        // --http
    std::optional<std::filesystem::path> env;         // --env
    std::optional<std::filesystem::path> unknown;     // --unknown
    std::optional<std::filesystem::path> responses;   // --responses
    std::optional<std::filesystem::path> catalog;     // -c, --catalog
    std::optional<std::string> env_name;              // --env-name
    std::optional<std::string> schema;                // --schema
    bool disambiguate = false;                        // --disambiguate
};

/// catalog - список известных типов детекторов
struct CatalogCommand {
    std::optional<std::filesystem::path> catalog;  // -c, --catalog
    bool json = false;                             // -j, --json
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

// ----------------------------------------------------------------------------
// Command - вариант команды
// ----------------------------------------------------------------------------

using Command = std::variant<ConvertCommand, CatalogCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT =
    "Convert secret scanner reports into redacted HTTP request templates";

}  // namespace scanconv::cli

#endif  // SCANCONV_CLI_HPP

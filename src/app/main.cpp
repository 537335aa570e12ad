// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка CLI
//
// ==============================================================================

#include <scanconv/catalog.hpp>
#include <scanconv/cli.hpp>
#include <scanconv/convert.hpp>
#include <scanconv/output.hpp>
#include <scanconv/platform.hpp>
#include <scanconv/value.hpp>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// ASCII Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
  ___  ___ __ _ _ __   ___ ___  _ ____   __
 / __|/ __/ _` | '_ \ / __/ _ \| '_ \ \ / /
 \__ \ (_| (_| | | | | (_| (_) | | | \ V /
 |___/\___\__,_|_| |_|\___\___/|_| |_|\_/
)";

void print_banner(scanconv::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(scanconv::output::Stream::Stderr, BANNER);
    writer.write_line(scanconv::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// Каталог: встроенный + опциональный YAML
// ----------------------------------------------------------------------------

/// Загрузить каталог; при ошибке пишет "[x] ..." и возвращает false
bool load_catalog(const std::optional<std::filesystem::path>& extra,
                  scanconv::output::Writer& writer, scanconv::catalog::Catalog& out) {
    using namespace scanconv;

    out = catalog::Catalog::builtin();
    if (!extra.has_value()) {
        return true;
    }

    auto loaded = catalog::load_catalog(*extra);
    if (!loaded) {
        writer.error(loaded.error.format());
        return false;
    }
    writer.debug("Loaded " + std::to_string(loaded.catalog.size()) + " endpoints from " +
                 platform::path_to_utf8(*extra));
    out = out.merged(loaded.catalog);
    return true;
}

// ----------------------------------------------------------------------------
// convert
// ----------------------------------------------------------------------------

int run_convert(const scanconv::cli::ConvertCommand& cmd, scanconv::output::Writer& writer) {
    using namespace scanconv;

    catalog::Catalog endpoints;
    if (!load_catalog(cmd.catalog, writer, endpoints)) {
        return 1;
    }

    // Пути артефактов: явные опции имеют приоритет над --output-dir
    convert::OutputPaths paths = convert::OutputPaths::in_directory(cmd.output_dir);
    if (cmd.http) {
        paths.http_file = *cmd.http;
    }
    if (cmd.env) {
        paths.env_file = *cmd.env;
    }
    if (cmd.unknown) {
        paths.unknown_file = *cmd.unknown;
    }
    if (cmd.responses) {
        paths.responses_root = *cmd.responses;
    }

    auto builder = convert::ConverterBuilder::create();
    builder.catalog(std::move(endpoints))
        .collision_policy(cmd.disambiguate ? classify::CollisionPolicy::Disambiguate
                                           : classify::CollisionPolicy::LastWriteWins)
        .redirect_prefix(convert::redirect_prefix_for(paths));
    if (cmd.env_name) {
        builder.environment(*cmd.env_name);
    }
    if (cmd.schema) {
        builder.schema(*cmd.schema);
    }

    auto built = builder.build();
    if (!built.ok) {
        writer.error(built.error);
        return 1;
    }

    writer.info("Converting secrets from: " + platform::path_to_utf8(cmd.report));
    writer.debug("Catalog: " + std::to_string(built.converter->catalog().size()) +
                 " detector types, collision policy: " +
                 classify::to_string(built.converter->collision_policy()));

    auto result = built.converter->convert(cmd.report, paths, &writer);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }

    const convert::ConvertStats& stats = result.stats;
    if (stats.collisions > 0) {
        writer.warn(std::to_string(stats.collisions) +
                    " secret(s) share a variable name with an earlier secret; "
                    "the credential store keeps the last value (use --disambiguate)");
    }
    if (stats.unknown > 0) {
        writer.highlight(output::Color::Yellow,
                         "[!] " + std::to_string(stats.unknown) +
                             " secret(s) with an unrecognized detector type written to " +
                             platform::path_to_utf8(paths.unknown_file));
    }

    if (!writer.config().quiet) {
        output::Table table({"Artifact", "Path", "Entries"});
        table.align(2, output::Align::Right);
        table.add_row({"HTTP templates", platform::path_to_utf8(paths.http_file),
                       std::to_string(stats.known)});
        table.add_row({"Credential store", platform::path_to_utf8(paths.env_file),
                       std::to_string(stats.known)});
        table.add_row({"Unknown secrets", platform::path_to_utf8(paths.unknown_file),
                       std::to_string(stats.unknown)});
        table.add_row({"Response groups", platform::path_to_utf8(paths.responses_root),
                       std::to_string(stats.groups)});
        table.print(writer, output::Stream::Stderr);
    }

    writer.highlight(output::Color::Green,
                     "[+] Converted " + std::to_string(stats.known + stats.unknown) +
                         " unique secrets (" + std::to_string(stats.duplicates) +
                         " duplicates removed, " + std::to_string(stats.dirs_created) +
                         " response directories created)");
    return 0;
}

// ----------------------------------------------------------------------------
// catalog
// ----------------------------------------------------------------------------

int run_catalog(const scanconv::cli::CatalogCommand& cmd, scanconv::output::Writer& writer) {
    using namespace scanconv;

    catalog::Catalog endpoints;
    if (!load_catalog(cmd.catalog, writer, endpoints)) {
        return 1;
    }

    if (cmd.json) {
        Value list = Value::make_array();
        for (const auto& key : endpoints.keys()) {
            const catalog::EndpointTemplate* endpoint = endpoints.find(key);
            Value entry = Value::make_object();
            entry.set("type", Value::make_string(key));
            entry.set("method", Value::make_string(endpoint->method));
            entry.set("url", Value::make_string(endpoint->url));
            Value headers = Value::make_object();
            for (const auto& [name, pattern] : endpoint->headers) {
                headers.set(name, Value::make_string(pattern));
            }
            entry.set("headers", std::move(headers));
            if (endpoint->body) {
                entry.set("body", *endpoint->body);
            }
            list.push_back(std::move(entry));
        }

        writer.write_json(list);
        return 0;
    }

    output::Table table({"Type", "Method", "URL"});
    for (const auto& key : endpoints.keys()) {
        const catalog::EndpointTemplate* endpoint = endpoints.find(key);
        table.add_row({key, endpoint->method, endpoint->url});
    }
    table.print(writer, output::Stream::Stdout);
    writer.info("Known detector types: " + std::to_string(table.row_count()));
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace scanconv;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга: сообщение без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                // --help не выводит баннер
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ConvertCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_convert(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::CatalogCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_catalog(cmd, writer);
            } else {
                // Unreachable
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}

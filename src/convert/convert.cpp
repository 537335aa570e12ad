// ==============================================================================
// convert.cpp - Конвейер конвертации отчёта
// ==============================================================================

#include <scanconv/convert.hpp>

#include <scanconv/identity.hpp>
#include <scanconv/output.hpp>
#include <scanconv/platform.hpp>
#include <scanconv/report.hpp>

#include <system_error>

namespace scanconv::convert {

namespace {

artifact::ArtifactError make_error(artifact::ArtifactKind kind, std::string message,
                                   const std::filesystem::path& path) {
    artifact::ArtifactError error;
    error.kind = kind;
    error.message = std::move(message);
    error.path = platform::path_to_utf8(path);
    return error;
}

/// Путь без завершающего разделителя, абсолютный и нормализованный
std::filesystem::path normalized_absolute(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::path result = std::filesystem::absolute(p, ec);
    if (ec) {
        result = p;
    }
    result = result.lexically_normal();
    if (!result.has_filename() && result.has_parent_path() && result != result.root_path()) {
        result = result.parent_path();
    }
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Пути артефактов
// ----------------------------------------------------------------------------

OutputPaths OutputPaths::in_directory(const std::filesystem::path& base_dir) {
    OutputPaths paths;
    paths.http_file = base_dir / artifact::DEFAULT_HTTP_FILE;
    paths.env_file = base_dir / artifact::DEFAULT_ENV_FILE;
    paths.unknown_file = base_dir / artifact::DEFAULT_UNKNOWN_FILE;
    paths.responses_root = base_dir / artifact::DEFAULT_RESPONSES_DIR;
    return paths;
}

std::string redirect_prefix_for(const OutputPaths& paths) {
    const std::filesystem::path http_dir = normalized_absolute(paths.http_file).parent_path();
    const std::filesystem::path root = normalized_absolute(paths.responses_root);

    std::filesystem::path relative = root.lexically_relative(http_dir);
    if (relative.empty()) {
        // Разные корни (другой диск на Windows): остаётся абсолютный путь
        relative = root;
    }

    std::string prefix = relative.generic_string();
    if (prefix == ".") {
        return {};
    }
    return prefix;
}

// ----------------------------------------------------------------------------
// ConverterBuilder
// ----------------------------------------------------------------------------

ConverterBuilder ConverterBuilder::create() {
    return ConverterBuilder();
}

ConverterBuilder& ConverterBuilder::catalog(catalog::Catalog value) {
    catalog_ = std::move(value);
    return *this;
}

ConverterBuilder& ConverterBuilder::environment(std::string name) {
    environment_ = std::move(name);
    return *this;
}

ConverterBuilder& ConverterBuilder::schema(std::string url) {
    schema_ = std::move(url);
    return *this;
}

ConverterBuilder& ConverterBuilder::collision_policy(classify::CollisionPolicy policy) {
    policy_ = policy;
    return *this;
}

ConverterBuilder& ConverterBuilder::redirect_prefix(std::string prefix) {
    redirect_prefix_ = std::move(prefix);
    return *this;
}

ConverterBuilder::BuildResult ConverterBuilder::build() {
    BuildResult result;
    result.ok = false;

    if (environment_.empty()) {
        result.error = "environment name must not be empty";
        return result;
    }
    // "$schema" - служебный ключ хранилища
    if (environment_ == "$schema") {
        result.error = "environment name '$schema' is reserved";
        return result;
    }

    auto converter = std::unique_ptr<Converter>(new Converter());
    converter->catalog_ = catalog_;
    converter->environment_ = environment_;
    converter->schema_ = schema_;
    converter->policy_ = policy_;
    converter->redirect_prefix_ = redirect_prefix_;

    result.ok = true;
    result.converter = std::move(converter);
    return result;
}

// ----------------------------------------------------------------------------
// Converter
// ----------------------------------------------------------------------------

ConvertResult Converter::convert(const std::filesystem::path& report_path,
                                 const OutputPaths& paths, output::Writer* log) const {
    ConvertResult result;
    ConvertStats& stats = result.stats;

    // 1. Разбор отчёта
    auto parsed = report::parse_file(report_path);
    if (!parsed) {
        result.error = make_error(artifact::ArtifactKind::Report, parsed.error.message, report_path);
        return result;
    }
    stats.parsed = parsed.records.size();
    stats.dropped_bytes = parsed.stats.invalid_bytes;
    stats.dropped_records = parsed.stats.dropped_records;

    if (log) {
        log->debug("Parsed " + std::to_string(parsed.stats.lines) + " lines, " +
                   std::to_string(stats.parsed) + " records");
        if (stats.dropped_bytes > 0) {
            log->warn("Dropped " + std::to_string(stats.dropped_bytes) +
                      " invalid UTF-8 bytes from the report");
        }
        if (stats.dropped_records > 0) {
            log->debug("Skipped " + std::to_string(stats.dropped_records) +
                       " blocks without a raw result");
        }
    }

    // 2. Группы
    identity::assign_groups(parsed.records);

    // 3. Дедупликация и разделение
    classify::Classified classified = classify::partition(std::move(parsed.records), catalog_);
    stats.duplicates = classified.duplicates;
    stats.known = classified.known.size();
    stats.unknown = classified.unknown.size();

    if (log) {
        log->debug("Removed " + std::to_string(stats.duplicates) + " duplicate secrets");
        for (const auto& record : classified.known) {
            log->trace("known: " + record.detector_type + " (" + record.group_id + ")");
        }
        for (const auto& record : classified.unknown) {
            log->trace("unknown: " + record.detector_type + " (" + record.group_id + ")");
        }
    }

    // 4. Имена переменных
    const std::vector<std::string> variables =
        classify::assign_variables(classified.known, policy_);
    stats.collisions = classify::count_collisions(variables);

    // 5. Директории ответов
    auto dirs = artifact::ensure_response_directories(classified.known, paths.responses_root);
    if (!dirs) {
        result.error = dirs.error;
        return result;
    }
    stats.groups = dirs.groups;
    stats.dirs_created = dirs.created;

    // 6. HTTP шаблоны
    const std::string http = artifact::render_http_templates(classified.known, variables, catalog_,
                                                             redirect_prefix_);
    // Проверяются значения обоих разделов: неизвестный секрет тоже не должен попасть в шаблон
    auto leaked = artifact::verify_redacted(http, classified.known);
    const auto leaked_unknown = artifact::verify_redacted(http, classified.unknown);
    leaked.insert(leaked.end(), leaked_unknown.begin(), leaked_unknown.end());
    if (!leaked.empty()) {
        result.error = make_error(artifact::ArtifactKind::HttpTemplates,
                                  std::to_string(leaked.size()) +
                                      " secret value(s) would appear in the request templates",
                                  paths.http_file);
        return result;
    }
    auto written = artifact::write_artifact(artifact::ArtifactKind::HttpTemplates, paths.http_file,
                                            http);
    if (!written) {
        result.error = written.error;
        return result;
    }
    if (log) {
        log->debug("Wrote " + platform::path_to_utf8(paths.http_file));
    }

    // 7. Хранилище учётных данных
    written = artifact::write_artifact(
        artifact::ArtifactKind::CredentialStore, paths.env_file,
        artifact::render_credential_store(classified.known, variables, environment_, schema_));
    if (!written) {
        result.error = written.error;
        return result;
    }
    if (log) {
        log->debug("Wrote " + platform::path_to_utf8(paths.env_file));
    }

    // 8. Нераспознанные секреты
    written = artifact::write_artifact(artifact::ArtifactKind::UnknownSecrets, paths.unknown_file,
                                       artifact::render_unknown_report(classified.unknown));
    if (!written) {
        result.error = written.error;
        return result;
    }
    if (log) {
        log->debug("Wrote " + platform::path_to_utf8(paths.unknown_file));
    }

    result.ok = true;
    return result;
}

}  // namespace scanconv::convert

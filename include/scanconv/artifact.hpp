// ==============================================================================
// scanconv/artifact.hpp - Генерация артефактов
// ==============================================================================
//
// Назначение:
// - HTTP шаблоны запросов (converted.http): только ссылки {{name}}
// - Хранилище учётных данных (http-client.env.json): единственное место
//   с реальными значениями для known секретов
// - Отчёт о нераспознанных секретах (unknown.txt)
// - Директории ответов: <root>/<group_id>/
// - Атомарная запись файла: временный файл + rename
//
// Рендереры - чистые функции (строка на выходе), запись отделена.
//
// ==============================================================================

#ifndef SCANCONV_ARTIFACT_HPP
#define SCANCONV_ARTIFACT_HPP

#include <scanconv/catalog.hpp>
#include <scanconv/report.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace scanconv::artifact {

// ----------------------------------------------------------------------------
// Константы по умолчанию
// ----------------------------------------------------------------------------

constexpr const char* DEFAULT_ENVIRONMENT = "dev";

constexpr const char* DEFAULT_SCHEMA =
    "https://raw.githubusercontent.com/mistweaverco/kulala.nvim/main/schemas/"
    "http-client.env.schema.json";

constexpr const char* DEFAULT_REDIRECT_PREFIX = "responses";

constexpr const char* DEFAULT_HTTP_FILE = "converted.http";
constexpr const char* DEFAULT_ENV_FILE = "http-client.env.json";
constexpr const char* DEFAULT_UNKNOWN_FILE = "unknown.txt";
constexpr const char* DEFAULT_RESPONSES_DIR = "responses";

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

/// Артефакт (шаг), на котором произошла ошибка
enum class ArtifactKind {
    Report,               // чтение отчёта
    ResponseDirectories,  // директории ответов
    HttpTemplates,        // converted.http
    CredentialStore,      // http-client.env.json
    UnknownSecrets        // unknown.txt
};

/// "report", "response directories", "http templates", ...
const char* to_string(ArtifactKind kind);

struct ArtifactError {
    ArtifactKind kind = ArtifactKind::Report;
    std::string message;
    std::string path;

    /// "failed to write <kind> '<path>' - <message>"
    /// Для ArtifactKind::Report: "failed to read report '<path>' - <message>"
    std::string format() const;
};

struct ArtifactResult {
    bool ok = false;
    ArtifactError error;

    explicit operator bool() const { return ok; }
};

struct DirectoryResult {
    bool ok = false;
    std::size_t groups = 0;   // различных групп
    std::size_t created = 0;  // созданных директорий групп
    ArtifactError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Рендеринг
// ----------------------------------------------------------------------------

/// Блок одного запроса
///   ### <detector type> (<group>)
///   <METHOD> <url> HTTP/1.1
///   <Header>: <value>
///   >> <redirect_prefix>/<group>/<normalized type>.json
///   [пустая строка + тело JSON]
///   пустая строка
std::string render_http_request(const report::SecretRecord& record, std::string_view variable,
                                const catalog::EndpointTemplate& endpoint,
                                std::string_view redirect_prefix = DEFAULT_REDIRECT_PREFIX);

/// Все блоки для known записей; variables[i] соответствует known[i]
/// Записи без шаблона в каталоге пропускаются.
std::string render_http_templates(const std::vector<report::SecretRecord>& known,
                                  const std::vector<std::string>& variables,
                                  const catalog::Catalog& catalog,
                                  std::string_view redirect_prefix = DEFAULT_REDIRECT_PREFIX);

/// {"$schema": schema, "<environment>": {variable: raw value, ...}} + '\n'
/// Повторное имя заменяет значение на месте (last-write-wins).
std::string render_credential_store(const std::vector<report::SecretRecord>& known,
                                    const std::vector<std::string>& variables,
                                    std::string_view environment = DEFAULT_ENVIRONMENT,
                                    std::string_view schema = DEFAULT_SCHEMA);

/// Человекочитаемый отчёт о нераспознанных секретах
std::string render_unknown_report(const std::vector<report::SecretRecord>& unknown);

/// Raw values, которые встречаются в тексте (проверка редактирования)
/// @return пустой список если текст не содержит ни одного секрета
std::vector<std::string> verify_redacted(std::string_view text,
                                         const std::vector<report::SecretRecord>& records);

// ----------------------------------------------------------------------------
// Файловая система
// ----------------------------------------------------------------------------

/// Создать root и <root>/<group_id> для каждой группы known записей
/// Существующие директории не трогаются.
DirectoryResult ensure_response_directories(const std::vector<report::SecretRecord>& known,
                                            const std::filesystem::path& root);

/// Атомарно записать content в path (родительская директория создаётся)
/// Временный файл создаётся рядом с path и переименовывается поверх него;
/// при ошибке path остаётся в прежнем состоянии, временный файл удаляется.
ArtifactResult write_artifact(ArtifactKind kind, const std::filesystem::path& path,
                              std::string_view content);

}  // namespace scanconv::artifact

#endif  // SCANCONV_ARTIFACT_HPP

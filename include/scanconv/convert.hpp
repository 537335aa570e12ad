// ==============================================================================
// scanconv/convert.hpp - Конвейер конвертации отчёта
// ==============================================================================
//
// Назначение:
// - ConverterBuilder: параметры конвертации (каталог, окружение, политика)
// - Converter::convert(): отчёт -> четыре артефакта
//
// Шаги выполняются последовательно, конвейер останавливается на первой
// ошибке:
//   1. разбор отчёта
//   2. группы (identity)
//   3. дедупликация и разделение known / unknown
//   4. имена переменных
//   5. директории ответов
//   6. HTTP шаблоны (с проверкой отсутствия секретов)
//   7. хранилище учётных данных
//   8. отчёт о нераспознанных секретах
//
// Значения секретов никогда не выводятся в лог.
//
// ==============================================================================

#ifndef SCANCONV_CONVERT_HPP
#define SCANCONV_CONVERT_HPP

#include <scanconv/artifact.hpp>
#include <scanconv/catalog.hpp>
#include <scanconv/classify.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace scanconv::output {
class Writer;
}

namespace scanconv::convert {

// ----------------------------------------------------------------------------
// Пути артефактов
// ----------------------------------------------------------------------------

struct OutputPaths {
    std::filesystem::path http_file;       // converted.http
    std::filesystem::path env_file;        // http-client.env.json
    std::filesystem::path unknown_file;    // unknown.txt
    std::filesystem::path responses_root;  // responses/

    /// Пути по умолчанию внутри base_dir
    static OutputPaths in_directory(const std::filesystem::path& base_dir);
};

/// Путь responses_root относительно директории http_file, через '/'
/// Используется как префикс строк ">>" в HTTP шаблонах.
std::string redirect_prefix_for(const OutputPaths& paths);

// ----------------------------------------------------------------------------
// Результат
// ----------------------------------------------------------------------------

struct ConvertStats {
    std::size_t parsed = 0;           // записей в отчёте
    std::size_t duplicates = 0;       // отброшено как повторы
    std::size_t known = 0;            // есть шаблон в каталоге
    std::size_t unknown = 0;          // тип не распознан
    std::size_t groups = 0;           // различных групп среди known
    std::size_t dirs_created = 0;     // новых директорий ответов
    std::size_t collisions = 0;       // совпавших имён переменных
    std::size_t dropped_bytes = 0;    // невалидных UTF-8 байтов в отчёте
    std::size_t dropped_records = 0;  // блоков без raw value
};

struct ConvertResult {
    bool ok = false;
    ConvertStats stats;
    artifact::ArtifactError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Converter
// ----------------------------------------------------------------------------

class Converter;

class ConverterBuilder {
public:
    /// Создать builder со встроенным каталогом
    static ConverterBuilder create();

    /// Каталог эндпоинтов (заменяет встроенный)
    ConverterBuilder& catalog(catalog::Catalog value);

    /// Имя секции окружения в хранилище (по умолчанию "dev")
    ConverterBuilder& environment(std::string name);

    /// Значение "$schema" хранилища
    ConverterBuilder& schema(std::string url);

    ConverterBuilder& collision_policy(classify::CollisionPolicy policy);

    /// Префикс строк ">>" (по умолчанию "responses")
    ConverterBuilder& redirect_prefix(std::string prefix);

    struct BuildResult {
        bool ok = false;
        std::unique_ptr<Converter> converter;
        std::string error;
    };
    BuildResult build();

private:
    ConverterBuilder() = default;

    catalog::Catalog catalog_ = catalog::Catalog::builtin();
    std::string environment_ = artifact::DEFAULT_ENVIRONMENT;
    std::string schema_ = artifact::DEFAULT_SCHEMA;
    classify::CollisionPolicy policy_ = classify::CollisionPolicy::LastWriteWins;
    std::string redirect_prefix_ = artifact::DEFAULT_REDIRECT_PREFIX;
};

class Converter {
public:
    /// Выполнить конвертацию
    /// @param log может быть nullptr
    ConvertResult convert(const std::filesystem::path& report_path, const OutputPaths& paths,
                          output::Writer* log = nullptr) const;

    const catalog::Catalog& catalog() const { return catalog_; }
    const std::string& environment() const { return environment_; }
    classify::CollisionPolicy collision_policy() const { return policy_; }

private:
    friend class ConverterBuilder;

    Converter() = default;

    catalog::Catalog catalog_;
    std::string environment_;
    std::string schema_;
    classify::CollisionPolicy policy_ = classify::CollisionPolicy::LastWriteWins;
    std::string redirect_prefix_;
};

}  // namespace scanconv::convert

#endif  // SCANCONV_CONVERT_HPP

// ==============================================================================
// scanconv/catalog.hpp - Каталог эндпоинтов для известных типов детекторов
// ==============================================================================
//
// Назначение:
// - EndpointTemplate: метод, URL, заголовки, опциональное тело запроса
// - Catalog: неизменяемая таблица normalized detector type -> шаблон
// - Встроенный набор эндпоинтов и загрузка дополнительных из YAML
//
// Диспетчеризация по типу детектора - плоская таблица данных. Новый тип
// добавляется записью в таблицу (или в YAML файл), без изменения парсера и
// генераторов.
//
// Формат YAML файла:
//
//   endpoints:
//     - type: GitHub
//       method: GET
//       url: https://api.github.com/user
//       headers:
//         Authorization: token {{var}}
//       body:                      # опционально
//         query: "{ viewer { login } }"
//
// ==============================================================================

#ifndef SCANCONV_CATALOG_HPP
#define SCANCONV_CATALOG_HPP

#include <scanconv/value.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scanconv::catalog {

/// Маркер подстановки учётных данных в URL, заголовках и строках тела
constexpr std::string_view PLACEHOLDER = "{{var}}";

// ----------------------------------------------------------------------------
// EndpointTemplate
// ----------------------------------------------------------------------------

/// Заголовки в порядке объявления
using Headers = std::vector<std::pair<std::string, std::string>>;

struct EndpointTemplate {
    std::string method;
    std::string url;  // URL pattern, может содержать PLACEHOLDER
    Headers headers;  // значения могут содержать PLACEHOLDER
    std::optional<Value> body;

    /// Встречается ли PLACEHOLDER в URL, заголовках или строках тела
    bool references_placeholder() const;
};

// ----------------------------------------------------------------------------
// Ошибки загрузки
// ----------------------------------------------------------------------------

struct CatalogError {
    std::string message;
    std::string path;

    /// "catalog error [<path>]: <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Catalog
// ----------------------------------------------------------------------------

class Catalog {
public:
    /// Пустой каталог
    Catalog() = default;

    /// Встроенный набор эндпоинтов
    static const Catalog& builtin();

    /// Построить каталог из записей; ключи нормализуются
    static Catalog from_entries(std::vector<std::pair<std::string, EndpointTemplate>> entries);

    /// Новый каталог: записи other заменяют записи с тем же ключом
    Catalog merged(const Catalog& other) const;

    /// Найти шаблон по типу детектора (нормализуется перед поиском)
    const EndpointTemplate* find(std::string_view detector_type) const;

    bool contains(std::string_view detector_type) const { return find(detector_type) != nullptr; }

    /// Нормализованные ключи в лексикографическом порядке
    std::vector<std::string> keys() const;

    std::size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

private:
    std::map<std::string, EndpointTemplate, std::less<>> entries_;
};

struct LoadResult {
    bool ok = false;
    Catalog catalog;
    CatalogError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Нормализовать тип детектора: lowercase, без пробелов и дефисов
/// "Telegram Bot-Token" -> "telegrambottoken"
std::string normalize_detector_type(std::string_view detector_type);

/// Заменить каждый PLACEHOLDER на "{{variable}}"
std::string render_pattern(std::string_view pattern, std::string_view variable);

/// Тело запроса с подстановкой "{{variable}}" во всех строках
Value render_body(const Value& body, std::string_view variable);

/// Загрузить дополнительные эндпоинты из YAML файла
LoadResult load_catalog(const std::filesystem::path& path);

/// Разобрать YAML текст (path используется только в сообщениях об ошибках)
LoadResult parse_catalog(std::string_view yaml_text, const std::string& path = {});

}  // namespace scanconv::catalog

#endif  // SCANCONV_CATALOG_HPP

// ==============================================================================
// scanconv/classify.hpp - Дедупликация и разделение на known / unknown
// ==============================================================================
//
// Назначение:
// - Удаление повторов по точному совпадению raw value (первое вхождение)
// - Разделение по наличию типа детектора в каталоге
// - Назначение имён переменных с политикой коллизий
//
// Порядок записей внутри каждой части совпадает с порядком в отчёте.
//
// ==============================================================================

#ifndef SCANCONV_CLASSIFY_HPP
#define SCANCONV_CLASSIFY_HPP

#include <scanconv/catalog.hpp>
#include <scanconv/report.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scanconv::classify {

// ----------------------------------------------------------------------------
// Результат классификации
// ----------------------------------------------------------------------------

struct Classified {
    std::vector<report::SecretRecord> known;    // есть шаблон в каталоге
    std::vector<report::SecretRecord> unknown;  // тип не распознан

    std::size_t total = 0;       // записей на входе
    std::size_t duplicates = 0;  // отброшено как повторы
};

// ----------------------------------------------------------------------------
// Политика коллизий имён переменных
// ----------------------------------------------------------------------------

/// Два разных секрета одного типа в одной группе дают одно имя переменной.
enum class CollisionPolicy {
    LastWriteWins,  // одно имя; в хранилище остаётся значение последней записи
    Disambiguate    // второе и последующие имена получают суффикс _2, _3, ...
};

/// "last-write-wins" / "disambiguate"
const char* to_string(CollisionPolicy policy);

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Удалить повторы по raw value, сохранив первое вхождение и порядок
std::vector<report::SecretRecord> deduplicate(std::vector<report::SecretRecord> records);

/// Дедупликация + разделение по каталогу
Classified partition(std::vector<report::SecretRecord> records, const catalog::Catalog& catalog);

/// Имя переменной для каждой записи known (в том же порядке)
std::vector<std::string> assign_variables(const std::vector<report::SecretRecord>& known,
                                          CollisionPolicy policy);

/// Количество имён, уже встречавшихся раньше в списке
std::size_t count_collisions(const std::vector<std::string>& names);

}  // namespace scanconv::classify

#endif  // SCANCONV_CLASSIFY_HPP

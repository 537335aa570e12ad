// ==============================================================================
// scanconv/identity.hpp - Группа (владелец) и имя переменной для секрета
// ==============================================================================
//
// Группа - идентификатор расширения браузера из пути файла:
//   "foo/extensions/abc123/src/file.js" -> "abc123"
//   "/tmp/file.js"                      -> "unknown"
//
// Имя переменной - "<group>_<normalized detector type>", используется и как
// ссылка {{name}} в HTTP шаблоне, и как ключ в хранилище учётных данных.
//
// ==============================================================================

#ifndef SCANCONV_IDENTITY_HPP
#define SCANCONV_IDENTITY_HPP

#include <scanconv/report.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace scanconv::identity {

/// Первый сегмент после компонента "extensions/", за которым следует '/'
/// @return report::UNKNOWN_GROUP если такого компонента нет
std::string resolve_group(std::string_view file_path);

/// "<group_id>_<normalize_detector_type(detector_type)>"
std::string variable_name(std::string_view group_id, std::string_view detector_type);

/// Вычислить group_id для каждой записи (один раз, сохраняется в записи)
void assign_groups(std::vector<report::SecretRecord>& records);

}  // namespace scanconv::identity

#endif  // SCANCONV_IDENTITY_HPP

// ==============================================================================
// scanconv/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Временные файлы рядом с целевым путём и атомарная замена файла
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована здесь.
//
// ==============================================================================

#ifndef SCANCONV_PLATFORM_HPP
#define SCANCONV_PLATFORM_HPP

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace scanconv::platform {

/// Построить path из UTF-8 строки (argv, содержимое отчёта)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// UTF-8 представление path (для сообщений и артефактов)
std::string path_to_utf8(const std::filesystem::path& p);

/// Подключён ли поток к терминалу
bool is_tty(std::FILE* stream);

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

/// Создать пустой временный файл в той же директории, что и target
/// Имя: ".<filename>.<random>"; одна файловая система гарантирует
/// атомарность последующего replace_file().
///
/// @throws std::runtime_error если файл не удалось создать
std::filesystem::path make_temp_file_beside(const std::filesystem::path& target);

/// Сбросить данные открытого файла на диск (fsync / _commit)
/// @return false если поток nullptr или синхронизация не удалась
bool sync_file(std::FILE* stream);

/// Атомарно заменить target файлом source (rename)
/// @return пустой error_code при успехе
std::error_code replace_file(const std::filesystem::path& source,
                             const std::filesystem::path& target);

}  // namespace scanconv::platform

#endif  // SCANCONV_PLATFORM_HPP

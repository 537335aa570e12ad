// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================

#include <scanconv/platform.hpp>

#include <stdexcept>

#ifdef _WIN32
#include <io.h>
#include <random>
#define NOMINMAX
#include <windows.h>
#else
#include <cstdlib>
#include <unistd.h>
#include <vector>
#endif

namespace scanconv::platform {

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // u8path выполняет UTF-8 -> UTF-16 на Windows, на POSIX копирует байты
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

bool is_tty(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Временные файлы
// ----------------------------------------------------------------------------

std::filesystem::path make_temp_file_beside(const std::filesystem::path& target) {
    const std::filesystem::path dir = target.has_parent_path() ? target.parent_path() : ".";
    const std::string stem = "." + path_to_utf8(target.filename()) + ".";

#ifdef _WIN32
    // CREATE_NEW не перезаписывает существующий файл: повторяем с другим суффиксом
    std::random_device rd;
    std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);
    for (int attempt = 0; attempt < 16; ++attempt) {
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "%06x", dist(rd));
        std::filesystem::path candidate = dir / path_from_utf8(stem + suffix);

        HANDLE h = CreateFileW(candidate.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_NEW,
                               FILE_ATTRIBUTE_NORMAL, nullptr);
        if (h != INVALID_HANDLE_VALUE) {
            CloseHandle(h);
            return candidate;
        }
        if (GetLastError() != ERROR_FILE_EXISTS) {
            break;
        }
    }
    throw std::runtime_error("failed to create temp file in " + path_to_utf8(dir));
#else
    // mkstemp: права 0600, суффикс XXXXXX заменяется на уникальный
    const std::string pattern = path_to_utf8(dir / (stem + "XXXXXX"));
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    const int fd = mkstemp(buffer.data());
    if (fd == -1) {
        throw std::runtime_error("failed to create temp file in " + path_to_utf8(dir));
    }
    close(fd);
    return std::filesystem::path(buffer.data());
#endif
}

bool sync_file(std::FILE* stream) {
    if (stream == nullptr) {
        return false;
    }
#ifdef _WIN32
    return _commit(_fileno(stream)) == 0;
#else
    return fsync(fileno(stream)) == 0;
#endif
}

std::error_code replace_file(const std::filesystem::path& source,
                             const std::filesystem::path& target) {
    std::error_code ec;
#ifdef _WIN32
    // std::filesystem::rename на Windows не всегда заменяет существующий файл
    if (!MoveFileExW(source.c_str(), target.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        ec = std::error_code(static_cast<int>(GetLastError()), std::system_category());
    }
#else
    std::filesystem::rename(source, target, ec);
#endif
    return ec;
}

}  // namespace scanconv::platform

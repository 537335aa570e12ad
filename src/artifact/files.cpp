// ==============================================================================
// files.cpp - Директории ответов и атомарная запись артефактов
// ==============================================================================

#include <scanconv/artifact.hpp>

#include <scanconv/platform.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <set>
#include <system_error>

namespace scanconv::artifact {

namespace {

ArtifactError make_error(ArtifactKind kind, std::string message, const std::filesystem::path& p) {
    ArtifactError error;
    error.kind = kind;
    error.message = std::move(message);
    error.path = platform::path_to_utf8(p);
    return error;
}

/// Удалить временный файл после неудачной записи; ошибка удаления не важна
void discard_temp(const std::filesystem::path& temp) {
    std::error_code ec;
    std::filesystem::remove(temp, ec);
}

/// Создать директорию, если её нет
/// @return true если директория была создана
bool create_directory(const std::filesystem::path& dir, std::error_code& ec) {
    ec.clear();
    if (std::filesystem::is_directory(dir, ec)) {
        return false;
    }
    ec.clear();
    const bool created = std::filesystem::create_directories(dir, ec);
    if (!ec && !std::filesystem::is_directory(dir, ec) && !ec) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    return created;
}

}  // namespace

// ----------------------------------------------------------------------------
// Ошибки
// ----------------------------------------------------------------------------

const char* to_string(ArtifactKind kind) {
    switch (kind) {
    case ArtifactKind::Report:
        return "report";
    case ArtifactKind::ResponseDirectories:
        return "response directories";
    case ArtifactKind::HttpTemplates:
        return "http templates";
    case ArtifactKind::CredentialStore:
        return "credential store";
    case ArtifactKind::UnknownSecrets:
        return "unknown secrets report";
    }
    return "artifact";
}

std::string ArtifactError::format() const {
    std::string result = kind == ArtifactKind::Report ? "failed to read " : "failed to write ";
    result += to_string(kind);
    if (!path.empty()) {
        result += " '" + path + "'";
    }
    result += " - " + message;
    return result;
}

// ----------------------------------------------------------------------------
// Директории ответов
// ----------------------------------------------------------------------------

DirectoryResult ensure_response_directories(const std::vector<report::SecretRecord>& known,
                                            const std::filesystem::path& root) {
    DirectoryResult result;

    std::set<std::string> groups;
    for (const auto& record : known) {
        groups.insert(record.group_id);
    }
    result.groups = groups.size();

    std::error_code ec;
    create_directory(root, ec);
    if (ec) {
        result.error = make_error(ArtifactKind::ResponseDirectories, ec.message(), root);
        return result;
    }

    for (const auto& group : groups) {
        const std::filesystem::path dir = root / platform::path_from_utf8(group);
        const bool created = create_directory(dir, ec);
        if (ec) {
            result.error = make_error(ArtifactKind::ResponseDirectories, ec.message(), dir);
            return result;
        }
        if (created) {
            ++result.created;
        }
    }

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Атомарная запись
// ----------------------------------------------------------------------------

ArtifactResult write_artifact(ArtifactKind kind, const std::filesystem::path& path,
                              std::string_view content) {
    ArtifactResult result;

    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        result.error = make_error(kind, "path is a directory", path);
        return result;
    }

    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        create_directory(parent, ec);
        if (ec) {
            result.error = make_error(kind, ec.message(), parent);
            return result;
        }
    }

    std::filesystem::path temp;
    try {
        temp = platform::make_temp_file_beside(path);
    } catch (const std::exception& e) {
        result.error = make_error(kind, e.what(), path);
        return result;
    }

#ifdef _WIN32
    FILE* file = _wfopen(temp.c_str(), L"wb");
#else
    FILE* file = std::fopen(temp.c_str(), "wb");
#endif
    if (file == nullptr) {
        const std::string reason = std::strerror(errno);
        discard_temp(temp);
        result.error = make_error(kind, "cannot open temporary file: " + reason, path);
        return result;
    }

    const std::size_t written = std::fwrite(content.data(), 1, content.size(), file);
    // Данные должны быть на диске до rename, иначе после сбоя остаётся пустой файл
    const bool flushed = std::fflush(file) == 0 && platform::sync_file(file);
    const bool closed = std::fclose(file) == 0;
    if (written != content.size() || !flushed || !closed) {
        discard_temp(temp);
        result.error = make_error(kind, "write error", path);
        return result;
    }

    ec = platform::replace_file(temp, path);
    if (ec) {
        discard_temp(temp);
        result.error = make_error(kind, ec.message(), path);
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace scanconv::artifact

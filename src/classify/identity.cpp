// ==============================================================================
// identity.cpp - Группа и имя переменной
// ==============================================================================

#include <scanconv/identity.hpp>

#include <scanconv/catalog.hpp>

namespace scanconv::identity {

namespace {

constexpr std::string_view EXTENSIONS_COMPONENT = "extensions/";

}  // namespace

std::string resolve_group(std::string_view file_path) {
    std::size_t pos = file_path.find(EXTENSIONS_COMPONENT);
    while (pos != std::string_view::npos) {
        // Компонент целиком: начало пути или сразу после '/'
        const bool at_boundary = (pos == 0 || file_path[pos - 1] == '/');
        const std::size_t seg_begin = pos + EXTENSIONS_COMPONENT.size();
        const std::size_t seg_end = file_path.find('/', seg_begin);

        if (at_boundary && seg_end != std::string_view::npos && seg_end > seg_begin) {
            return std::string(file_path.substr(seg_begin, seg_end - seg_begin));
        }
        pos = file_path.find(EXTENSIONS_COMPONENT, pos + 1);
    }
    return report::UNKNOWN_GROUP;
}

std::string variable_name(std::string_view group_id, std::string_view detector_type) {
    std::string name(group_id);
    name += '_';
    name += catalog::normalize_detector_type(detector_type);
    return name;
}

void assign_groups(std::vector<report::SecretRecord>& records) {
    for (auto& record : records) {
        record.group_id = resolve_group(record.file_path);
    }
}

}  // namespace scanconv::identity

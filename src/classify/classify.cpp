// ==============================================================================
// classify.cpp - Дедупликация и разделение на known / unknown
// ==============================================================================

#include <scanconv/classify.hpp>

#include <scanconv/identity.hpp>

#include <unordered_map>
#include <unordered_set>

namespace scanconv::classify {

const char* to_string(CollisionPolicy policy) {
    switch (policy) {
    case CollisionPolicy::LastWriteWins:
        return "last-write-wins";
    case CollisionPolicy::Disambiguate:
        return "disambiguate";
    }
    return "unknown";
}

std::vector<report::SecretRecord> deduplicate(std::vector<report::SecretRecord> records) {
    std::unordered_set<std::string> seen;
    std::vector<report::SecretRecord> unique;
    unique.reserve(records.size());

    for (auto& record : records) {
        if (seen.insert(record.raw_value).second) {
            unique.push_back(std::move(record));
        }
    }
    return unique;
}

Classified partition(std::vector<report::SecretRecord> records, const catalog::Catalog& catalog) {
    Classified result;
    result.total = records.size();

    auto unique = deduplicate(std::move(records));
    result.duplicates = result.total - unique.size();

    for (auto& record : unique) {
        // Пустой тип нормализуется в "" и не находится в каталоге
        if (catalog.contains(record.detector_type)) {
            result.known.push_back(std::move(record));
        } else {
            result.unknown.push_back(std::move(record));
        }
    }
    return result;
}

std::vector<std::string> assign_variables(const std::vector<report::SecretRecord>& known,
                                          CollisionPolicy policy) {
    std::vector<std::string> names;
    names.reserve(known.size());

    // Сколько раз встречалось базовое имя; занятые имена целиком
    std::unordered_map<std::string, std::size_t> occurrences;
    std::unordered_set<std::string> taken;

    for (const auto& record : known) {
        std::string base = identity::variable_name(record.group_id, record.detector_type);

        if (policy == CollisionPolicy::LastWriteWins) {
            names.push_back(std::move(base));
            continue;
        }

        std::size_t& count = occurrences[base];
        ++count;
        std::string name = base;
        if (count > 1 || taken.count(name) > 0) {
            // Суффикс может совпасть с реальным именем ("a_b_2"), ищем свободный
            std::size_t suffix = count < 2 ? 2 : count;
            do {
                name = base + "_" + std::to_string(suffix++);
            } while (taken.count(name) > 0);
            count = suffix - 1;
        }
        taken.insert(name);
        names.push_back(std::move(name));
    }
    return names;
}

std::size_t count_collisions(const std::vector<std::string>& names) {
    std::unordered_set<std::string> seen;
    std::size_t collisions = 0;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            ++collisions;
        }
    }
    return collisions;
}

}  // namespace scanconv::classify

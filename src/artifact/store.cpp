// ==============================================================================
// store.cpp - Хранилище учётных данных и отчёт о нераспознанных секретах
// ==============================================================================

#include <scanconv/artifact.hpp>

#include <scanconv/value.hpp>

#include <algorithm>

namespace scanconv::artifact {

std::string render_credential_store(const std::vector<report::SecretRecord>& known,
                                    const std::vector<std::string>& variables,
                                    std::string_view environment, std::string_view schema) {
    Value section = Value::make_object();
    const std::size_t count = std::min(known.size(), variables.size());
    for (std::size_t i = 0; i < count; ++i) {
        // set() заменяет значение существующего ключа на месте
        section.set(variables[i], Value::make_string(known[i].raw_value));
    }

    Value store = Value::make_object();
    store.set("$schema", Value::make_string(std::string(schema)));
    store.set(std::string(environment), std::move(section));

    std::string out = store.to_json(2);
    out += '\n';
    return out;
}

std::string render_unknown_report(const std::vector<report::SecretRecord>& unknown) {
    std::string out;
    for (const auto& record : unknown) {
        out += "Unknown Secret Type: " + record.detector_type + "\n";
        out += "Extension: " + record.group_id + "\n";
        out += "Raw Value: " + record.raw_value + "\n";
        out += "File: " + record.file_path + "\n";
        if (record.line_number) {
            out += "Line: " + *record.line_number + "\n";
        }
        for (const auto& [key, value] : record.extra_fields) {
            out += key + ": " + value + "\n";
        }
        out += record.verified ? "Verified: Yes\n" : "Verified: No\n";
        out += '\n';
    }
    return out;
}

}  // namespace scanconv::artifact

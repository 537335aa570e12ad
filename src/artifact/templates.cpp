// ==============================================================================
// templates.cpp - HTTP шаблоны запросов (converted.http)
// ==============================================================================
//
// В этот артефакт попадают только ссылки {{name}}. Проверка verify_redacted()
// выполняется конвертером до записи файла.
//
// ==============================================================================

#include <scanconv/artifact.hpp>

#include <algorithm>
#include <unordered_set>

namespace scanconv::artifact {

std::string render_http_request(const report::SecretRecord& record, std::string_view variable,
                                const catalog::EndpointTemplate& endpoint,
                                std::string_view redirect_prefix) {
    std::string out;
    out += "### ";
    out += record.detector_type;
    out += " (";
    out += record.group_id;
    out += ")\n";

    out += endpoint.method;
    out += ' ';
    out += catalog::render_pattern(endpoint.url, variable);
    out += " HTTP/1.1\n";

    for (const auto& [name, pattern] : endpoint.headers) {
        out += name;
        out += ": ";
        out += catalog::render_pattern(pattern, variable);
        out += '\n';
    }

    out += ">> ";
    if (!redirect_prefix.empty()) {
        out += redirect_prefix;
        if (redirect_prefix.back() != '/') {
            out += '/';
        }
    }
    out += record.group_id;
    out += '/';
    out += catalog::normalize_detector_type(record.detector_type);
    out += ".json\n";

    if (endpoint.body) {
        out += '\n';
        out += catalog::render_body(*endpoint.body, variable).to_json(2);
        out += '\n';
    }

    out += '\n';
    return out;
}

std::string render_http_templates(const std::vector<report::SecretRecord>& known,
                                  const std::vector<std::string>& variables,
                                  const catalog::Catalog& catalog,
                                  std::string_view redirect_prefix) {
    std::string out;
    const std::size_t count = std::min(known.size(), variables.size());
    for (std::size_t i = 0; i < count; ++i) {
        const catalog::EndpointTemplate* endpoint = catalog.find(known[i].detector_type);
        if (endpoint == nullptr) {
            continue;
        }
        out += render_http_request(known[i], variables[i], *endpoint, redirect_prefix);
    }
    return out;
}

std::vector<std::string> verify_redacted(std::string_view text,
                                         const std::vector<report::SecretRecord>& records) {
    std::vector<std::string> leaked;
    std::unordered_set<std::string_view> reported;
    for (const auto& record : records) {
        const std::string& raw = record.raw_value;
        if (raw.empty() || reported.count(raw) > 0) {
            continue;
        }
        if (text.find(raw) != std::string_view::npos) {
            reported.insert(raw);
            leaked.push_back(raw);
        }
    }
    return leaked;
}

}  // namespace scanconv::artifact

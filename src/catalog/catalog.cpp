// ==============================================================================
// catalog.cpp - Каталог эндпоинтов
// ==============================================================================

#include <scanconv/catalog.hpp>

#include <scanconv/platform.hpp>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace scanconv::catalog {

namespace {

// ----------------------------------------------------------------------------
// Встроенная таблица
// ----------------------------------------------------------------------------

EndpointTemplate get(std::string url, Headers headers = {}) {
    EndpointTemplate t;
    t.method = "GET";
    t.url = std::move(url);
    t.headers = std::move(headers);
    return t;
}

/// JSON-RPC eth_blockNumber (Alchemy, Infura)
EndpointTemplate eth_block_number(std::string url) {
    Value body = Value::make_object();
    body.set("jsonrpc", Value("2.0"));
    body.set("method", Value("eth_blockNumber"));
    body.set("params", Value::make_array());
    body.set("id", Value::make_int(1));

    EndpointTemplate t;
    t.method = "POST";
    t.url = std::move(url);
    t.headers = {{"Content-Type", "application/json"}};
    t.body = std::move(body);
    return t;
}

Catalog make_builtin() {
    return Catalog::from_entries({
        {"openai",
         get("https://api.openai.com/v1/models", {{"Authorization", "Bearer {{var}}"}})},
        {"telegrambottoken", get("https://api.telegram.org/bot{{var}}/getMe")},
        {"alchemy", eth_block_number("https://eth-mainnet.g.alchemy.com/v2/{{var}}")},
        {"infura", eth_block_number("https://mainnet.infura.io/v3/{{var}}")},
        {"openweather",
         get("https://api.openweathermap.org/data/2.5/weather?q=London&appid={{var}}")},
        {"cryptocompare",
         get("https://min-api.cryptocompare.com/data/price?fsym=BTC&tsyms=USD&api_key={{var}}")},
        {"weatherstack", get("http://api.weatherstack.com/current?access_key={{var}}&query=London")},
        {"flickr", get("https://api.flickr.com/services/rest/?method=flickr.test.echo&api_key={{var}}"
                       "&format=json&nojsoncallback=1")},
        {"newsapi", get("https://newsapi.org/v2/top-headlines?country=us&apiKey={{var}}")},
        {"miro", get("https://api.miro.com/v1/boards", {{"Authorization", "Bearer {{var}}"}})},
        {"twitchaccesstoken",
         get("https://id.twitch.tv/oauth2/validate", {{"Authorization", "OAuth {{var}}"}})},
        {"onesignal",
         get("https://onesignal.com/api/v1/apps", {{"Authorization", "Basic {{var}}"}})},
        {"rapidapi", get("https://rapidapi.com/api/health", {{"X-RapidAPI-Key", "{{var}}"}})},
        {"snykkey",
         get("https://api.snyk.io/v1/user/me", {{"Authorization", "token {{var}}"}})},
        {"ipstack", get("http://api.ipstack.com/check?access_key={{var}}")},
        {"fixerio", get("http://data.fixer.io/api/latest?access_key={{var}}")},
        {"sumologickey",
         get("https://api.sumologic.com/api/v1/users", {{"Authorization", "Basic {{var}}"}})},
        {"atlassian",
         get("https://api.atlassian.com/me", {{"Authorization", "Bearer {{var}}"}})},
    });
}

// ----------------------------------------------------------------------------
// Placeholder в теле запроса
// ----------------------------------------------------------------------------

bool value_references_placeholder(const Value& v) {
    if (const auto* s = v.get_string()) {
        return s->find(PLACEHOLDER) != std::string::npos;
    }
    if (const auto* arr = v.get_array()) {
        for (const auto& item : *arr) {
            if (value_references_placeholder(item)) {
                return true;
            }
        }
    }
    if (const auto* obj = v.get_object()) {
        for (const auto& [key, item] : *obj) {
            if (value_references_placeholder(item)) {
                return true;
            }
        }
    }
    return false;
}

// ----------------------------------------------------------------------------
// YAML -> Value
// ----------------------------------------------------------------------------

Value scalar_from_yaml(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Строки в кавычках имеют tag "!", их тип не угадываем
    if (node.Tag() == "!") {
        return Value(text);
    }
    if (text == "true") {
        return Value::make_bool(true);
    }
    if (text == "false") {
        return Value::make_bool(false);
    }

    std::int64_t i = 0;
    if (YAML::convert<std::int64_t>::decode(node, i)) {
        return Value::make_int(i);
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d) && std::isfinite(d)) {
        return Value::make_double(d);
    }
    return Value(text);
}

Value value_from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return Value::make_null();
    case YAML::NodeType::Scalar:
        return scalar_from_yaml(node);
    case YAML::NodeType::Sequence: {
        Value arr = Value::make_array();
        for (const auto& item : node) {
            arr.push_back(value_from_yaml(item));
        }
        return arr;
    }
    case YAML::NodeType::Map: {
        Value obj = Value::make_object();
        for (const auto& kv : node) {
            obj.set(kv.first.as<std::string>(), value_from_yaml(kv.second));
        }
        return obj;
    }
    }
    return Value::make_null();
}

/// Разобрать одну запись endpoints[index]
/// @return сообщение об ошибке или пустую строку
std::string parse_entry(const YAML::Node& node, std::size_t index, std::string& key,
                        EndpointTemplate& out) {
    const std::string where = "endpoints[" + std::to_string(index) + "]";

    if (!node.IsMap()) {
        return where + " must be a mapping";
    }
    if (!node["type"] || node["type"].as<std::string>().empty()) {
        return where + " missing 'type' field";
    }
    key = normalize_detector_type(node["type"].as<std::string>());
    if (key.empty()) {
        return where + " has an empty normalized type";
    }

    if (!node["url"] || node["url"].as<std::string>().empty()) {
        return where + " (" + key + ") missing 'url' field";
    }
    out.url = node["url"].as<std::string>();
    out.method = node["method"] ? node["method"].as<std::string>() : "GET";
    for (auto& c : out.method) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (out.method.empty()) {
        return where + " (" + key + ") has an empty 'method'";
    }

    if (node["headers"]) {
        if (!node["headers"].IsMap()) {
            return where + " (" + key + ") 'headers' must be a mapping";
        }
        for (const auto& kv : node["headers"]) {
            out.headers.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
        }
    }

    if (node["body"] && !node["body"].IsNull()) {
        out.body = value_from_yaml(node["body"]);
    }

    if (!out.references_placeholder()) {
        return where + " (" + key + ") does not reference " + std::string(PLACEHOLDER) +
               " in url, headers or body";
    }
    return {};
}

}  // namespace

// ----------------------------------------------------------------------------
// EndpointTemplate
// ----------------------------------------------------------------------------

bool EndpointTemplate::references_placeholder() const {
    if (url.find(PLACEHOLDER) != std::string::npos) {
        return true;
    }
    for (const auto& [name, value] : headers) {
        if (value.find(PLACEHOLDER) != std::string::npos) {
            return true;
        }
    }
    return body.has_value() && value_references_placeholder(*body);
}

// ----------------------------------------------------------------------------
// CatalogError
// ----------------------------------------------------------------------------

std::string CatalogError::format() const {
    std::ostringstream oss;
    oss << "catalog error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ----------------------------------------------------------------------------
// Catalog
// ----------------------------------------------------------------------------

const Catalog& Catalog::builtin() {
    static const Catalog instance = make_builtin();
    return instance;
}

Catalog Catalog::from_entries(std::vector<std::pair<std::string, EndpointTemplate>> entries) {
    Catalog catalog;
    for (auto& [type, tmpl] : entries) {
        catalog.entries_[normalize_detector_type(type)] = std::move(tmpl);
    }
    return catalog;
}

Catalog Catalog::merged(const Catalog& other) const {
    Catalog result = *this;
    for (const auto& [key, tmpl] : other.entries_) {
        result.entries_[key] = tmpl;
    }
    return result;
}

const EndpointTemplate* Catalog::find(std::string_view detector_type) const {
    auto it = entries_.find(normalize_detector_type(detector_type));
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> Catalog::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [key, tmpl] : entries_) {
        result.push_back(key);
    }
    return result;
}

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

std::string normalize_detector_type(std::string_view detector_type) {
    std::string result;
    result.reserve(detector_type.size());
    for (char c : detector_type) {
        if (c == ' ' || c == '-') {
            continue;
        }
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string render_pattern(std::string_view pattern, std::string_view variable) {
    const std::string reference = "{{" + std::string(variable) + "}}";

    std::string result;
    result.reserve(pattern.size() + reference.size());

    std::size_t pos = 0;
    while (true) {
        std::size_t found = pattern.find(PLACEHOLDER, pos);
        if (found == std::string_view::npos) {
            result.append(pattern.substr(pos));
            break;
        }
        result.append(pattern.substr(pos, found - pos));
        result.append(reference);
        pos = found + PLACEHOLDER.size();
    }
    return result;
}

Value render_body(const Value& body, std::string_view variable) {
    if (const auto* s = body.get_string()) {
        return Value(render_pattern(*s, variable));
    }
    if (const auto* arr = body.get_array()) {
        Value out = Value::make_array();
        for (const auto& item : *arr) {
            out.push_back(render_body(item, variable));
        }
        return out;
    }
    if (const auto* obj = body.get_object()) {
        Value out = Value::make_object();
        for (const auto& [key, item] : *obj) {
            out.set(key, render_body(item, variable));
        }
        return out;
    }
    // Скаляры неизменяемы, копия разделяет только примитив
    return body;
}

LoadResult parse_catalog(std::string_view yaml_text, const std::string& path) {
    LoadResult result;
    result.error.path = path;

    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));

        if (!root.IsMap() || !root["endpoints"]) {
            result.error.message = "catalog file missing 'endpoints' field";
            return result;
        }
        const YAML::Node endpoints = root["endpoints"];
        if (!endpoints.IsSequence()) {
            result.error.message = "'endpoints' must be a sequence";
            return result;
        }

        std::vector<std::pair<std::string, EndpointTemplate>> entries;
        std::size_t index = 0;
        for (const auto& node : endpoints) {
            std::string key;
            EndpointTemplate tmpl;
            std::string err = parse_entry(node, index, key, tmpl);
            if (!err.empty()) {
                result.error.message = err;
                return result;
            }
            entries.emplace_back(std::move(key), std::move(tmpl));
            ++index;
        }

        result.catalog = Catalog::from_entries(std::move(entries));
        result.ok = true;
        return result;

    } catch (const YAML::Exception& e) {
        result.error.message = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const std::exception& e) {
        result.error.message = std::string("error loading catalog: ") + e.what();
        return result;
    }
}

LoadResult load_catalog(const std::filesystem::path& path) {
    const std::string path_str = platform::path_to_utf8(path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LoadResult result;
        result.error.path = path_str;
        result.error.message = "cannot open catalog file";
        return result;
    }

    std::ostringstream content;
    content << file.rdbuf();
    return parse_catalog(content.str(), path_str);
}

}  // namespace scanconv::catalog

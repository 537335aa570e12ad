// ==============================================================================
// value.cpp - Реализация Value
// ==============================================================================

#include <scanconv/value.hpp>

#include <cmath>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>
#include <type_traits>

namespace scanconv {

namespace {

/// Отделить разделяемый контейнер перед изменением
template <typename T>
T& detach(std::shared_ptr<T>& ptr) {
    if (ptr.use_count() > 1) {
        ptr = std::make_shared<T>(*ptr);
    }
    return *ptr;
}

}  // namespace

void Value::push_back(Value v) {
    if (auto* ptr = std::get_if<std::shared_ptr<ValueArray>>(&data_)) {
        detach(*ptr).push_back(std::move(v));
    }
}

void Value::set(const std::string& key, Value v) {
    auto* ptr = std::get_if<std::shared_ptr<ValueObject>>(&data_);
    if (ptr == nullptr) {
        return;
    }
    ValueObject& obj = detach(*ptr);
    for (auto& [k, existing] : obj) {
        if (k == key) {
            existing = std::move(v);
            return;
        }
    }
    obj.emplace_back(key, std::move(v));
}

const Value* Value::get(const std::string& key) const {
    if (const auto* obj = get_object()) {
        for (const auto& [k, v] : *obj) {
            if (k == key) {
                return &v;
            }
        }
    }
    return nullptr;
}

std::size_t Value::size() const {
    if (const auto* arr = get_array()) {
        return arr->size();
    }
    if (const auto* obj = get_object()) {
        return obj->size();
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, Null>) {
                out.SetNull();
            } else if constexpr (std::is_same_v<T, bool>) {
                out.SetBool(v);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                out.SetInt64(v);
            } else if constexpr (std::is_same_v<T, double>) {
                // RapidJSON пишет NaN/Inf как невалидный JSON
                if (!std::isfinite(v)) {
                    throw std::runtime_error("could not convert float to JSON: non-finite value");
                }
                out.SetDouble(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out.SetString(v.c_str(), static_cast<rapidjson::SizeType>(v.size()), alloc);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<ValueArray>>) {
                out.SetArray();
                out.Reserve(static_cast<rapidjson::SizeType>(v->size()), alloc);
                for (const auto& item : *v) {
                    rapidjson::Value element;
                    item.to_rapidjson(element, alloc);
                    out.PushBack(element, alloc);
                }
            } else {
                out.SetObject();
                for (const auto& [key, item] : *v) {
                    rapidjson::Value name;
                    name.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()),
                                   alloc);
                    rapidjson::Value member;
                    item.to_rapidjson(member, alloc);
                    out.AddMember(name, member, alloc);
                }
            }
        },
        data_);
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

std::string Value::to_json(unsigned indent) const {
    rapidjson::Document doc = to_rapidjson_document();
    rapidjson::StringBuffer buffer;

    if (indent > 0) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', indent);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace scanconv

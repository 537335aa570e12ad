// ==============================================================================
// scanconv/value.hpp - JSON-подобное значение (Value)
// ==============================================================================
//
// Назначение:
// - Тела запросов в шаблонах эндпоинтов (статические и из YAML каталога)
// - Построение хранилища учётных данных перед сериализацией
// - Конверсия в RapidJSON и сериализация (компактная / с отступами)
//
// Object хранит ключи в порядке вставки: порядок ключей в теле запроса и в
// хранилище должен совпадать с порядком объявления / обработки.
//
// ==============================================================================

#ifndef SCANCONV_VALUE_HPP
#define SCANCONV_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace scanconv {

class Value;

using ValueArray = std::vector<Value>;

/// Пары ключ -> Value в порядке вставки
using ValueObject = std::vector<std::pair<std::string, Value>>;

class Value {
public:
    struct Null {};

    Value() = default;
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(ValueArray v) : data_(std::make_shared<ValueArray>(std::move(v))) {}
    explicit Value(ValueObject v) : data_(std::make_shared<ValueObject>(std::move(v))) {}

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_int(std::int64_t v) { return Value(v); }
    static Value make_double(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(ValueArray{}); }
    static Value make_object() { return Value(ValueObject{}); }

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<bool>(data_); }
    bool is_int() const { return std::holds_alternative<std::int64_t>(data_); }
    bool is_double() const { return std::holds_alternative<double>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_array() const { return get_array() != nullptr; }
    bool is_object() const { return get_object() != nullptr; }

    /// nullptr если тип не совпадает
    const std::string* get_string() const { return std::get_if<std::string>(&data_); }

    const ValueArray* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<ValueArray>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const ValueObject* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<ValueObject>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Добавить элемент (только для массива)
    void push_back(Value v);

    /// Установить поле (только для объекта)
    /// Существующий ключ сохраняет позицию, значение заменяется.
    void set(const std::string& key, Value v);

    /// Поле объекта или nullptr
    const Value* get(const std::string& key) const;

    std::size_t size() const;

    /// @throws std::runtime_error для NaN/Inf
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    rapidjson::Document to_rapidjson_document() const;

    /// @param indent 0 = компактно, иначе PrettyWriter с указанным отступом
    std::string to_json(unsigned indent = 0) const;

private:
    // Массив и объект разделяются при копировании; set()/push_back()
    // отделяют копию перед изменением
    std::variant<Null, bool, std::int64_t, double, std::string, std::shared_ptr<ValueArray>,
                 std::shared_ptr<ValueObject>>
        data_;
};

}  // namespace scanconv

#endif  // SCANCONV_VALUE_HPP

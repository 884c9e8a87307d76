// ==============================================================================
// sandpipe/value.hpp - MOD-0006: Структурированное значение результатов
// ==============================================================================
//
// MOD-0006 value
// ADR-0003: RapidJSON как базовая JSON библиотека
//
// Назначение:
// - Значение, которое модули кладут в общую карту результатов
// - Трасса поведения (процессы/вызовы) хранится в том же представлении
// - Конверсия из/в RapidJSON и JSON-строку
// - "Истинность" значения: пустые данные модуля не попадают в результаты
//
// ==============================================================================

#ifndef SANDPIPE_VALUE_HPP
#define SANDPIPE_VALUE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace sandpipe {

class Value;

using ValueArray = std::vector<Value>;
using ValueObject = std::unordered_map<std::string, Value>;

/// Структурированное значение: null, bool, целые, double, строка, массив, объект
///
/// Массивы и объекты лежат за shared_ptr: копия Value дешёвая и разделяет
/// содержимое. Трасса процесса копируется в каждый обработчик сигнатур,
/// поэтому глубокое копирование здесь недопустимо.
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(int v) : data_(static_cast<Int64>(v)) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Тип
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// int или uint
    bool is_integer() const { return is_int() || is_uint(); }

    bool is_number() const { return is_integer() || is_double(); }

    /// Истинность в духе динамических языков: null, false, 0, "", [] и {} ложны
    bool truthy() const;

    // -------------------------------------------------------------------------
    // Доступ (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    Array& as_array_mut() { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    Object& as_object_mut() { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr / nullopt если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Целое значение со знаком; uint выше INT64_MAX и прочие типы дают nullopt
    std::optional<std::int64_t> to_int64() const;

    // -------------------------------------------------------------------------
    // Массив
    // -------------------------------------------------------------------------

    /// Добавить элемент (только если is_array())
    void push_back(Value v);

    std::size_t size() const;

    // -------------------------------------------------------------------------
    // Объект
    // -------------------------------------------------------------------------

    /// Установить поле (только если is_object())
    void set(const std::string& key, Value v);

    /// Поле объекта или nullptr
    const Value* get(const std::string& key) const;

    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Строковое поле объекта; отсутствие или другой тип дают fallback
    std::string get_string_or(const std::string& key, std::string_view fallback = {}) const;

    // -------------------------------------------------------------------------
    // JSON
    // -------------------------------------------------------------------------

    /// Number → UInt → Int → Double (порядок приоритета)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Не-конечный double даёт std::runtime_error
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Разобрать JSON-текст; при ошибке разбора std::runtime_error с позицией
    static Value parse_json(std::string_view text);

    /// Сериализовать в компактный или pretty JSON
    std::string dump_json(bool pretty = false) const;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;
};

}  // namespace sandpipe

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // SANDPIPE_VALUE_HPP

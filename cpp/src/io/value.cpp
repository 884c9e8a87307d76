// ==============================================================================
// value.cpp - MOD-0006: Реализация Value
// ==============================================================================
//
// MOD-0006 value
// ADR-0003: RapidJSON
//
// ==============================================================================

#include <sandpipe/value.hpp>

#include <cmath>
#include <limits>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace sandpipe {

// ----------------------------------------------------------------------------
// Истинность
// ----------------------------------------------------------------------------

bool Value::truthy() const {
    if (is_null()) {
        return false;
    }
    if (is_bool()) {
        return as_bool();
    }
    if (is_int()) {
        return as_int() != 0;
    }
    if (is_uint()) {
        return as_uint() != 0;
    }
    if (is_double()) {
        return as_double() != 0.0;
    }
    if (is_string()) {
        return !as_string().empty();
    }
    if (is_array()) {
        return !as_array().empty();
    }
    return !as_object().empty();
}

std::optional<std::int64_t> Value::to_int64() const {
    if (is_int()) {
        return as_int();
    }
    if (is_uint() &&
        as_uint() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return static_cast<std::int64_t>(as_uint());
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Массив / объект
// ----------------------------------------------------------------------------

void Value::push_back(Value v) {
    if (auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_)) {
        (*ptr)->push_back(std::move(v));
    }
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

void Value::set(const std::string& key, Value v) {
    if (auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_)) {
        (**ptr)[key] = std::move(v);
    }
}

const Value* Value::get(const std::string& key) const {
    if (const auto* obj = get_object()) {
        auto it = obj->find(key);
        if (it != obj->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

std::string Value::get_string_or(const std::string& key, std::string_view fallback) const {
    const Value* v = get(key);
    if (v != nullptr && v->is_string()) {
        return v->as_string();
    }
    return std::string(fallback);
}

// ----------------------------------------------------------------------------
// RapidJSON → Value
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }
    if (json.IsBool()) {
        return Value(json.GetBool());
    }
    if (json.IsNumber()) {
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }
    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }
    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (const auto& item : json.GetArray()) {
            arr.push_back(from_rapidjson(item));
        }
        return Value(std::move(arr));
    }
    Object obj;
    for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
        obj[std::string(it->name.GetString(), it->name.GetStringLength())] =
            from_rapidjson(it->value);
    }
    return Value(std::move(obj));
}

// ----------------------------------------------------------------------------
// Value → RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
    } else if (is_bool()) {
        out.SetBool(as_bool());
    } else if (is_int()) {
        out.SetInt64(as_int());
    } else if (is_uint()) {
        out.SetUint64(as_uint());
    } else if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
    } else if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    } else if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
    } else {
        out.SetObject();
        for (const auto& [key, val] : as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
    }
}

// ----------------------------------------------------------------------------
// Текст
// ----------------------------------------------------------------------------

Value Value::parse_json(std::string_view text) {
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("JSON parse error at offset ") +
                                 std::to_string(doc.GetErrorOffset()) + ": " +
                                 rapidjson::GetParseError_En(doc.GetParseError()));
    }
    return from_rapidjson(doc);
}

std::string Value::dump_json(bool pretty) const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace sandpipe

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

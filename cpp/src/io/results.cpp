// ==============================================================================
// results.cpp - MOD-0006: Карта результатов анализа
// ==============================================================================

#include <sandpipe/results.hpp>

#include <algorithm>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace sandpipe {

void ResultsMap::set(const std::string& key, Value value) {
    auto it = values_.find(key);
    if (it != values_.end()) {
        it->second = std::move(value);
        return;
    }
    keys_.push_back(key);
    values_.emplace(key, std::move(value));
}

const Value* ResultsMap::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? &it->second : nullptr;
}

bool ResultsMap::erase(const std::string& key) {
    if (values_.erase(key) == 0) {
        return false;
    }
    keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
    return true;
}

Value ResultsMap::to_value() const {
    Value::Object obj;
    for (const auto& key : keys_) {
        obj[key] = values_.at(key);
    }
    return Value(std::move(obj));
}

std::string ResultsMap::dump_json(bool pretty) const {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();
    for (const auto& key : keys_) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        values_.at(key).to_rapidjson(v, alloc);
        doc.AddMember(k, v, alloc);
    }

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

ResultsMap ResultsMap::from_value(const Value& object) {
    ResultsMap map;
    if (const auto* obj = object.get_object()) {
        for (const auto& [key, val] : *obj) {
            map.set(key, val);
        }
    }
    return map;
}

}  // namespace sandpipe

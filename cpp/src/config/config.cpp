// ==============================================================================
// config.cpp - MOD-0007: Конфигурация модулей (YAML)
// ==============================================================================
//
// MOD-0007 config
// ADR-0004: yaml-cpp для YAML
//
// ==============================================================================

#include <sandpipe/config.hpp>

#include <sandpipe/errors.hpp>
#include <sandpipe/platform.hpp>

#include <fstream>
#include <system_error>

namespace sandpipe::config {

// ============================================================================
// YAML → Value
// ============================================================================

Value yaml_to_value(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar: {
        // Скаляр в кавычках всегда строка
        if (node.Tag() == "!") {
            return Value(node.Scalar());
        }
        std::int64_t i = 0;
        if (YAML::convert<std::int64_t>::decode(node, i)) {
            return Value(i);
        }
        double d = 0.0;
        if (YAML::convert<double>::decode(node, d)) {
            return Value(d);
        }
        bool b = false;
        if (YAML::convert<bool>::decode(node, b)) {
            return Value(b);
        }
        return Value(node.Scalar());
    }
    case YAML::NodeType::Sequence: {
        Value::Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(yaml_to_value(item));
        }
        return Value(std::move(arr));
    }
    case YAML::NodeType::Map: {
        Value::Object obj;
        for (const auto& kv : node) {
            obj[kv.first.as<std::string>()] = yaml_to_value(kv.second);
        }
        return Value(std::move(obj));
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
        return Value();
    }
}

// ============================================================================
// Options
// ============================================================================

Options::Options() : node_(YAML::NodeType::Map) {}

Options::Options(std::string section, const YAML::Node& node)
    : section_(std::move(section)), node_(YAML::NodeType::Map) {
    if (!node.IsDefined() || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("section '" + section_ + "' is not a mapping");
    }
    node_ = YAML::Clone(node);
}

Options::Options(const Options& other)
    : section_(other.section_), node_(YAML::Clone(other.node_)) {}

Options& Options::operator=(const Options& other) {
    if (this != &other) {
        section_ = other.section_;
        node_ = YAML::Clone(other.node_);
    }
    return *this;
}

bool Options::has(const std::string& key) const {
    const YAML::Node& node = node_;
    return static_cast<bool>(node[key]);
}

bool Options::get_bool(const std::string& key, bool fallback) const {
    const YAML::Node& node = node_;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    bool out = fallback;
    if (!YAML::convert<bool>::decode(value, out)) {
        throw ConfigError("option '" + key + "' of section '" + section_ + "' is not a boolean");
    }
    return out;
}

std::int64_t Options::get_int(const std::string& key, std::int64_t fallback) const {
    const YAML::Node& node = node_;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    std::int64_t out = fallback;
    if (!YAML::convert<std::int64_t>::decode(value, out)) {
        throw ConfigError("option '" + key + "' of section '" + section_ + "' is not an integer");
    }
    return out;
}

std::string Options::get_string(const std::string& key, const std::string& fallback) const {
    const YAML::Node& node = node_;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    if (!value.IsScalar()) {
        throw ConfigError("option '" + key + "' of section '" + section_ + "' is not a scalar");
    }
    return value.Scalar();
}

Options& Options::set_string(const std::string& key, const std::string& value) {
    node_[key] = value;
    return *this;
}

Options& Options::set_bool(const std::string& key, bool value) {
    node_[key] = value;
    return *this;
}

Options& Options::set_int(const std::string& key, std::int64_t value) {
    node_[key] = value;
    return *this;
}

std::vector<std::string> Options::keys() const {
    std::vector<std::string> out;
    for (const auto& kv : node_) {
        out.push_back(kv.first.as<std::string>());
    }
    return out;
}

Value Options::to_value() const {
    return yaml_to_value(node_);
}

// ============================================================================
// Config
// ============================================================================

namespace {

LoadResult from_root(const YAML::Node& root) {
    LoadResult result;

    // Пустой документ — пустая конфигурация
    if (!root.IsDefined() || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = "configuration root is not a mapping";
        return result;
    }

    for (const auto& kv : root) {
        std::string name = kv.first.as<std::string>();
        result.config.set(Options(std::move(name), kv.second));
    }

    result.ok = true;
    return result;
}

}  // namespace

LoadResult Config::parse(std::string_view text) {
    try {
        return from_root(YAML::Load(std::string(text)));
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const ConfigError& e) {
        LoadResult result;
        result.error = e.what();
        return result;
    }
}

LoadResult Config::load(const std::filesystem::path& path) {
    LoadResult result;

    std::ifstream file(path);
    if (!file.is_open()) {
        result.error = "cannot open configuration file: " + platform::path_to_utf8(path);
        return result;
    }

    try {
        result = from_root(YAML::Load(file));
    } catch (const YAML::Exception& e) {
        result.ok = false;
        result.error = std::string("YAML parse error: ") + e.what();
    } catch (const ConfigError& e) {
        result.ok = false;
        result.error = e.what();
    }

    if (!result.ok) {
        result.error = platform::path_to_utf8(path) + ": " + result.error;
    }
    return result;
}

LoadResult Config::load_optional(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LoadResult result;
        result.ok = true;
        return result;
    }
    return load(path);
}

std::optional<Options> Config::find(const std::string& section) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Options Config::get(const std::string& section) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) {
        throw ConfigError("configuration section '" + section + "' not found");
    }
    return it->second;
}

void Config::set(Options options) {
    std::string name = options.section();
    sections_[name] = std::move(options);
}

std::vector<std::string> Config::sections() const {
    std::vector<std::string> out;
    out.reserve(sections_.size());
    for (const auto& [name, options] : sections_) {
        out.push_back(name);
    }
    return out;
}

// ============================================================================
// Конфигурация этапов
// ============================================================================

StageLoadResult load_stage_configs(const std::filesystem::path& dir) {
    StageLoadResult result;

    struct Entry {
        const char* file;
        Config* target;
    };
    const Entry entries[] = {
        {"processing.yaml", &result.configs.processing},
        {"reporting.yaml", &result.configs.reporting},
        {"auxiliary.yaml", &result.configs.auxiliary},
    };

    for (const auto& entry : entries) {
        auto loaded = Config::load_optional(dir / entry.file);
        if (!loaded.ok) {
            result.error = loaded.error;
            return result;
        }
        *entry.target = std::move(loaded.config);
    }

    result.ok = true;
    return result;
}

}  // namespace sandpipe::config

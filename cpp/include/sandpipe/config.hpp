// ==============================================================================
// sandpipe/config.hpp - MOD-0007: Конфигурация модулей (YAML)
// ==============================================================================
//
// MOD-0007 config
// ADR-0004: yaml-cpp для YAML
//
// Назначение:
// - Файл конфигурации этапа (processing.yaml, reporting.yaml, auxiliary.yaml)
//   состоит из секций, по одной на модуль; имя секции = каноническое имя модуля
// - Options: параметры одной секции, флаг enabled, типизированный доступ
// - Вторичная конфигурация анализа (analysis.yaml) читается тем же кодом
//
// Формат:
//
//   behavior:
//     enabled: yes
//     limit: 4096
//   target:
//     enabled: no
//
// ==============================================================================

#ifndef SANDPIPE_CONFIG_HPP
#define SANDPIPE_CONFIG_HPP

#include <sandpipe/value.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace sandpipe::config {

// ----------------------------------------------------------------------------
// Options — параметры одной секции
// ----------------------------------------------------------------------------

class Options {
public:
    /// Пустая секция (enabled == false)
    Options();

    /// Секция из YAML mapping (node клонируется)
    /// @throw ConfigError если node не mapping и не null
    Options(std::string section, const YAML::Node& node);

    // Копия клонирует node: YAML::Node сам по себе имеет ссылочную семантику
    Options(const Options& other);
    Options& operator=(const Options& other);
    Options(Options&&) = default;
    Options& operator=(Options&&) = default;

    const std::string& section() const { return section_; }

    /// Значение ключа "enabled"; отсутствие ключа означает false
    bool enabled() const { return get_bool("enabled", false); }

    bool has(const std::string& key) const;

    /// @throw ConfigError если значение есть, но не приводится к типу
    bool get_bool(const std::string& key, bool fallback) const;
    std::int64_t get_int(const std::string& key, std::int64_t fallback) const;
    std::string get_string(const std::string& key, const std::string& fallback) const;

    /// Установить скалярное значение (используется при сборке конфигурации в коде)
    Options& set_string(const std::string& key, const std::string& value);
    Options& set_bool(const std::string& key, bool value);
    Options& set_int(const std::string& key, std::int64_t value);

    /// Все ключи секции
    std::vector<std::string> keys() const;

    /// Секция как объект Value (скаляры приводятся к bool/int/double/string)
    Value to_value() const;

    const YAML::Node& node() const { return node_; }

private:
    std::string section_;
    YAML::Node node_;
};

// ----------------------------------------------------------------------------
// Config — набор секций
// ----------------------------------------------------------------------------

struct LoadResult;

class Config {
public:
    Config() = default;

    /// Прочитать YAML файл. Ошибка чтения или разбора → ok == false
    static LoadResult load(const std::filesystem::path& path);

    /// То же, но отсутствующий файл — пустая конфигурация, а не ошибка
    static LoadResult load_optional(const std::filesystem::path& path);

    /// Разобрать YAML из строки
    static LoadResult parse(std::string_view text);

    /// Секция или nullopt
    std::optional<Options> find(const std::string& section) const;

    /// Секция
    /// @throw ConfigError если секции нет
    Options get(const std::string& section) const;

    bool has(const std::string& section) const { return sections_.count(section) > 0; }

    void set(Options options);

    std::vector<std::string> sections() const;

    bool empty() const { return sections_.empty(); }

private:
    std::map<std::string, Options> sections_;
};

struct LoadResult {
    bool ok = false;
    Config config;
    std::string error;

    explicit operator bool() const { return ok; }
};

/// Файлы конфигурации этапов в каталоге конфигурации
struct StageConfigs {
    Config processing;
    Config reporting;
    Config auxiliary;
};

/// Загрузить processing.yaml, reporting.yaml, auxiliary.yaml из каталога.
/// Отсутствующий файл — пустая конфигурация этапа.
struct StageLoadResult {
    bool ok = false;
    StageConfigs configs;
    std::string error;
};
StageLoadResult load_stage_configs(const std::filesystem::path& dir);

/// Конвертировать YAML node в Value
Value yaml_to_value(const YAML::Node& node);

}  // namespace sandpipe::config

#endif  // SANDPIPE_CONFIG_HPP

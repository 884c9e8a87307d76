// ==============================================================================
// sandpipe/registry.hpp - MOD-0008: Реестр плагинов
// ==============================================================================
//
// MOD-0008 registry
//
// Назначение:
// - Отображение группа → список дескрипторов в порядке регистрации
// - Заполняется один раз при старте (register_builtin_plugins или тестом)
// - Передаётся по ссылке во все этапы; глобального реестра нет
//
// Дескриптор хранит фабрику: тип плагина общий, экземпляр на каждый прогон
// создаётся заново.
//
// ==============================================================================

#ifndef SANDPIPE_REGISTRY_HPP
#define SANDPIPE_REGISTRY_HPP

#include <sandpipe/plugin.hpp>
#include <sandpipe/signature.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace sandpipe {

namespace output {
class Writer;
}

using Factory = std::function<std::unique_ptr<Plugin>()>;

struct PluginDescriptor {
    Group group = Group::Processing;
    std::string name;  // каноническое имя = имя секции конфигурации
    int order = 1;     // равные order сохраняют порядок регистрации
    bool enabled = true;

    // Только для сигнатур: допустимый диапазон версии движка
    std::optional<std::string> minimum;
    std::optional<std::string> maximum;

    Factory factory;

    /// Создать экземпляр. Исключения фабрики пробрасываются вызывающему.
    std::unique_ptr<Plugin> instantiate() const;
};

// ----------------------------------------------------------------------------
// Группа по базовому интерфейсу
// ----------------------------------------------------------------------------

template <typename T>
constexpr Group group_of() {
    static_assert(std::is_base_of_v<Plugin, T>, "plugin must derive from sandpipe::Plugin");
    if constexpr (std::is_base_of_v<Signature, T>) {
        return Group::Signatures;
    } else if constexpr (std::is_base_of_v<Processing, T>) {
        return Group::Processing;
    } else if constexpr (std::is_base_of_v<Report, T>) {
        return Group::Reporting;
    } else if constexpr (std::is_base_of_v<Auxiliary, T>) {
        return Group::Auxiliary;
    } else {
        static_assert(std::is_base_of_v<Machinery, T>, "unknown plugin interface");
        return Group::Machinery;
    }
}

/// Дескриптор для типа T с фабрикой по умолчанию
template <typename T>
PluginDescriptor describe(std::string name, int order = 1) {
    PluginDescriptor d;
    d.group = group_of<T>();
    d.name = std::move(name);
    d.order = order;
    d.factory = [] { return std::unique_ptr<Plugin>(std::make_unique<T>()); };
    return d;
}

// ----------------------------------------------------------------------------
// Registry
// ----------------------------------------------------------------------------

class Registry {
public:
    /// Добавить в конец списка группы (дубликаты допустимы)
    void register_plugin(PluginDescriptor descriptor);

    /// Список группы в порядке регистрации; пустой если группы нет
    const std::vector<PluginDescriptor>& list(Group group) const;

    /// Полное отображение
    const std::map<Group, std::vector<PluginDescriptor>>& list() const { return groups_; }

    /// Всего дескрипторов во всех группах
    std::size_t size() const;

private:
    std::map<Group, std::vector<PluginDescriptor>> groups_;
};

/// Зарегистрировать встроенные плагины (builtin.hpp).
/// writer получает вывод reporting-модуля console.
void register_builtin_plugins(Registry& registry, output::Writer* writer = nullptr);

}  // namespace sandpipe

#endif  // SANDPIPE_REGISTRY_HPP

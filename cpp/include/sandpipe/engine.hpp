// ==============================================================================
// sandpipe/engine.hpp - MOD-0015: Движок сигнатур
// ==============================================================================
//
// MOD-0015 engine
//
// Назначение:
// - Загрузка включённых сигнатур, совместимых с версией движка
// - init / quickout, затем прогон трассы: on_process на процесс,
//   on_call на каждый вызов, прошедший фильтры сигнатуры
// - Совпадение рассылается всем активным сигнатурам через on_signature
// - on_complete, затем results["signatures"] по возрастанию severity
//
// Все вызовы обработчиков идут через одну обёртку (call_signature):
// исключение обработчика логируется и считается несовпадением.
//
// Каскад ограничен:
// - в пределах одного события верхнего уровня сигнатура рассылает своё
//   совпадение не более одного раза
// - глубина вложенных on_signature не превышает max_cascade_depth
// Срабатывание любого ограничения обрывает только свою ветку каскада.
//
// ==============================================================================

#ifndef SANDPIPE_ENGINE_HPP
#define SANDPIPE_ENGINE_HPP

#include <sandpipe/cancel.hpp>
#include <sandpipe/output.hpp>
#include <sandpipe/registry.hpp>
#include <sandpipe/results.hpp>
#include <sandpipe/signature.hpp>
#include <sandpipe/version.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sandpipe::pipeline {

/// Нижняя граница minimum: сигнатуры старше написаны под прежний API
struct StyleFloor {
    std::string version;
    std::string message;  // к сообщению дописывается имя сигнатуры
};

/// Границы 1.2 и 2.0, проверяются по порядку
std::vector<StyleFloor> default_style_floors();

struct EngineOptions {
    /// Версия движка; суффикс после '-' отбрасывается
    std::string version = version::ENGINE_VERSION;

    /// Сигнатура с minimum ниже любой из границ отбрасывается с предупреждением
    std::vector<StyleFloor> style_floors = default_style_floors();

    std::size_t max_cascade_depth = 32;

    const CancelToken* cancel = nullptr;
};

struct EngineStats {
    std::size_t loaded = 0;   // экземпляров создано
    std::size_t dropped = 0;  // выключены, несовместимы, не создались, упали в init/quickout
    std::size_t active = 0;   // участвовали в прогоне трассы
    std::size_t matched = 0;
    std::size_t handler_failures = 0;
    std::size_t cascade_truncations = 0;
};

class RunSignatures {
public:
    RunSignatures(ResultsMap& results, const Registry& registry, output::Writer& writer,
                  EngineOptions options = {});

    /// Проверить minimum/maximum дескриптора против версии движка
    bool check_signature_version(const PluginDescriptor& descriptor);

    /// Полный прогон; записывает results["signatures"]
    void run();

    /// Сигнатуры, участвовавшие в последнем прогоне
    const std::vector<std::unique_ptr<Signature>>& active() const { return active_; }

    /// Совпавшие сигнатуры в порядке первого совпадения
    const std::vector<const Signature*>& matched() const { return matched_order_; }

    const EngineStats& stats() const { return stats_; }

private:
    using Handler = std::function<bool(Signature&)>;

    void load();
    void initialize();
    void replay();
    void complete();
    void collect();

    /// Событие верхнего уровня: сбрасывает множество разосланных совпадений
    void dispatch(Signature& signature, const char* handler, const Handler& fn);

    void call_signature(Signature& signature, const char* handler, const Handler& fn,
                        std::size_t depth);
    void on_match(Signature& signature, std::size_t depth);

    ResultsMap& results_;
    const Registry& registry_;
    output::Writer& writer_;
    EngineOptions options_;
    std::optional<version::Version> running_;

    std::vector<std::unique_ptr<Signature>> active_;
    std::vector<const Signature*> matched_order_;
    std::unordered_set<const Signature*> propagated_;
    EngineStats stats_;
};

}  // namespace sandpipe::pipeline

#endif  // SANDPIPE_ENGINE_HPP

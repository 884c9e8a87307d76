// ==============================================================================
// sandpipe/results.hpp - MOD-0006: Карта результатов анализа
// ==============================================================================
//
// MOD-0006 value
//
// Назначение:
// - Общая карта результатов одного прогона ("fat map")
// - Каждый processing-модуль добавляет один ключ, движок сигнатур —
//   ключ "signatures", reporting-модули читают всю карту
// - Порядок вставки ключей сохраняется (детерминированный вывод)
//
// ==============================================================================

#ifndef SANDPIPE_RESULTS_HPP
#define SANDPIPE_RESULTS_HPP

#include <sandpipe/value.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace sandpipe {

class ResultsMap {
public:
    ResultsMap() = default;

    /// Установить значение. Повторная запись ключа сохраняет его исходную позицию
    void set(const std::string& key, Value value);

    /// Значение по ключу или nullptr
    const Value* get(const std::string& key) const;

    bool has(const std::string& key) const { return values_.count(key) > 0; }

    /// Удалить ключ; false если его не было
    bool erase(const std::string& key);

    /// Ключи в порядке первой вставки
    const std::vector<std::string>& keys() const { return keys_; }

    std::size_t size() const { return keys_.size(); }
    bool empty() const { return keys_.empty(); }

    /// Собрать объект Value (порядок ключей не сохраняется)
    Value to_value() const;

    /// JSON объект с ключами верхнего уровня в порядке вставки
    std::string dump_json(bool pretty = false) const;

    /// Построить карту из объекта; не-объект даёт пустую карту
    static ResultsMap from_value(const Value& object);

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, Value> values_;
};

}  // namespace sandpipe

#endif  // SANDPIPE_RESULTS_HPP

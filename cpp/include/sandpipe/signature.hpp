// ==============================================================================
// sandpipe/signature.hpp - MOD-0013: Интерфейс сигнатуры
// ==============================================================================
//
// MOD-0013 signatures
//
// Сигнатура — правило, оценивающее трассу одного анализа. Все обработчики
// имеют поведение по умолчанию (ничего не делать / false), сигнатура
// переопределяет только нужные.
//
// Порядок вызовов движком:
//   init → quickout → (on_process → on_call...)* → on_complete
//   on_signature — при совпадении любой активной сигнатуры (включая себя)
//
// Обработчики вызываются только пока is_active() == true; вернувший true
// обработчик означает совпадение.
//
// ==============================================================================

#ifndef SANDPIPE_SIGNATURE_HPP
#define SANDPIPE_SIGNATURE_HPP

#include <sandpipe/plugin.hpp>
#include <sandpipe/results.hpp>
#include <sandpipe/trace.hpp>
#include <sandpipe/value.hpp>

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace sandpipe {

namespace pipeline {
class RunSignatures;
}

class Signature : public Plugin {
public:
    Signature(std::string name, int severity, std::string description = {});

    const std::string& name() const { return name_; }
    int severity() const { return severity_; }
    const std::string& description() const { return description_; }

    // Состояние, которое ведёт движок
    // -------------------------------------------------------------------------

    /// Выставляется только движком, вместе с записью в порядок совпадений
    bool matched() const { return matched_; }

    std::int64_t pid() const { return pid_; }
    std::size_t cid() const { return cid_; }
    void set_pid(std::int64_t pid) { pid_ = pid; }
    void set_cid(std::size_t cid) { cid_ = cid; }

    /// Доступ к карте результатов анализа (только чтение)
    void set_results(const ResultsMap* results) { results_ = results; }

    // Фильтры
    // -------------------------------------------------------------------------

    /// Перенести списки фильтров в хеш-множества
    void compile_filters();

    /// Вызов проходит все непустые фильтры
    bool accepts(const Process& process, const Call& call) const;

    // Обработчики
    // -------------------------------------------------------------------------

    virtual void init() {}

    /// true — сигнатура заведомо не совпадёт, исключить её из прогона
    virtual bool quickout() { return false; }

    /// false — движок не вызывает обработчики этой сигнатуры
    virtual bool is_active() const { return true; }

    virtual bool on_process(const Process& process);
    virtual bool on_call(const Call& call, const Process& process);
    virtual bool on_signature(const Signature& matched);
    virtual bool on_complete() { return false; }

    // Результат
    // -------------------------------------------------------------------------

    /// Добавить улику в детект
    void mark(Value evidence);
    const std::vector<Value>& marks() const { return marks_; }

    /// {name, severity, description, marks}
    virtual Value detection() const;

protected:
    const ResultsMap* results() const { return results_; }

    // Пустой список — фильтр не применяется
    std::vector<std::string> filter_processnames;
    std::vector<std::string> filter_apinames;
    std::vector<std::string> filter_categories;

private:
    friend class pipeline::RunSignatures;

    void set_matched() { matched_ = true; }

    std::string name_;
    int severity_;
    std::string description_;

    bool matched_ = false;
    std::int64_t pid_ = 0;
    std::size_t cid_ = 0;
    const ResultsMap* results_ = nullptr;

    std::unordered_set<std::string> processnames_;
    std::unordered_set<std::string> apinames_;
    std::unordered_set<std::string> categories_;

    std::vector<Value> marks_;
};

}  // namespace sandpipe

#endif  // SANDPIPE_SIGNATURE_HPP

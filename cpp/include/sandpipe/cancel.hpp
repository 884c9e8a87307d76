// ==============================================================================
// sandpipe/cancel.hpp - MOD-0009: Кооперативная отмена
// ==============================================================================
//
// MOD-0009 runner
//
// Токен проверяется между модулями, между процессами и вызовами трассы и
// в обёртке каскада. Отмена не прерывает уже запущенный обработчик.
//
// ==============================================================================

#ifndef SANDPIPE_CANCEL_HPP
#define SANDPIPE_CANCEL_HPP

#include <atomic>

namespace sandpipe {

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

/// nullptr означает "отмена не запрошена"
inline bool is_cancelled(const CancelToken* token) {
    return token != nullptr && token->cancelled();
}

}  // namespace sandpipe

#endif  // SANDPIPE_CANCEL_HPP

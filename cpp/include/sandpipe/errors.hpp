// ==============================================================================
// sandpipe/errors.hpp - MOD-0005: Исключения модулей и конвейера
// ==============================================================================
//
// MOD-0005 errors
//
// Модули сообщают об объявленных сбоях исключениями этих типов.
// Module Runner классифицирует их:
// - DependencyError  → warning, модуль пропущен
// - ProcessingError  → warning, данные модуля не попадают в результаты
// - ReportError      → warning
// - любое другое std::exception → error с контекстом (модуль, задача)
//
// ==============================================================================

#ifndef SANDPIPE_ERRORS_HPP
#define SANDPIPE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sandpipe {

/// Базовое исключение проекта
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Ошибка доступа к конфигурации (нет секции, неверный тип значения)
class ConfigError : public Error {
public:
    using Error::Error;
};

/// У модуля нет внешней зависимости (библиотека, утилита, файл)
class DependencyError : public Error {
public:
    using Error::Error;
};

/// Processing-модуль не смог обработать анализ
class ProcessingError : public Error {
public:
    using Error::Error;
};

/// Reporting-модуль не смог построить отчёт
class ReportError : public Error {
public:
    using Error::Error;
};

}  // namespace sandpipe

#endif  // SANDPIPE_ERRORS_HPP

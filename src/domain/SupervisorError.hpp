/**
 * @file SupervisorError.hpp
 * @brief Error taxonomy and Result type shared by the supervisor subsystems.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <variant>

namespace dealflow::domain {

/**
 * @enum ErrorKind
 * @brief Categories of failure the supervisor can surface.
 */
enum class ErrorKind {
    ConfigurationError,    ///< Malformed rule catalog or settings.
    UnknownTask,           ///< Task name missing from the dispatch table.
    UnhandledConflictType, ///< Resolver has no strategy for a conflict kind.
    InvalidDecision        ///< Confidence out of range or required fields missing.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::UnknownTask: return "UnknownTask";
        case ErrorKind::UnhandledConflictType: return "UnhandledConflictType";
        case ErrorKind::InvalidDecision: return "InvalidDecision";
    }
    return "Unknown";
}

/**
 * @struct SupervisorFault
 * @brief A typed failure returned by a subsystem call.
 */
struct SupervisorFault {
    ErrorKind kind;
    std::string message;

    std::string describe() const {
        return ErrorKindToString(kind) + ": " + message;
    }
};

/**
 * @brief Either a value or the fault that prevented producing it.
 */
template <typename T>
using Result = std::variant<T, SupervisorFault>;

template <typename T>
bool IsOk(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

template <typename T>
const T& Value(const Result<T>& result) {
    return std::get<T>(result);
}

template <typename T>
T& Value(Result<T>& result) {
    return std::get<T>(result);
}

template <typename T>
const SupervisorFault& Fault(const Result<T>& result) {
    return std::get<SupervisorFault>(result);
}

/**
 * @class SupervisorException
 * @brief Carries a fault across boundaries that cannot return a Result
 *        (configuration loading, engine initialisation).
 */
class SupervisorException : public std::runtime_error {
public:
    explicit SupervisorException(SupervisorFault fault)
        : std::runtime_error(fault.describe()), m_fault(std::move(fault)) {}

    SupervisorException(ErrorKind kind, const std::string& message)
        : SupervisorException(SupervisorFault{kind, message}) {}

    const SupervisorFault& fault() const { return m_fault; }
    ErrorKind kind() const { return m_fault.kind; }

private:
    SupervisorFault m_fault;
};

} // namespace dealflow::domain

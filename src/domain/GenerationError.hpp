/**
 * @file GenerationError.hpp
 * @brief Error value and tagged result returned by generation calls.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace genclient::domain {

/**
 * @struct GenerationError
 * @brief Why a generation call produced no text.
 */
struct GenerationError {
    enum class Kind {
        Transport,  ///< The HTTP exchange itself could not be completed.
        Generation  ///< The exchange completed but the reply is unusable.
    };

    Kind kind;
    std::string message; ///< Human-readable, meant to be displayed as-is.
    std::string cause;   ///< Lower-level error text, empty when there is none.

    static std::string KindToString(Kind k) {
        switch (k) {
            case Kind::Transport: return "transport";
            case Kind::Generation: return "generation";
        }
        return "generation";
    }

    static GenerationError Transport(const std::string& context, const std::string& cause) {
        return {Kind::Transport, context + ": " + cause, cause};
    }

    static GenerationError ParseFailure(const std::string& context, const std::string& cause) {
        return {Kind::Generation, context + ": " + cause, cause};
    }

    static GenerationError Incomplete() {
        return {Kind::Generation, "incomplete response", {}};
    }
};

/**
 * @class Result
 * @brief Either a value or a GenerationError.
 */
template <typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(GenerationError error) : m_data(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return ok(); }

    /** @brief Throws std::bad_variant_access when the result holds an error. */
    const T& value() const { return std::get<T>(m_data); }
    const GenerationError& error() const { return std::get<GenerationError>(m_data); }

private:
    std::variant<T, GenerationError> m_data;
};

} // namespace genclient::domain

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace cutline {

// Store-level error codes (no QSqlError escapes the persistence layer)
enum class StoreErrorCode {
    NotFound,
    DuplicateId,
    InvalidTransition,
    Database
};

inline const char* store_error_code_to_string(StoreErrorCode code) {
    switch (code) {
        case StoreErrorCode::NotFound:          return "NotFound";
        case StoreErrorCode::DuplicateId:       return "DuplicateId";
        case StoreErrorCode::InvalidTransition: return "InvalidTransition";
        case StoreErrorCode::Database:          return "Database";
    }
    return "Unknown";
}

// Error with context message
struct StoreError {
    StoreErrorCode code;
    std::string message;

    static StoreError not_found(const std::string& id) {
        return {StoreErrorCode::NotFound, "Job not found: " + id};
    }
    static StoreError duplicate_id(const std::string& id) {
        return {StoreErrorCode::DuplicateId, "Job id already exists: " + id};
    }
    static StoreError invalid_transition(const std::string& detail) {
        return {StoreErrorCode::InvalidTransition, detail};
    }
    static StoreError database(const std::string& detail) {
        return {StoreErrorCode::Database, detail};
    }
};

// Result type: either value T or E
template<typename T, typename E = StoreError>
class Result {
public:
    // Success constructor
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}

    // Error constructor
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool is_ok() const { return m_data.index() == 0; }
    bool is_error() const { return m_data.index() == 1; }

    T& value() { return std::get<0>(m_data); }
    const T& value() const { return std::get<0>(m_data); }

    E& error() { return std::get<1>(m_data); }
    const E& error() const { return std::get<1>(m_data); }

    // Unwrap value or throw (for tools and tests)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error("Result::unwrap on error value");
        }
        return std::move(value());
    }

private:
    std::variant<T, E> m_data;
};

// Specialization for void result
template<typename E>
class Result<void, E> {
public:
    Result() : m_error(std::nullopt) {}
    Result(E error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    E& error() { return *m_error; }
    const E& error() const { return *m_error; }

private:
    std::optional<E> m_error;
};

} // namespace cutline

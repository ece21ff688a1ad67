#pragma once

#include <string>
#include <utility>
#include <variant>

namespace eventscrub {

enum class ErrorCategory {
    NONE,
    PROCESSOR_ERROR
};

/**
 * @brief Why an operation failed and which component failed it
 */
struct Error {
    ErrorCategory category = ErrorCategory::NONE;
    std::string source;
    std::string message;
};

/**
 * @brief Value of an operation or the Error that stopped it
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }

    static Result error(ErrorCategory category, std::string source, std::string message) {
        return Result(Error{category, std::move(source), std::move(message)});
    }

    bool is_ok() const { return std::holds_alternative<T>(state_); }
    bool is_error() const { return !is_ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }

    const Error& failure() const { return std::get<Error>(state_); }
    ErrorCategory error_category() const { return failure().category; }

    /// "source: message", or just the message when there is no source
    std::string error_message() const {
        const auto& err = failure();
        return err.source.empty() ? err.message : err.source + ": " + err.message;
    }

private:
    explicit Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    explicit Result(Error err) : state_(std::in_place_index<1>, std::move(err)) {}

    std::variant<T, Error> state_;
};

} // namespace eventscrub

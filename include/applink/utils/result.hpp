#pragma once
#include <variant>
#include <string>
#include <type_traits>
#include <utility>

namespace applink {
namespace utils {

// Wraps an error value so it can be returned from a Result whose value and
// error types coincide (e.g. Result<std::string>).
template <typename E>
struct Failure {
    E error;
};

template <typename E>
Failure<typename std::decay<E>::type> fail(E&& error) {
    return Failure<typename std::decay<E>::type>{std::forward<E>(error)};
}

inline Failure<std::string> fail(const char* error) {
    return Failure<std::string>{std::string(error)};
}

// Generic Result<T, E> template
// Holds either a value of type T or an error of type E (a message by default)

template <typename T, typename E = std::string>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructors
    template <typename U,
              typename std::enable_if<
                  !std::is_same<typename std::decay<U>::type, T>::value &&
                  !std::is_same<typename std::decay<U>::type, Result>::value &&
                  std::is_constructible<E, U&&>::value &&
                  !std::is_constructible<T, U&&>::value, int>::type = 0>
    Result(U&& error) : data_(std::in_place_index<1>, std::forward<U>(error)) {}
    Result(Failure<E> failure) : data_(std::in_place_index<1>, std::move(failure.error)) {}

    bool has_value() const { return data_.index() == 0; }
    bool has_error() const { return data_.index() == 1; }

    const T& value() const { return std::get<0>(data_); }
    T& value() { return std::get<0>(data_); }
    const E& error() const { return std::get<1>(data_); }

private:
    std::variant<T, E> data_;
};

// Specialization for void

template <typename E>
class Result<void, E> {
public:
    // Success constructor
    Result() : success_(true) {}
    // Error constructor
    Result(const E& error) : success_(false), error_(error) {}
    Result(E&& error) : success_(false), error_(std::move(error)) {}
    Result(Failure<E> failure) : success_(false), error_(std::move(failure.error)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    const E& error() const { return error_; }

private:
    bool success_ = false;
    E error_{};
};

} // namespace utils
} // namespace applink

// For convenience, provide a top-level alias in the project namespace
namespace applink {
using utils::Result;
}

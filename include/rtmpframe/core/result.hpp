// RtmpFrame - RTMP message framing library
// Result type for error handling without exceptions

#ifndef RTMPFRAME_CORE_RESULT_HPP
#define RTMPFRAME_CORE_RESULT_HPP

#include <cstddef>
#include <optional>
#include <variant>
#include <utility>
#include <stdexcept>
#include <type_traits>

namespace rtmpframe {
namespace core {

/**
 * @brief Either a success value or an error.
 *
 * Every fallible operation of the framing layer reports through this type.
 * Exceptions only escape when an accessor is misused (reading the value of
 * an error result or the error of a successful one).
 *
 * @tparam T The success value type
 * @tparam E The error type
 */
template<typename T, typename E>
class Result {
public:
    /**
     * @brief Create a successful result with a value.
     */
    static Result success(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /**
     * @brief Create an error result.
     */
    static Result error(E err) {
        return Result(std::in_place_index<1>, std::move(err));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return storage_.index() == 0;
    }

    [[nodiscard]] bool isError() const noexcept {
        return storage_.index() == 1;
    }

    /**
     * @brief Get the success value.
     * @throws std::logic_error if called on an error result
     */
    [[nodiscard]] T& value() & {
        requireAlternative(0);
        return std::get<0>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        requireAlternative(0);
        return std::get<0>(storage_);
    }

    [[nodiscard]] T&& value() && {
        requireAlternative(0);
        return std::get<0>(std::move(storage_));
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        requireAlternative(1);
        return std::get<1>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        requireAlternative(1);
        return std::get<1>(storage_);
    }

    /**
     * @brief Get the success value or a fallback when this is an error.
     */
    [[nodiscard]] T valueOr(T defaultValue) const& {
        if (isSuccess()) {
            return std::get<0>(storage_);
        }
        return defaultValue;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    template<std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& value)
        : storage_(tag, std::forward<U>(value)) {}

    void requireAlternative(std::size_t index) const {
        if (storage_.index() != index) {
            throw std::logic_error(index == 0
                ? "Attempted to access value on error result"
                : "Attempted to access error on success result");
        }
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that produce no value on success.
 *
 * @tparam E The error type
 */
template<typename E>
class Result<void, E> {
public:
    static Result success() {
        return Result();
    }

    static Result error(E err) {
        Result result;
        result.error_ = std::move(err);
        return result;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return !error_.has_value();
    }

    [[nodiscard]] bool isError() const noexcept {
        return error_.has_value();
    }

    /**
     * @brief Get the error value.
     * @throws std::logic_error if called on a success result
     */
    [[nodiscard]] E& error() & {
        requireError();
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        requireError();
        return *error_;
    }

    Result(Result&&) noexcept = default;
    Result& operator=(Result&&) noexcept = default;
    Result(const Result&) = default;
    Result& operator=(const Result&) = default;

private:
    Result() = default;

    void requireError() const {
        if (!error_) {
            throw std::logic_error("Attempted to access error on success result");
        }
    }

    std::optional<E> error_;
};

} // namespace core
} // namespace rtmpframe

#endif // RTMPFRAME_CORE_RESULT_HPP

//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_RESULT_HPP
#define SASA_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type used by every fallible sasa call.
 *
 * @code
 *     auto report = sasa::analyzers::analyze(source, options);
 *     if (report.is_err()) {
 *         std::cerr << report.error() << std::endl;
 *         return 1;
 *     }
 *     auto document = report.map([](const auto& r) { return sasa::exporters::to_json(r); });
 * @endcode
 */

#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace sasa {

    struct SuccessTag {};
    struct FailureTag {};

    inline constexpr SuccessTag success_tag{};
    inline constexpr FailureTag failure_tag{};

    /**
     * Holds a T on success or an E on failure, never both and never neither.
     * Reading the wrong side throws std::logic_error; callers check is_ok()
     * or is_err() first.
     */
    template<typename T, typename E>
    class Result {
    public:
        using value_type = T;
        using error_type = E;

        Result(SuccessTag, T value) : state_(std::in_place_index<0>, std::move(value)) {}
        Result(FailureTag, E error) : state_(std::in_place_index<1>, std::move(error)) {}

        static Result success(T value) { return {success_tag, std::move(value)}; }
        static Result failure(E error) { return {failure_tag, std::move(error)}; }

        [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return state_.index() == 1; }
        explicit operator bool() const noexcept { return is_ok(); }

        T& value() & { return std::get<0>(checked_ok()); }
        const T& value() const& { return std::get<0>(checked_ok()); }
        T&& value() && { return std::get<0>(std::move(checked_ok())); }

        E& error() & { return std::get<1>(checked_err()); }
        const E& error() const& { return std::get<1>(checked_err()); }

        T value_or(T fallback) const& {
            if (is_ok()) {
                return std::get<0>(state_);
            }
            return fallback;
        }

        T value_or(T fallback) && {
            if (is_ok()) {
                return std::get<0>(std::move(state_));
            }
            return fallback;
        }

        /// Applies @p f to the value; an error is carried over untouched.
        template<typename F>
        auto map(F&& f) const& {
            using U = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Result<U, E>::failure(std::get<1>(state_));
            }
            return Result<U, E>::success(std::invoke(std::forward<F>(f), std::get<0>(state_)));
        }

        /// Applies @p f to the error, e.g. to attach context on the way up.
        template<typename F>
        auto map_error(F&& f) const& {
            using G = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Result<T, G>::success(std::get<0>(state_));
            }
            return Result<T, G>::failure(std::invoke(std::forward<F>(f), std::get<1>(state_)));
        }

        /// Runs the next fallible step only when this one succeeded.
        template<typename F>
        auto and_then(F&& f) const& {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<1>(state_));
            }
            return std::invoke(std::forward<F>(f), std::get<0>(state_));
        }

        /// Gives @p f a chance to turn an error into a value.
        template<typename F>
        auto or_else(F&& f) const& {
            using Next = std::invoke_result_t<F, const E&>;
            if (is_ok()) {
                return Next::success(std::get<0>(state_));
            }
            return std::invoke(std::forward<F>(f), std::get<1>(state_));
        }

    private:
        std::variant<T, E>& checked_ok() {
            if (is_err()) throw std::logic_error("Result::value() called on an error");
            return state_;
        }

        const std::variant<T, E>& checked_ok() const {
            if (is_err()) throw std::logic_error("Result::value() called on an error");
            return state_;
        }

        std::variant<T, E>& checked_err() {
            if (is_ok()) throw std::logic_error("Result::error() called on a success");
            return state_;
        }

        const std::variant<T, E>& checked_err() const {
            if (is_ok()) throw std::logic_error("Result::error() called on a success");
            return state_;
        }

        std::variant<T, E> state_;
    };

    /**
     * Result of an operation with no value, such as writing a file.
     */
    template<typename E>
    class Result<void, E> {
    public:
        using value_type = void;
        using error_type = E;

        explicit Result(SuccessTag) {}
        Result(FailureTag, E error) : error_(std::move(error)) {}

        static Result success() { return Result(success_tag); }
        static Result failure(E error) { return {failure_tag, std::move(error)}; }

        [[nodiscard]] bool is_ok() const noexcept { return !error_; }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }
        explicit operator bool() const noexcept { return is_ok(); }

        const E& error() const {
            if (!error_) throw std::logic_error("Result::error() called on a success");
            return *error_;
        }

        template<typename F>
        auto and_then(F&& f) const {
            using Next = std::invoke_result_t<F>;
            if (error_) {
                return Next::failure(*error_);
            }
            return std::invoke(std::forward<F>(f));
        }

    private:
        std::optional<E> error_;
    };

}  // namespace sasa

#endif //SASA_RESULT_HPP

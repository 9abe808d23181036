//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef BUSFACTORANALYZER_RESULT_HPP
#define BUSFACTORANALYZER_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type used across bfa.
 *
 * @code
 *     auto config = load_config_file("bfa.toml");
 *     if (config.is_err()) {
 *         std::cerr << config.error() << std::endl;
 *     }
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace bfa {

    template<typename T, typename E>
    class Result {
    public:
        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
        [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

        /**
         * @throws std::logic_error on an error result.
         */
        T& value() & {
            check(is_ok(), "Result::value() called on error result");
            return std::get<0>(data_);
        }

        const T& value() const& {
            check(is_ok(), "Result::value() called on error result");
            return std::get<0>(data_);
        }

        /**
         * @throws std::logic_error on a success result.
         */
        const E& error() const {
            check(is_err(), "Result::error() called on success result");
            return std::get<1>(data_);
        }

        /**
         * Feeds the value to an operation that may itself fail. An error
         * passes through unchanged.
         */
        template<typename F>
        auto and_then(F&& f) const -> std::invoke_result_t<F, const T&> {
            using Next = std::invoke_result_t<F, const T&>;
            if (is_err()) {
                return Next::failure(std::get<1>(data_));
            }
            return std::forward<F>(f)(std::get<0>(data_));
        }

    private:
        template<std::size_t I, typename V>
        Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

        static void check(const bool ok, const char* what) {
            if (!ok) {
                throw std::logic_error(what);
            }
        }

        std::variant<T, E> data_;
    };

    template<typename E>
    class Result<void, E> {
    public:
        static Result success() { return Result(std::nullopt); }
        static Result failure(E error) { return Result(std::move(error)); }

        [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
        [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

        const E& error() const {
            if (!error_) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace bfa

#endif //BUSFACTORANALYZER_RESULT_HPP

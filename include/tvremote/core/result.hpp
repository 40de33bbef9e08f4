#pragma once
#include <variant>
#include <utility>
#include <functional>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace tvremote {
template<typename T, typename E>
class Result;
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};
template<typename E>
struct PropagatedErr {
    E error;
};
template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    Result(PropagatedErr<E>&& propagated)
        : value_(std::in_place_index<1>, std::move(propagated.error)) {}
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }
    [[nodiscard]] T& Unwrap() & {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] E& UnwrapErr() & {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(std::move(value_));
    }
    [[nodiscard]] T UnwrapOr(T default_value) && {
        if (IsOk()) {
            return std::get<0>(std::move(value_));
        }
        return default_value;
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(value_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsErr()) {
            return Result<T, U>::Err(std::forward<F>(func)(std::get<1>(std::move(value_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(value_)));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using ResultType = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename ResultType::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsOk()) {
            return std::forward<F>(func)(std::get<0>(std::move(value_)));
        }
        return ResultType::Err(std::get<1>(std::move(value_)));
    }
    [[nodiscard]] PropagatedErr<E> Propagate() && {
        return PropagatedErr<E>{std::get<1>(std::move(value_))};
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
};
#define TVREMOTE_TRY(result_expr) \
    do { \
        auto&& tvremote_try_result_ = (result_expr); \
        if (tvremote_try_result_.IsErr()) { \
            return std::move(tvremote_try_result_).Propagate(); \
        } \
    } while(0)

#define TVREMOTE_CO_TRY(result_expr) \
    do { \
        auto&& tvremote_try_result_ = (result_expr); \
        if (tvremote_try_result_.IsErr()) { \
            co_return std::move(tvremote_try_result_).Propagate(); \
        } \
    } while(0)
}

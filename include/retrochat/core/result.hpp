#pragma once
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace retrochat::vault {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/** Carrier used by RETROCHAT_TRY so the error converts into any Result<U, E>. */
template<typename E>
struct PropagatedError {
    E error;
};

/**
 * @brief Value-or-failure return type used across the vault.
 *
 * Unwrap on the wrong alternative throws std::logic_error; callers are
 * expected to test IsOk()/IsErr() first or propagate with RETROCHAT_TRY.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(PropagatedError<E> propagated)
        : storage_(std::in_place_index<kErrIndex>, std::move(propagated.error)) {}

    static Result Ok(T value) {
        return Result(std::in_place_index<kOkIndex>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<kErrIndex>, std::move(error));
    }

    static Result FromOptional(std::optional<T> value, E error_if_empty) {
        if (value.has_value()) {
            return Ok(std::move(*value));
        }
        return Err(std::move(error_if_empty));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kOkIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErrIndex; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOkIndex>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErrIndex>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<kOkIndex>(std::move(storage_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kOkIndex>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<kErrIndex>(std::move(storage_))));
    }

    /** Chains a fallible step; `func` must return a Result with the same error type. */
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind requires a step with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_)));
    }

private:
    static constexpr std::size_t kOkIndex = 0;
    static constexpr std::size_t kErrIndex = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Result::Unwrap called on a failure");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("Result::UnwrapErr called on a value");
        }
    }

    std::variant<T, E> storage_;
};

}

/**
 * Evaluates `result_expr`; on failure returns its error from the enclosing
 * function. Works on temporaries and on named results.
 */
#define RETROCHAT_TRY(result_expr) \
    do { \
        auto&& retrochat_try_result_ = (result_expr); \
        if (retrochat_try_result_.IsErr()) { \
            using RetrochatTryError_ = typename std::decay_t<decltype(retrochat_try_result_)>::error_type; \
            return ::retrochat::vault::PropagatedError<RetrochatTryError_>{ \
                std::move(retrochat_try_result_).UnwrapErr()}; \
        } \
    } while (false)

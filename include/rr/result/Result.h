//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Result.h
// Purpose: Two-variant success/failure value used by the exception-free execution mode
//==========================================================================================================
#pragma once

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace rr {

// Thrown when a Result is read on the side it does not hold.
class BadResultAccess : public std::logic_error {
public:
    explicit BadResultAccess(const std::string& what) : std::logic_error(what) {}
};

//==========================================================================================================
// Result<T, E>
// Purpose: Holds exactly one of a success value T or a failure value E. Accessing the absent side throws
//          BadResultAccess. Transformations return new Result instances and never throw on their own.
//==========================================================================================================
template <typename T, typename E>
class Result {
public:
    static Result Success(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Failure(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool IsSuccess() const noexcept { return storage.index() == 0; }
    bool IsFailure() const noexcept { return storage.index() == 1; }

    const T& Value() const {
        if (!IsSuccess()) {
            throw BadResultAccess("Cannot get value from a failure result");
        }
        return std::get<0>(storage);
    }

    const E& Error() const {
        if (!IsFailure()) {
            throw BadResultAccess("Cannot get error from a success result");
        }
        return std::get<1>(storage);
    }

    T ValueOr(T fallback) const {
        return IsSuccess() ? std::get<0>(storage) : std::move(fallback);
    }

    template <typename F>
    T ValueOrElse(F&& fallback) const {
        return IsSuccess() ? std::get<0>(storage) : std::invoke(std::forward<F>(fallback), std::get<1>(storage));
    }

    //==========================================================================================================
    // ValueOrThrow
    // Purpose: Returns the value, or throws the exception produced by toException(error).
    //==========================================================================================================
    template <typename F>
    const T& ValueOrThrow(F&& toException) const {
        if (IsFailure()) {
            throw std::invoke(std::forward<F>(toException), std::get<1>(storage));
        }
        return std::get<0>(storage);
    }

    template <typename F>
    auto Map(F&& fn) const -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (IsSuccess()) {
            return Result<U, E>::Success(std::invoke(std::forward<F>(fn), std::get<0>(storage)));
        }
        return Result<U, E>::Failure(std::get<1>(storage));
    }

    template <typename F>
    auto MapError(F&& fn) const -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (IsFailure()) {
            return Result<T, G>::Failure(std::invoke(std::forward<F>(fn), std::get<1>(storage)));
        }
        return Result<T, G>::Success(std::get<0>(storage));
    }

    template <typename F>
    const Result& IfSuccess(F&& fn) const {
        if (IsSuccess()) {
            std::invoke(std::forward<F>(fn), std::get<0>(storage));
        }
        return *this;
    }

    template <typename F>
    const Result& IfFailure(F&& fn) const {
        if (IsFailure()) {
            std::invoke(std::forward<F>(fn), std::get<1>(storage));
        }
        return *this;
    }

    template <typename FS, typename FF>
    auto Match(FS&& onSuccess, FF&& onFailure) const {
        if (IsSuccess()) {
            return std::invoke(std::forward<FS>(onSuccess), std::get<0>(storage));
        }
        return std::invoke(std::forward<FF>(onFailure), std::get<1>(storage));
    }

    std::optional<T> ToOptional() const {
        if (IsSuccess()) {
            return std::get<0>(storage);
        }
        return std::nullopt;
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : storage(tag, std::forward<V>(v)) {}

    std::variant<T, E> storage;
};

} // namespace rr

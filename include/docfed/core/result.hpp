#pragma once

#include <docfed/core/error.hpp>

#include <cassert>
#include <optional>
#include <utility>
#include <variant>

namespace docfed {

// ---------------------------------------------------------------------------
// Result<T, E>: either a T or an E. Failures are returned, never thrown.
//
//   auto parsed = ParseQuery(text);
//   if (parsed.IsErr()) return Result<Rows, Error>::Err(std::move(parsed).Error());
//   const ParsedQuery& query = parsed.Value();
//
// Accessing the wrong side is a programming error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(Storage(std::in_place_index<0>, std::move(value))); }
    static Result Err(E error) { return Result(Storage(std::in_place_index<1>, std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Result holds an error");
        return *std::get_if<0>(&storage_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk() && "Result holds an error");
        return std::move(*std::get_if<0>(&storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Result holds a value");
        return *std::get_if<1>(&storage_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Result holds a value");
        return std::move(*std::get_if<1>(&storage_));
    }

private:
    using Storage = std::variant<T, E>;

    explicit Result(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

// Success carries nothing; only the error side has storage.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Result holds no error");
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr() && "Result holds no error");
        return std::move(*error_);
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace docfed

#pragma once

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace util {

// A minimal value-or-error type, modelled on std::expected (C++23).
// Only the parts of the interface that are used in rex are provided.

template <typename E> class unexpected {
  public:
    unexpected() = delete;
    constexpr explicit unexpected(const E& e) : error_(e) {
    }
    constexpr explicit unexpected(E&& e) : error_(std::move(e)) {
    }

    constexpr const E& error() const& noexcept {
        return error_;
    }
    constexpr E& error() & noexcept {
        return error_;
    }
    constexpr E&& error() && noexcept {
        return std::move(error_);
    }

  private:
    E error_;
};

template <typename E> unexpected(E) -> unexpected<E>;

template <typename T> struct is_unexpected : std::false_type {};
template <typename E> struct is_unexpected<unexpected<E>> : std::true_type {};

class bad_expected_access : public std::exception {
  public:
    const char* what() const noexcept override {
        return "access to the value of an expected that holds an error";
    }
};

template <typename T, typename E> class expected {
  public:
    using value_type = T;
    using error_type = E;

    constexpr expected()
        requires std::is_default_constructible_v<T>
        : data_(std::in_place_index<0>) {
    }

    template <typename U = T>
        requires(std::is_constructible_v<T, U &&> &&
                 !std::is_same_v<std::remove_cvref_t<U>, expected> &&
                 !is_unexpected<std::remove_cvref_t<U>>::value)
    constexpr expected(U&& v) : data_(std::in_place_index<0>, std::forward<U>(v)) {
    }

    template <typename G>
        requires std::is_constructible_v<E, const G&>
    constexpr expected(const unexpected<G>& u)
        : data_(std::in_place_index<1>, E(u.error())) {
    }

    template <typename G>
        requires std::is_constructible_v<E, G &&>
    constexpr expected(unexpected<G>&& u)
        : data_(std::in_place_index<1>, E(std::move(u).error())) {
    }

    constexpr bool has_value() const noexcept {
        return data_.index() == 0;
    }
    constexpr explicit operator bool() const noexcept {
        return has_value();
    }

    constexpr T& value() & {
        check();
        return std::get<0>(data_);
    }
    constexpr const T& value() const& {
        check();
        return std::get<0>(data_);
    }
    constexpr T&& value() && {
        check();
        return std::get<0>(std::move(data_));
    }

    constexpr T& operator*() & {
        return std::get<0>(data_);
    }
    constexpr const T& operator*() const& {
        return std::get<0>(data_);
    }
    constexpr T&& operator*() && {
        return std::get<0>(std::move(data_));
    }
    constexpr T* operator->() {
        return &std::get<0>(data_);
    }
    constexpr const T* operator->() const {
        return &std::get<0>(data_);
    }

    constexpr E& error() & {
        return std::get<1>(data_).error();
    }
    constexpr const E& error() const& {
        return std::get<1>(data_).error();
    }
    constexpr E&& error() && {
        return std::get<1>(std::move(data_)).error();
    }

    template <typename U> constexpr T value_or(U&& fallback) const& {
        return has_value() ? std::get<0>(data_)
                           : static_cast<T>(std::forward<U>(fallback));
    }

  private:
    std::variant<T, unexpected<E>> data_;

    constexpr void check() const {
        if (!has_value()) {
            throw bad_expected_access{};
        }
    }
};

template <typename E> class expected<void, E> {
  public:
    using value_type = void;
    using error_type = E;

    constexpr expected() = default;

    template <typename G>
        requires std::is_constructible_v<E, const G&>
    constexpr expected(const unexpected<G>& u) : error_(unexpected<E>(E(u.error()))) {
    }

    template <typename G>
        requires std::is_constructible_v<E, G &&>
    constexpr expected(unexpected<G>&& u)
        : error_(unexpected<E>(E(std::move(u).error()))) {
    }

    constexpr bool has_value() const noexcept {
        return !error_.has_value();
    }
    constexpr explicit operator bool() const noexcept {
        return has_value();
    }

    constexpr void value() const {
        if (!has_value()) {
            throw bad_expected_access{};
        }
    }
    constexpr void operator*() const noexcept {
    }

    constexpr E& error() & {
        return error_->error();
    }
    constexpr const E& error() const& {
        return error_->error();
    }
    constexpr E&& error() && {
        return std::move(*error_).error();
    }

  private:
    std::optional<unexpected<E>> error_;
};

} // namespace util

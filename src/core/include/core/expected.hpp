#pragma once

// Value-or-error return for calls whose failure the caller must branch on, such as
// loading the source audio file. Covers only what the loader needs from std::expected.

#include <type_traits>
#include <utility>
#include <variant>

namespace wv {

template <class E>
class unexpected {
public:
    explicit unexpected(E e) : error_(std::move(e)) {}
    const E& error() const & noexcept { return error_; }
    E&& error() && noexcept { return std::move(error_); }
private:
    E error_;
};

template <class E>
unexpected<std::decay_t<E>> make_unexpected(E&& e) { return unexpected<std::decay_t<E>>(std::forward<E>(e)); }

template <class T, class E>
class expected {
public:
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>, "expected<T> needs an object type");

    expected(const T& v) : state_(std::in_place_index<0>, v) {}
    expected(T&& v) : state_(std::in_place_index<0>, std::move(v)) {}
    expected(unexpected<E> ue) : state_(std::in_place_index<1>, std::move(ue).error()) {}

    bool has_value() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    // Accessing the wrong alternative throws std::bad_variant_access.
    const T& value() const & { return std::get<0>(state_); }
    T& value() & { return std::get<0>(state_); }
    T&& value() && { return std::get<0>(std::move(state_)); }
    const E& error() const & { return std::get<1>(state_); }

    const T& operator*() const & { return value(); }
    T& operator*() & { return value(); }
    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    std::variant<T, E> state_;
};

} // namespace wv

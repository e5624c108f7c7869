#pragma once

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace AudioGate {

template<typename E>
class Unexpected {
public:
    constexpr explicit Unexpected(const E& error) : error_(error) {}
    constexpr explicit Unexpected(E&& error) : error_(std::move(error)) {}

    constexpr const E& error() const& { return error_; }
    constexpr E& error() & { return error_; }
    constexpr E&& error() && { return std::move(error_); }

private:
    E error_;
};

template<typename E>
constexpr Unexpected<std::decay_t<E>> makeUnexpected(E&& error) {
    return Unexpected<std::decay_t<E>>(std::forward<E>(error));
}

class BadExpectedAccess : public std::logic_error {
public:
    explicit BadExpectedAccess(const char* what) : std::logic_error(what) {}
};

// Value-or-error result in the spirit of std::expected (C++23).
// Errors are always built through makeUnexpected() so that T and E may be
// the same type without ambiguity.
template<typename T, typename E>
class Expected {
    static_assert(!std::is_reference_v<T>, "Expected<T&, E> is not supported");

public:
    using value_type = T;
    using error_type = E;

    template<typename U = T, typename = std::enable_if_t<std::is_default_constructible_v<U>>>
    Expected() : storage_(std::in_place_index<0>) {}

    template<typename U, typename = std::enable_if_t<
        !std::is_same_v<std::decay_t<U>, Expected> &&
        !std::is_same_v<std::decay_t<U>, Unexpected<E>> &&
        std::is_constructible_v<T, U&&>>>
    Expected(U&& value) : storage_(std::in_place_index<0>, std::forward<U>(value)) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : storage_(std::in_place_index<1>, unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : storage_(std::in_place_index<1>, std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return storage_.index() == 0; }
    bool hasError() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    const T& value() const& {
        if (!hasValue()) {
            throw BadExpectedAccess("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T& value() & {
        if (!hasValue()) {
            throw BadExpectedAccess("Expected contains error, not value");
        }
        return std::get<0>(storage_);
    }

    T&& value() && {
        if (!hasValue()) {
            throw BadExpectedAccess("Expected contains error, not value");
        }
        return std::get<0>(std::move(storage_));
    }

    const E& error() const& {
        if (!hasError()) {
            throw BadExpectedAccess("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    E& error() & {
        if (!hasError()) {
            throw BadExpectedAccess("Expected contains value, not error");
        }
        return std::get<1>(storage_);
    }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }
    const T& operator*() const& { return value(); }
    T& operator*() & { return value(); }

    template<typename U>
    T valueOr(U&& fallback) const& {
        return hasValue() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
    }

    template<typename F>
    auto andThen(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (hasValue()) {
            return std::forward<F>(f)(std::get<0>(storage_));
        }
        return makeUnexpected(std::get<1>(storage_));
    }

    template<typename F>
    auto transform(F&& f) const& -> Expected<std::invoke_result_t<F, const T&>, E> {
        if (hasValue()) {
            return std::forward<F>(f)(std::get<0>(storage_));
        }
        return makeUnexpected(std::get<1>(storage_));
    }

    template<typename F>
    auto transformError(F&& f) const& -> Expected<T, std::invoke_result_t<F, const E&>> {
        if (hasError()) {
            return makeUnexpected(std::forward<F>(f)(std::get<1>(storage_)));
        }
        return std::get<0>(storage_);
    }

private:
    std::variant<T, E> storage_;
};

template<typename E>
class Expected<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Expected() = default;

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, const G&>>>
    Expected(const Unexpected<G>& unexpected) : failed_(true), error_(unexpected.error()) {}

    template<typename G, typename = std::enable_if_t<std::is_constructible_v<E, G&&>>>
    Expected(Unexpected<G>&& unexpected) : failed_(true), error_(std::move(unexpected).error()) {}

    bool hasValue() const noexcept { return !failed_; }
    bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return hasValue(); }

    void value() const {
        if (failed_) {
            throw BadExpectedAccess("Expected contains error, not value");
        }
    }

    const E& error() const& {
        if (!failed_) {
            throw BadExpectedAccess("Expected contains value, not error");
        }
        return error_;
    }

private:
    bool failed_ = false;
    E error_{};
};

} // namespace AudioGate

#ifndef STEPGRAPH_VALUE_OR_ERROR_HPP
#define STEPGRAPH_VALUE_OR_ERROR_HPP

#include <stepgraph/node_value.hpp>
#include <cstddef>
#include <exception>
#include <optional>
#include <memory>
#include <tuple>
#include <utility>

namespace stepgraph {

/**
 * A failure claimed as one of a fixed list of exception kinds. Holds the failure exactly
 * as it was raised; slot accessors view the raised object through the claimed kind, so a
 * handler can still test the concrete type.
 */
template<typename... Errors>
class ClaimedError {
public:
    using Kinds = std::tuple<Errors...>;

    template<std::size_t I>
    using Kind = std::tuple_element_t<I, Kinds>;

    // `object` points into the exception object owned by `error`
    ClaimedError(std::exception_ptr error, std::size_t index, const void* object)
        : error_(std::move(error)), index_(index), object_(object) {}

    std::size_t index() const { return index_; }

    // The raised object seen as kind I, or nullptr if the failure was claimed as another kind
    template<std::size_t I>
    const Kind<I>* get() const {
        return index_ == I ? static_cast<const Kind<I>*>(object_) : nullptr;
    }

    const std::exception_ptr& exception() const { return error_; }

    [[noreturn]] void rethrow() const { std::rethrow_exception(error_); }

private:
    std::exception_ptr error_;
    std::size_t index_;
    const void* object_;
};

/**
 * Tests a failure against a fixed list of exception kinds, in declared order. The first
 * kind the failure is an instance of wins (derived exceptions match their bases).
 */
template<typename... Errors>
class ErrorMatcher {
public:
    static constexpr std::size_t ARITY = sizeof...(Errors);

    static_assert(ARITY >= 1 && ARITY <= 3, "A failure sink declares one to three exception kinds");

    using Claimed = ClaimedError<Errors...>;

    static std::optional<Claimed> match(const std::exception_ptr& error) {
        std::optional<Claimed> claimed;
        if (!error) {
            return claimed;
        }
        try {
            claim<ARITY - 1>(error, claimed);
        } catch (...) {
            // None of the kinds matched; the caller still owns the original failure
        }
        return claimed;
    }

private:
    // Level 0 holds the innermost handler, so kinds are tested in declared order
    template<std::size_t I>
    static void claim(const std::exception_ptr& error, std::optional<Claimed>& claimed) {
        using Error = typename Claimed::template Kind<I>;
        try {
            if constexpr (I == 0) {
                std::rethrow_exception(error);
            } else {
                claim<I - 1>(error, claimed);
            }
        } catch (const Error& e) {
            claimed.emplace(error, I, static_cast<const void*>(std::addressof(e)));
        }
    }
};

/**
 * Outcome delivered to a typed lookup sink: either the dependency's value, or a failure
 * claimed as one of the declared kinds. Exactly one of the two is present.
 */
template<typename... Errors>
class ValueOrError {
public:
    using Matcher = ErrorMatcher<Errors...>;
    using Claimed = typename Matcher::Claimed;

    explicit ValueOrError(NodeValuePtr value) : value_(std::move(value)) {}

    explicit ValueOrError(Claimed claimed) : claimed_(std::move(claimed)) {}

    bool has_value() const { return !claimed_.has_value(); }

    // Null when a failure was claimed
    const NodeValuePtr& value() const { return value_; }

    // Slot I of the declared kinds, or nullptr if that slot is empty
    template<std::size_t I>
    const typename Claimed::template Kind<I>* error() const {
        return claimed_ ? claimed_->template get<I>() : nullptr;
    }

    std::optional<std::size_t> error_index() const {
        if (!claimed_) return std::nullopt;
        return claimed_->index();
    }

    // The failure exactly as it was raised; null when a value was delivered
    std::exception_ptr original_error() const {
        return claimed_ ? claimed_->exception() : std::exception_ptr();
    }

private:
    NodeValuePtr value_;
    std::optional<Claimed> claimed_;
};

} // namespace stepgraph

#endif // STEPGRAPH_VALUE_OR_ERROR_HPP

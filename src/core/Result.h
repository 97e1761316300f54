#ifndef GARDEN_SIM_RESULT_H
#define GARDEN_SIM_RESULT_H

#include <expected>
#include <utility>

/**
 * Result<T, E>: success value or typed failure, backed by C++23 std::expected.
 *
 * Commands in the simulation report recoverable failures through this type
 * instead of throwing. Named factories keep call sites readable:
 *
 *   return Result<double, TransactionError>::error(TransactionError{...});
 *   return Result<double, TransactionError>::okay(earned);
 */
template <typename successT, typename failureT>
class Result {
private:
    std::expected<successT, failureT> inner_;

public:
    Result(successT value) : inner_(std::move(value)) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}

    static Result<successT, failureT> okay() { return Result<successT, failureT>(successT()); }

    static Result<successT, failureT> okay(successT value)
    {
        return Result<successT, failureT>(std::move(value));
    }

    static Result<successT, failureT> error(failureT err)
    {
        return Result<successT, failureT>(std::unexpected(std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    explicit operator bool() const { return isValue(); }

    // Throws std::bad_expected_access when called on an error.
    const successT& value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    const failureT& errorValue() const& { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }
};

#endif // GARDEN_SIM_RESULT_H

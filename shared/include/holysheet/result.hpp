/**
 * HolySheet - Value-or-failure result used between dispatch stages.
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "holysheet/error_codes.hpp"

namespace holysheet
{

    struct Failure
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
        std::string trace;
    };

    // Builds the diagnostic trace reported to clients alongside the message.
    std::string make_trace(ErrorCode code, std::string_view stage, std::string_view cause);

    Failure make_failure(ErrorCode code, std::string message, std::string_view stage);

    template <typename T>
    class Result
    {
    public:
        Result(T value) : data_(std::move(value)) {}
        Result(Failure failure) : data_(std::move(failure)) {}

        bool has_value() const noexcept
        {
            return std::holds_alternative<T>(data_);
        }

        explicit operator bool() const noexcept
        {
            return has_value();
        }

        const T &value() const &
        {
            if (!has_value())
            {
                throw std::logic_error("Result holds a failure: " + std::get<Failure>(data_).message);
            }
            return std::get<T>(data_);
        }

        T &&value() &&
        {
            if (!has_value())
            {
                throw std::logic_error("Result holds a failure: " + std::get<Failure>(data_).message);
            }
            return std::get<T>(std::move(data_));
        }

        const Failure &failure() const
        {
            if (has_value())
            {
                throw std::logic_error("Result holds a value");
            }
            return std::get<Failure>(data_);
        }

    private:
        std::variant<T, Failure> data_;
    };

} // namespace holysheet

#include "holysheet/result.hpp"

namespace holysheet
{

    std::string make_trace(ErrorCode code, std::string_view stage, std::string_view cause)
    {
        std::string trace = "holysheet::";
        trace += to_string(code);
        trace += "\n    at ";
        trace += stage;
        if (!cause.empty())
        {
            trace += "\n    caused by: ";
            trace += cause;
        }
        return trace;
    }

    Failure make_failure(ErrorCode code, std::string message, std::string_view stage)
    {
        auto trace = make_trace(code, stage, message);
        return Failure{code, std::move(message), std::move(trace)};
    }

} // namespace holysheet

/**
 * HolySheet - Newline-delimited JSON framing helpers.
 */
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace holysheet::protocol
{

    // Compact single-line JSON text followed by '\n'.
    std::string encode_line(const nlohmann::json &message);

    // Removes the first complete line from `buffer` and returns it without its terminator
    // (a trailing '\r' is dropped as well). Returns nullopt while no '\n' is buffered.
    std::optional<std::string> try_extract_line(std::string &buffer);

} // namespace holysheet::protocol

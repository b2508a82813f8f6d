#include "holysheet/framing.hpp"

namespace holysheet::protocol
{

    std::string encode_line(const nlohmann::json &message)
    {
        auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        text.push_back('\n');
        return text;
    }

    std::optional<std::string> try_extract_line(std::string &buffer)
    {
        const auto newline = buffer.find('\n');
        if (newline == std::string::npos)
        {
            return std::nullopt;
        }
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        return line;
    }

} // namespace holysheet::protocol

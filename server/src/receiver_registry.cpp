#include "holysheet/server/receiver_registry.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace holysheet::server
{

    void ReceiverRegistry::add(LineReceiver receiver)
    {
        if (!receiver)
        {
            throw std::invalid_argument("Line receiver must be callable");
        }
        auto handle = std::make_shared<const LineReceiver>(std::move(receiver));
        std::lock_guard<std::mutex> lock(mutex_);
        receivers_.push_back(std::move(handle));
    }

    void ReceiverRegistry::notify(Session &session, const std::string &line) const
    {
        std::vector<std::shared_ptr<const LineReceiver>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = receivers_;
        }
        for (const auto &receiver : snapshot)
        {
            try
            {
                (*receiver)(session, line);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Line receiver failed: {}", ex.what());
            }
        }
    }

    std::size_t ReceiverRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return receivers_.size();
    }

} // namespace holysheet::server

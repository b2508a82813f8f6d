#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace holysheet::server
{

    class Session;

    // Observer of raw inbound lines. Runs on the read path of the connection, so it must return quickly.
    using LineReceiver = std::function<void(Session &session, const std::string &line)>;

    class ReceiverRegistry
    {
    public:
        void add(LineReceiver receiver);

        // Invokes every receiver in registration order. A throwing receiver is logged and skipped.
        void notify(Session &session, const std::string &line) const;

        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::vector<std::shared_ptr<const LineReceiver>> receivers_;
    };

} // namespace holysheet::server

#pragma once
/**
 * @file event_sink.hpp
 * @brief Subscriber registry notified whenever the VRP store version changes.
 * @details Callbacks run on the notifying thread (the coordinator) with no lock
 *          held, so they may subscribe or unsubscribe. A callback unsubscribed
 *          during a notification is not called afterwards.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace rpkiv::pool {

using SubscriptionId = std::uint64_t;

class EventSink {
public:
    /// Receives the new store version.
    using Callback = std::function<void(std::uint64_t version)>;

    /// Register @p cb. Returns a non-zero id.
    SubscriptionId subscribe(Callback cb);

    /// Remove a subscription. Returns false if @p id is unknown.
    bool unsubscribe(SubscriptionId id);

    /// Call every subscriber with @p version. A throwing callback is logged and skipped.
    void notify(std::uint64_t version);

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        SubscriptionId    id{0};
        Callback          fn;
        std::atomic<bool> active{true};
    };

    mutable std::mutex mu_;
    std::vector<std::shared_ptr<Entry>> subs_;
    SubscriptionId next_id_{1};
};

} // namespace rpkiv::pool

/**
 * @file event_sink.cpp
 * @brief Implementation of EventSink.
 */
#include "rpkiv/pool/event_sink.hpp"

#include <algorithm>
#include <exception>

#include "rpkiv/obs/observability.hpp"

namespace rpkiv::pool {

SubscriptionId EventSink::subscribe(Callback cb) {
    auto e = std::make_shared<Entry>();
    e->fn = std::move(cb);
    std::lock_guard<std::mutex> lk(mu_);
    e->id = next_id_++;
    subs_.push_back(e);
    return e->id;
}

bool EventSink::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(subs_.begin(), subs_.end(), [id](const auto& e) { return e->id == id; });
    if (it == subs_.end()) return false;
    (*it)->active.store(false, std::memory_order_release);
    subs_.erase(it);
    return true;
}

void EventSink::notify(std::uint64_t version) {
    std::vector<std::shared_ptr<Entry>> snap;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snap = subs_;
    }
    for (const auto& e : snap) {
        if (!e->active.load(std::memory_order_acquire)) continue;
        try {
            e->fn(version);
        } catch (const std::exception& ex) {
            obs::logger()->error("subscriber {} threw on version {}: {}", e->id, version, ex.what());
        } catch (...) {
            obs::logger()->error("subscriber {} threw a non-standard exception on version {}", e->id, version);
        }
    }
}

std::size_t EventSink::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return subs_.size();
}

} // namespace rpkiv::pool

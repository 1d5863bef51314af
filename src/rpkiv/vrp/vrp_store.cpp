// VrpStore: RCU implementation notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writer: build the next Snapshot completely, atomic_store (RELEASE).
// A reader holding an old Snapshot keeps its table alive; nothing it can reach
// is ever written again because tables and their trie nodes are immutable.

#include "rpkiv/vrp/vrp_store.hpp"

#include <memory>   // atomic_load/atomic_store for shared_ptr

namespace rpkiv::vrp {

std::shared_ptr<const Snapshot> VrpStore::current() const noexcept {
    // RCU read: acquire pairs with the writer's release so the whole Snapshot
    // (and the table it points to) is visible.
    return std::atomic_load_explicit(&snap_, std::memory_order_acquire);
}

std::uint64_t VrpStore::install(std::shared_ptr<Snapshot> next) {
    const auto v = version_.load(std::memory_order_relaxed) + 1;
    next->version = v;
    std::shared_ptr<const Snapshot> cnext = std::move(next);
    std::atomic_store_explicit(&snap_, std::move(cnext), std::memory_order_release);
    version_.store(v, std::memory_order_release);
    return v;
}

std::uint64_t VrpStore::publish(std::shared_ptr<const VrpTable> table,
                                std::chrono::steady_clock::time_point synced_at,
                                std::size_t source) {
    if (!table) return withdraw();
    auto next = std::make_shared<Snapshot>();
    next->table = std::move(table);
    next->synced_at = synced_at;
    next->source = source;
    publishes_.fetch_add(1, std::memory_order_relaxed);
    return install(std::move(next));
}

std::uint64_t VrpStore::withdraw() {
    withdrawals_.fetch_add(1, std::memory_order_relaxed);
    return install(std::make_shared<Snapshot>());
}

VrpStore::Stats VrpStore::stats() const noexcept {
    return Stats{publishes_.load(std::memory_order_relaxed), withdrawals_.load(std::memory_order_relaxed)};
}

} // namespace rpkiv::vrp

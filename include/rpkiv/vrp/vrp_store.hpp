#pragma once
// rpkiv: VrpStore
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Readers take the current Snapshot (shared_ptr copy) with ACQUIRE semantics.
//   • The single writer (the coordinator) builds a complete Snapshot off to the side
//     and swaps it in with RELEASE semantics.
//   • Readers never block the writer; the writer never blocks readers.
//   • Old snapshots are reclaimed by shared_ptr refcounts once the last reader drops them.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include "rpkiv/vrp/vrp_table.hpp"

namespace rpkiv::vrp {

/**
 * @struct Snapshot
 * @brief What readers see: a table plus the store version that published it.
 * @note `table` is null when validation data has been withdrawn.
 */
struct Snapshot {
    std::uint64_t version{0};
    std::shared_ptr<const VrpTable> table;
    std::chrono::steady_clock::time_point synced_at{};  ///< Last End of Data behind `table`
    std::size_t source{0};                               ///< Index of the session that produced it
};

/// Maintains the externally visible VRP snapshot.
class VrpStore final {
public:
    /// Consistent view; never null (an unpublished store yields version 0, no table).
    std::shared_ptr<const Snapshot> current() const noexcept;

    /// Install @p table as current. Returns the new version.
    std::uint64_t publish(std::shared_ptr<const VrpTable> table,
                          std::chrono::steady_clock::time_point synced_at,
                          std::size_t source = 0);

    /// Publish "no data". Returns the new version.
    std::uint64_t withdraw();

    [[nodiscard]] std::uint64_t version() const noexcept { return version_.load(std::memory_order_acquire); }

    /// Stats counters (cumulative since start).
    struct Stats {
        std::uint64_t publishes{0}, withdrawals{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    std::uint64_t install(std::shared_ptr<Snapshot> next);

    std::shared_ptr<const Snapshot> snap_{std::make_shared<const Snapshot>()};
    std::atomic<std::uint64_t> version_{0};
    std::atomic<std::uint64_t> publishes_{0}, withdrawals_{0};
};

} // namespace rpkiv::vrp

#pragma once
/**
 * @file vrp_table.hpp
 * @brief Immutable, versioned VRP snapshot and its copy-on-write editor.
 * @details A VrpTable never changes after construction. A new table is made by
 *          opening an Editor on the previous one (or on nothing, for a full
 *          transfer), applying announcements and withdrawals, and committing.
 *          The editor shares every untouched trie node with its base.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <set>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/vrp/prefix_trie.hpp"
#include "rpkiv/vrp/vrp.hpp"

namespace rpkiv::vrp {

/// Result codes for editor mutations.
enum class EditErr {
    Ok,         ///< Mutation applied.
    Duplicate,  ///< Announce of a VRP already present.
    Unknown,    ///< Withdraw of a VRP not present.
    Invalid     ///< max_length outside [prefix length, width].
};

class VrpTable final {
public:
    class Editor;

    /// Shared empty table (serial 0, session 0).
    static std::shared_ptr<const VrpTable> empty();

    [[nodiscard]] std::uint16_t session_id() const noexcept { return session_id_; }
    [[nodiscard]] std::uint32_t serial() const noexcept { return serial_; }

    [[nodiscard]] std::size_t size() const noexcept { return v4_.size() + v6_.size(); }
    [[nodiscard]] std::size_t size(net::Family f) const noexcept { return trie(f).size(); }

    [[nodiscard]] bool contains(const Vrp& v) const noexcept;

    /// Every VRP whose prefix covers @p query, shortest prefix first.
    [[nodiscard]] VrpList lookup(const net::IpPrefix& query) const;

    /// Allocation-free covering walk: fn(const Vrp&).
    template <class Fn>
    void for_each_covering(const net::IpPrefix& query, Fn&& fn) const {
        trie(query.family).visit_covering(query, [&](std::uint8_t len, const PrefixTrie::Entry& e) {
            fn(Vrp{query.truncated(len), e.max_length, e.asn});
        });
    }

    /// Every VRP, sorted (IPv4 before IPv6, then prefix, max-length, AS).
    [[nodiscard]] VrpList vrps() const;

    /// Distinct origin ASes of a family, AS0 excluded.
    [[nodiscard]] std::set<std::uint32_t> origins(net::Family f) const;

    /// VRPs of a family authorising @p asn.
    [[nodiscard]] VrpList by_origin(std::uint32_t asn, net::Family f) const;

    /// Aggregated address space covered by the VRPs of a family.
    [[nodiscard]] std::vector<net::IpPrefix> covered(net::Family f) const { return trie(f).aggregate(); }

private:
    VrpTable() = default;

    const PrefixTrie& trie(net::Family f) const noexcept { return f == net::Family::V4 ? v4_ : v6_; }

    PrefixTrie    v4_{net::Family::V4};
    PrefixTrie    v6_{net::Family::V6};
    std::uint16_t session_id_{0};
    std::uint32_t serial_{0};
};

/**
 * @class VrpTable::Editor
 * @brief Copy-on-write overlay over a base table. Single-threaded; not reusable after commit.
 */
class VrpTable::Editor final {
public:
    /// Open over @p base; nullptr starts from an empty table.
    explicit Editor(std::shared_ptr<const VrpTable> base = nullptr);

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;
    Editor(Editor&&) noexcept = default;
    Editor& operator=(Editor&&) noexcept = default;

    EditErr announce(const Vrp& v);
    EditErr withdraw(const Vrp& v);

    [[nodiscard]] bool contains(const Vrp& v) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept { return v4_.size() + v6_.size(); }
    [[nodiscard]] std::size_t announced() const noexcept { return announced_; }
    [[nodiscard]] std::size_t withdrawn() const noexcept { return withdrawn_; }

    /// Freeze the overlay into a new immutable table.
    [[nodiscard]] std::shared_ptr<const VrpTable> commit(std::uint16_t session_id, std::uint32_t serial) &&;

private:
    PrefixTrie& trie(net::Family f) noexcept { return f == net::Family::V4 ? v4_ : v6_; }

    std::uint64_t edit_;
    PrefixTrie    v4_{net::Family::V4};
    PrefixTrie    v6_{net::Family::V6};
    std::size_t   announced_{0};
    std::size_t   withdrawn_{0};
};

} // namespace rpkiv::vrp

#pragma once
// rpkiv: PrefixTrie
// Persistent binary trie keyed by prefix bits, one per address family.
//   • A node at depth d stands for the d-bit prefix on the path to it and holds
//     the (max_length, asn) entries of every VRP with exactly that prefix.
//   • Nodes are shared between trie versions. Each mutation carries an edit
//     token: nodes stamped with that token belong to the caller and are changed
//     in place, any other node is cloned first (path copying). Published tries
//     are therefore never written to.
//   • Longest-prefix-match walks the query bits once and reports every entry met
//     on the way, i.e. every VRP whose prefix covers the query.

#include <atomic>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"

namespace rpkiv::vrp {

class PrefixTrie final {
public:
    /// Payload stored per prefix.
    struct Entry {
        std::uint8_t  max_length{0};
        std::uint32_t asn{0};
        bool operator==(const Entry&) const = default;
        auto operator<=>(const Entry&) const = default;
    };

    struct Node {
        std::shared_ptr<Node> child[2];
        std::vector<Entry>    entries;   ///< Sorted, unique
        std::uint64_t         edit{0};   ///< Token of the editor that owns this node
    };

    explicit PrefixTrie(net::Family family = net::Family::V4) noexcept : family_(family) {}

    /// Fresh token for a new editing session. Never returns 0.
    static std::uint64_t next_edit() noexcept;

    [[nodiscard]] net::Family family() const noexcept { return family_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] bool contains(const net::IpPrefix& p, const Entry& e) const noexcept;

    /// Insert; returns false if the entry is already present.
    bool insert(std::uint64_t edit, const net::IpPrefix& p, const Entry& e);

    /// Erase; returns false if the entry is absent. Empty branches are pruned.
    bool erase(std::uint64_t edit, const net::IpPrefix& p, const Entry& e);

    /**
     * @brief Visit every entry whose prefix covers @p query (supernet-or-equal).
     * @param fn Called as fn(uint8_t prefix_length, const Entry&), shortest prefix first.
     */
    template <class Fn>
    void visit_covering(const net::IpPrefix& query, Fn&& fn) const {
        if (query.family != family_) return;
        const Node* n = root_.get();
        for (std::uint8_t depth = 0; n; ++depth) {
            for (const auto& e : n->entries) fn(depth, e);
            if (depth == query.length) break;
            n = n->child[query.bit(depth)].get();
        }
    }

    /**
     * @brief Visit every entry in prefix order.
     * @param fn Called as fn(const net::IpPrefix&, const Entry&).
     */
    template <class Fn>
    void visit(Fn&& fn) const {
        net::IpPrefix p;
        p.family = family_;
        walk(root_.get(), p, 0, fn);
    }

    /// Minimal set of prefixes covering exactly the union of all stored prefixes.
    [[nodiscard]] std::vector<net::IpPrefix> aggregate() const;

private:
    template <class Fn>
    static void walk(const Node* n, net::IpPrefix& p, std::uint8_t depth, Fn& fn) {
        if (!n) return;
        p.length = depth;
        for (const auto& e : n->entries) fn(p, e);
        for (int b = 0; b < 2; ++b) {
            if (!n->child[b]) continue;
            set_bit(p, depth, b != 0);
            walk(n->child[b].get(), p, static_cast<std::uint8_t>(depth + 1), fn);
            set_bit(p, depth, false);
        }
        p.length = depth;
    }

    static void set_bit(net::IpPrefix& p, std::uint8_t i, bool on) noexcept {
        const auto mask = static_cast<std::uint8_t>(0x80u >> (i & 7));
        if (on) p.addr[i >> 3] |= mask;
        else    p.addr[i >> 3] &= static_cast<std::uint8_t>(~mask);
    }

    /// Node owned by @p edit at @p slot, cloning or creating it as needed.
    static Node& own(std::shared_ptr<Node>& slot, std::uint64_t edit);

    static bool aggregate_into(const Node* n, net::IpPrefix& p, std::uint8_t depth,
                               std::vector<net::IpPrefix>& out);

    net::Family           family_;
    std::shared_ptr<Node> root_;
    std::size_t           size_{0};
};

} // namespace rpkiv::vrp

// PrefixTrie: path-copying implementation.
// A published trie is only ever read. Editors stamp the nodes they create with
// their token, so a second write through the same editor reuses the copy made
// by the first one and a delta of k records allocates at most k·depth nodes.

#include "rpkiv/vrp/prefix_trie.hpp"

#include <algorithm>

namespace rpkiv::vrp {

std::uint64_t PrefixTrie::next_edit() noexcept {
    static std::atomic<std::uint64_t> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

PrefixTrie::Node& PrefixTrie::own(std::shared_ptr<Node>& slot, std::uint64_t edit) {
    if (!slot) {
        slot = std::make_shared<Node>();
        slot->edit = edit;
    } else if (slot->edit != edit) {
        auto copy = std::make_shared<Node>(*slot);  // shallow: children stay shared
        copy->edit = edit;
        slot = std::move(copy);
    }
    return *slot;
}

bool PrefixTrie::contains(const net::IpPrefix& p, const Entry& e) const noexcept {
    if (p.family != family_) return false;
    const Node* n = root_.get();
    for (std::uint8_t depth = 0; n && depth < p.length; ++depth) n = n->child[p.bit(depth)].get();
    if (!n) return false;
    return std::binary_search(n->entries.begin(), n->entries.end(), e);
}

bool PrefixTrie::insert(std::uint64_t edit, const net::IpPrefix& p, const Entry& e) {
    if (p.family != family_ || contains(p, e)) return false;
    Node* n = &own(root_, edit);
    for (std::uint8_t depth = 0; depth < p.length; ++depth) n = &own(n->child[p.bit(depth)], edit);
    n->entries.insert(std::lower_bound(n->entries.begin(), n->entries.end(), e), e);
    ++size_;
    return true;
}

bool PrefixTrie::erase(std::uint64_t edit, const net::IpPrefix& p, const Entry& e) {
    if (p.family != family_ || !contains(p, e)) return false;

    // Own the whole path, remembering the slots so empty tails can be cut.
    std::vector<std::shared_ptr<Node>*> path;
    path.reserve(static_cast<std::size_t>(p.length) + 1);
    std::shared_ptr<Node>* slot = &root_;
    own(*slot, edit);
    path.push_back(slot);
    for (std::uint8_t depth = 0; depth < p.length; ++depth) {
        slot = &(*slot)->child[p.bit(depth)];
        own(*slot, edit);
        path.push_back(slot);
    }

    auto& entries = (*slot)->entries;
    entries.erase(std::lower_bound(entries.begin(), entries.end(), e));
    --size_;

    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        const Node& n = **(*it);
        if (!n.entries.empty() || n.child[0] || n.child[1]) break;
        (*it)->reset();
    }
    return true;
}

bool PrefixTrie::aggregate_into(const Node* n, net::IpPrefix& p, std::uint8_t depth,
                                std::vector<net::IpPrefix>& out) {
    if (!n) return false;
    p.length = depth;
    if (!n->entries.empty()) {
        out.push_back(p.truncated(depth));
        return true;
    }
    const std::size_t mark = out.size();
    bool full[2] = {false, false};
    for (int b = 0; b < 2; ++b) {
        set_bit(p, depth, b != 0);
        full[b] = aggregate_into(n->child[b].get(), p, static_cast<std::uint8_t>(depth + 1), out);
        set_bit(p, depth, false);
    }
    p.length = depth;
    // Two fully covered halves merge into their parent.
    if (full[0] && full[1]) {
        out.resize(mark);
        out.push_back(p.truncated(depth));
        return true;
    }
    return false;
}

std::vector<net::IpPrefix> PrefixTrie::aggregate() const {
    std::vector<net::IpPrefix> out;
    net::IpPrefix p;
    p.family = family_;
    aggregate_into(root_.get(), p, 0, out);
    return out;
}

} // namespace rpkiv::vrp

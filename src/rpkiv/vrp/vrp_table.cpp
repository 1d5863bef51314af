/**
 * @file vrp_table.cpp
 * @brief VrpTable queries and the copy-on-write Editor.
 */
#include "rpkiv/vrp/vrp_table.hpp"

#include <algorithm>

namespace rpkiv::vrp {

std::shared_ptr<const VrpTable> VrpTable::empty() {
    static const std::shared_ptr<const VrpTable> e(new VrpTable());
    return e;
}

bool VrpTable::contains(const Vrp& v) const noexcept {
    return trie(v.prefix.family).contains(v.prefix, {v.max_length, v.asn});
}

VrpList VrpTable::lookup(const net::IpPrefix& query) const {
    VrpList out;
    for_each_covering(query, [&out](const Vrp& v) { out.push_back(v); });
    return out;
}

VrpList VrpTable::vrps() const {
    VrpList out;
    out.reserve(size());
    for (const PrefixTrie* t : {&v4_, &v6_}) {
        t->visit([&out](const net::IpPrefix& p, const PrefixTrie::Entry& e) {
            out.push_back(Vrp{p, e.max_length, e.asn});
        });
    }
    // Trie order is pre-order by bits; sort to the canonical Vrp ordering.
    std::sort(out.begin(), out.end());
    return out;
}

std::set<std::uint32_t> VrpTable::origins(net::Family f) const {
    std::set<std::uint32_t> out;
    trie(f).visit([&out](const net::IpPrefix&, const PrefixTrie::Entry& e) {
        if (e.asn != 0) out.insert(e.asn);
    });
    return out;
}

VrpList VrpTable::by_origin(std::uint32_t asn, net::Family f) const {
    VrpList out;
    trie(f).visit([&](const net::IpPrefix& p, const PrefixTrie::Entry& e) {
        if (e.asn == asn) out.push_back(Vrp{p, e.max_length, e.asn});
    });
    std::sort(out.begin(), out.end());
    return out;
}

//------------------------------- Editor ---------------------------------------

VrpTable::Editor::Editor(std::shared_ptr<const VrpTable> base)
    : edit_(PrefixTrie::next_edit()) {
    if (base) {
        v4_ = base->v4_;
        v6_ = base->v6_;
    }
}

bool VrpTable::Editor::contains(const Vrp& v) const noexcept {
    const PrefixTrie& t = v.prefix.family == net::Family::V4 ? v4_ : v6_;
    return t.contains(v.prefix, {v.max_length, v.asn});
}

EditErr VrpTable::Editor::announce(const Vrp& v) {
    if (!v.well_formed()) return EditErr::Invalid;
    if (!trie(v.prefix.family).insert(edit_, v.prefix, {v.max_length, v.asn})) return EditErr::Duplicate;
    ++announced_;
    return EditErr::Ok;
}

EditErr VrpTable::Editor::withdraw(const Vrp& v) {
    if (!v.well_formed()) return EditErr::Invalid;
    if (!trie(v.prefix.family).erase(edit_, v.prefix, {v.max_length, v.asn})) return EditErr::Unknown;
    ++withdrawn_;
    return EditErr::Ok;
}

std::shared_ptr<const VrpTable>
VrpTable::Editor::commit(std::uint16_t session_id, std::uint32_t serial) && {
    std::shared_ptr<VrpTable> t(new VrpTable());
    t->v4_ = std::move(v4_);
    t->v6_ = std::move(v6_);
    t->session_id_ = session_id;
    t->serial_ = serial;
    // Retire the token: nothing may write through this editor again.
    edit_ = 0;
    return t;
}

} // namespace rpkiv::vrp

/**
 * @file validation.cpp
 * @brief RFC 6811 origin validation.
 */
#include "rpkiv/vrp/validation.hpp"

namespace rpkiv::vrp {

namespace {

// AS0 VRPs never match: no route can legitimately originate from AS0.
inline bool authorises(const Vrp& v, const net::IpPrefix& route, std::uint32_t origin_as) noexcept {
    return v.asn != 0 && v.asn == origin_as && route.length <= v.max_length;
}

} // namespace

const char* to_string(Validity v) noexcept {
    switch (v) {
        case Validity::Valid:    return "valid";
        case Validity::NotFound: return "not-found";
        case Validity::Invalid:  return "invalid";
    }
    return "unknown";
}

ValidationResult validate(const VrpTable& table, const net::IpPrefix& route, std::uint32_t origin_as) {
    ValidationResult r;
    bool covered = false;
    table.for_each_covering(route, [&](const Vrp& v) {
        covered = true;
        if (authorises(v, route, origin_as)) r.matched.push_back(v);
        else                                 r.unmatched.push_back(v);
    });
    if (!covered)               r.state = Validity::NotFound;
    else if (!r.matched.empty()) r.state = Validity::Valid;
    else                        r.state = Validity::Invalid;
    return r;
}

Validity validity(const VrpTable& table, const net::IpPrefix& route, std::uint32_t origin_as) noexcept {
    bool covered = false;
    bool matched = false;
    table.for_each_covering(route, [&](const Vrp& v) {
        covered = true;
        matched = matched || authorises(v, route, origin_as);
    });
    if (!covered) return Validity::NotFound;
    return matched ? Validity::Valid : Validity::Invalid;
}

} // namespace rpkiv::vrp

// apps/rtr_probe/src/main.cpp
// rpkiv: rtr_probe
// Purpose: Standalone helper for checking one RTR cache: full sync, counts, spot validation.
// Diagnostic utility, not the validator service.
//
// Usage:
//   ./rtr_probe <host> [port] [prefix origin_as]...
//   ./rtr_probe rtr.example.net 323 192.0.2.0/24 64500 2001:db8::/32 64501
//
// Exit status: 0 after a completed full synchronisation, 1 on bad arguments, 2 on timeout.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rpkiv/net/ip_prefix.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/rtr/session.hpp"
#include "rpkiv/rtr/tcp_transport.hpp"
#include "rpkiv/vrp/validation.hpp"

int main(int argc, char** argv) {
    using namespace rpkiv;

    if (argc < 2 || (argc > 3 && (argc - 3) % 2 != 0)) {
        std::cerr << "usage: " << argv[0] << " <host> [port] [prefix origin_as]...\n";
        return 1;
    }

    rtr::CacheConfig cfg;
    cfg.name = "probe";
    cfg.host = argv[1];
    if (argc > 2) {
        const auto port = net::parse_port(argv[2]);
        if (!port) {
            std::cerr << "rtr_probe: bad port '" << argv[2] << "' (expected 1..65535)\n";
            return 1;
        }
        cfg.port = *port;
    }

    struct Query {
        net::IpPrefix route;
        std::uint32_t asn;
    };
    std::vector<Query> queries;
    for (int i = 3; i + 1 < argc; i += 2) {
        auto route = net::IpPrefix::parse(argv[i]);
        if (!route) {
            std::cerr << "rtr_probe: '" << argv[i] << "' is not a prefix\n";
            return 1;
        }
        const auto asn = net::parse_asn(argv[i + 1]);
        if (!asn) {
            std::cerr << "rtr_probe: bad origin AS '" << argv[i + 1] << "'\n";
            return 1;
        }
        queries.push_back(Query{*route, *asn});
    }

    obs::init_logging(obs::LogConfig{"warn", obs::LogConfig{}.pattern});

    std::mutex mu;
    std::condition_variable cv;
    std::shared_ptr<const vrp::VrpTable> table;
    rtr::SessionStatus last;

    rtr::RtrSession session(0, cfg, std::make_unique<rtr::TcpConnector>(cfg.host, cfg.port),
                            [&](const rtr::SessionUpdate& u) {
                                std::lock_guard<std::mutex> lk(mu);
                                last = u.status;
                                if (u.committed && !table) {
                                    table = u.status.table;
                                    cv.notify_all();
                                }
                                return true;
                            });

    std::cout << "rtr_probe: synchronising with " << cfg.host << ":" << cfg.port << std::endl;
    const auto started = std::chrono::steady_clock::now();
    session.start();
    {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait_for(lk, cfg.timers.end_of_data, [&] { return table != nullptr; });
    }
    session.stop();

    if (!table) {
        std::cerr << "rtr_probe: no End of Data within " << cfg.timers.end_of_data.count() << " ms";
        if (!last.last_error.empty()) std::cerr << " (last error: " << last.last_error << ")";
        std::cerr << std::endl;
        return 2;
    }

    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    std::cout << "session_id " << table->session_id() << " serial " << table->serial()
              << " version " << static_cast<int>(last.version) << " in " << took.count() << " ms\n"
              << "  IPv4 VRPs: " << table->size(net::Family::V4)
              << " (" << table->origins(net::Family::V4).size() << " origins)\n"
              << "  IPv6 VRPs: " << table->size(net::Family::V6)
              << " (" << table->origins(net::Family::V6).size() << " origins)\n";

    for (const auto& q : queries) {
        const auto r = vrp::validate(*table, q.route, q.asn);
        std::cout << q.route.to_string() << " AS" << q.asn << ": " << vrp::to_string(r.state) << "\n";
        for (const auto& v : r.matched) std::cout << "    matched   " << v.to_string() << "\n";
        for (const auto& v : r.unmatched) std::cout << "    unmatched " << v.to_string() << "\n";
    }
    return 0;
}

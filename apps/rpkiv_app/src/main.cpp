/**
 * @file main.cpp
 * @brief rpkiv_app: run the validator against the caches named in a JSON config.
 *
 * Usage:
 *   ./rpkiv_app [config.json] [status_interval_s]
 *
 * Without a config file the named defaults are used (one cache on 127.0.0.1:323).
 * Logs every published store version and a periodic status line; exits on SIGINT/SIGTERM.
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "rpkiv/config/config_loader.hpp"
#include "rpkiv/obs/observability.hpp"
#include "rpkiv/pool/session_pool.hpp"
#include "rpkiv/version.hpp"

namespace {
    volatile std::sig_atomic_t g_stop = 0;
    void on_signal(int) { g_stop = 1; }

    void log_status(const rpkiv::pool::PoolStatus& ps) {
        auto log = rpkiv::obs::logger();
        log->info("status: version={} available={} authority={} serial={} staleness={}s",
                  ps.version, ps.available,
                  ps.authoritative ? ps.sessions[*ps.authoritative].name : std::string("-"),
                  ps.serial ? std::to_string(*ps.serial) : std::string("-"),
                  ps.staleness ? ps.staleness->count() : -1);
        for (const auto& s : ps.sessions) {
            log->info("  {} state={} health={} serial={} vrps={} failures={}{}",
                      s.name, rpkiv::rtr::to_string(s.status.state), rpkiv::pool::to_string(s.health),
                      s.status.serial ? std::to_string(*s.status.serial) : std::string("-"),
                      s.status.table ? s.status.table->size() : 0, s.status.failures,
                      s.status.last_error.empty() ? std::string() : " last_error=" + s.status.last_error);
        }
    }
}

int main(int argc, char** argv) {
    using namespace rpkiv;

    config::ValidatorConfig cfg = config::Loader::defaults();
    if (argc > 1) {
        auto loaded = config::Loader::load_from_file(argv[1]);
        if (!loaded) {
            std::cerr << "rpkiv_app: " << loaded.error().to_string() << std::endl;
            return EXIT_FAILURE;
        }
        cfg = std::move(*loaded);
    }
    const auto status_every = std::chrono::seconds{argc > 2 ? std::stoi(argv[2]) : 30};

    obs::init_logging(cfg.log);
    obs::logger()->info("rpkiv {} (RTR v{}..v{}) starting with {} cache(s)", version_string,
                        rtr_version_min, rtr_version_max, cfg.caches.size());

    auto created = pool::SessionPool::create(std::move(cfg.caches), cfg.pool);
    if (!created) {
        obs::logger()->critical("cannot create session pool: {}", pool::to_string(created.error()));
        return EXIT_FAILURE;
    }
    auto& sp = **created;
    sp.subscribe([&sp](std::uint64_t version) {
        const auto snap = sp.snapshot();
        if (snap->table) {
            obs::logger()->info("store version {}: serial {} ({} IPv4, {} IPv6 VRPs)", version,
                                snap->table->serial(), snap->table->size(net::Family::V4),
                                snap->table->size(net::Family::V6));
        } else {
            obs::logger()->warn("store version {}: no validation data", version);
        }
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    sp.start();

    auto next_status = std::chrono::steady_clock::now() + status_every;
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() >= next_status) {
            log_status(sp.status());
            next_status += status_every;
        }
    }

    obs::logger()->info("shutting down");
    sp.stop();
    const auto counters = obs::make_log_observer()->snapshot();
    for (std::size_t i = 0; i < counters.values.size(); ++i) {
        const auto c = static_cast<obs::Counter>(i);
        obs::logger()->info("  {} = {}", obs::to_string(c), counters[c]);
    }
    return EXIT_SUCCESS;
}

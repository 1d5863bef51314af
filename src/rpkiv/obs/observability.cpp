/**
 * @file observability.cpp
 * @brief spdlog-backed logger setup and Observer implementation.
 */
#include "rpkiv/obs/observability.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace rpkiv::obs {

    namespace {
        constexpr const char* kLoggerName = "rpkiv";
        std::mutex g_log_mu;
    }

    std::shared_ptr<spdlog::logger> logger() {
        if (auto l = spdlog::get(kLoggerName)) return l;
        std::lock_guard<std::mutex> lk(g_log_mu);
        if (auto l = spdlog::get(kLoggerName)) return l;
        return spdlog::stdout_color_mt(kLoggerName);
    }

    void init_logging(const LogConfig& cfg) {
        auto l = logger();
        l->set_level(spdlog::level::from_str(cfg.level));
        l->set_pattern(cfg.pattern);
        l->flush_on(spdlog::level::warn);
    }

    const char* to_string(Counter c) noexcept {
        switch (c) {
            case Counter::PdusReceived:    return "pdus_received";
            case Counter::PdusSent:        return "pdus_sent";
            case Counter::FullSyncs:       return "full_syncs";
            case Counter::Deltas:          return "deltas";
            case Counter::CacheResets:     return "cache_resets";
            case Counter::ProtocolErrors:  return "protocol_errors";
            case Counter::TransportErrors: return "transport_errors";
            case Counter::CacheErrors:     return "cache_errors";
            case Counter::Failovers:       return "failovers";
            case Counter::Publishes:       return "publishes";
            case Counter::Withdrawals:     return "withdrawals";
            case Counter::Count_:          break;
        }
        return "unknown";
    }

    class LogObserver : public Observer {
    public:
        void record(const SessionEvent& e) override {
            logger()->info("session={} {} -> {} reason={} serial={}",
                           e.session, e.from, e.to, e.reason, e.serial);
        }
        void count(Counter c, std::uint64_t n) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.values[static_cast<std::size_t>(c)] += n;
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace rpkiv::obs

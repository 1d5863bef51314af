/**
 * @file config_loader.cpp
 * @brief jsoncpp-backed loader with range validation.
 */
#include "rpkiv/config/config_loader.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <sstream>

#include <json/json.h>

#include "rpkiv/config/constants.hpp"

namespace rpkiv::config {
    using namespace rpkiv::config::constants;

    namespace {

        using Err = std::optional<ConfigError>;

        constexpr std::uint64_t kHourMs = 3'600'000;
        constexpr std::uint64_t kDayMs  = 86'400'000;

        /// One JSON object plus its path, for typed and range-checked field access.
        class Section {
        public:
            Section(const Json::Value& v, std::string path) : v_(v), path_(std::move(path)) {}

            std::string at(const char* key) const { return path_.empty() ? key : path_ + "." + key; }
            const std::string& path() const noexcept { return path_; }
            bool has(const char* key) const { return v_.isMember(key); }
            const Json::Value& get(const char* key) const { return v_[key]; }

            Err require_object() const {
                if (!v_.isObject()) return ConfigError{path_, "expected an object"};
                return std::nullopt;
            }

            void warn_unknown(std::initializer_list<const char*> known) const {
                for (const auto& k : v_.getMemberNames()) {
                    const bool ok = std::any_of(known.begin(), known.end(), [&](const char* n) { return k == n; });
                    if (!ok) obs::logger()->warn("config: ignoring unknown key {}", at(k.c_str()));
                }
            }

            template <class T>
            Err uint_field(const char* key, std::uint64_t lo, std::uint64_t hi, T& out) const {
                if (!has(key)) return std::nullopt;
                const auto& f = v_[key];
                if (!f.isUInt64()) return ConfigError{at(key), "expected a non-negative integer"};
                const auto n = f.asUInt64();
                if (n < lo || n > hi) {
                    return ConfigError{at(key), "must be in [" + std::to_string(lo) + ", " + std::to_string(hi) + "]"};
                }
                out = static_cast<T>(n);
                return std::nullopt;
            }

            template <class Rep, class Period>
            Err duration_field(const char* key, std::uint64_t lo, std::uint64_t hi,
                               std::chrono::duration<Rep, Period>& out) const {
                std::uint64_t n = static_cast<std::uint64_t>(out.count());
                if (auto e = uint_field(key, lo, hi, n)) return e;
                out = std::chrono::duration<Rep, Period>{static_cast<Rep>(n)};
                return std::nullopt;
            }

            Err string_field(const char* key, std::string& out, bool non_empty) const {
                if (!has(key)) return std::nullopt;
                const auto& f = v_[key];
                if (!f.isString()) return ConfigError{at(key), "expected a string"};
                if (non_empty && f.asString().empty()) return ConfigError{at(key), "must not be empty"};
                out = f.asString();
                return std::nullopt;
            }

            Err bool_field(const char* key, bool& out) const {
                if (!has(key)) return std::nullopt;
                const auto& f = v_[key];
                if (!f.isBool()) return ConfigError{at(key), "expected true or false"};
                out = f.asBool();
                return std::nullopt;
            }

        private:
            const Json::Value& v_;
            std::string path_;
        };

        Err parse_log(const Section& s, obs::LogConfig& log) {
            if (auto e = s.require_object()) return e;
            s.warn_unknown({"level", "pattern"});
            if (auto e = s.string_field("level", log.level, true)) return e;
            if (auto e = s.string_field("pattern", log.pattern, true)) return e;
            if (spdlog::level::from_str(log.level) == spdlog::level::off && log.level != "off") {
                return ConfigError{s.at("level"), "unknown level '" + log.level + "'"};
            }
            return std::nullopt;
        }

        Err parse_pool(const Section& s, pool::PoolConfig& p) {
            if (auto e = s.require_object()) return e;
            s.warn_unknown({"staleness_ceiling_s", "min_hold_ms", "recovery_hold_ms", "tick_ms", "queue_capacity"});
            if (auto e = s.duration_field("staleness_ceiling_s", 1, RTR_EXPIRE_MAX_S, p.staleness_ceiling)) return e;
            if (auto e = s.duration_field("min_hold_ms", 0, kHourMs, p.min_hold)) return e;
            if (auto e = s.duration_field("recovery_hold_ms", 0, kHourMs, p.recovery_hold)) return e;
            if (auto e = s.duration_field("tick_ms", 1, 60'000, p.tick)) return e;
            if (auto e = s.uint_field("queue_capacity", 2, 65536, p.queue_capacity)) return e;
            if ((p.queue_capacity & (p.queue_capacity - 1)) != 0) {
                return ConfigError{s.at("queue_capacity"), "must be a power of two"};
            }
            return std::nullopt;
        }

        Err parse_timers(const Section& s, rtr::SessionTimers& t) {
            if (auto e = s.require_object()) return e;
            s.warn_unknown({"connect_ms", "cache_response_ms", "end_of_data_ms", "response_ms", "sync_stall_ms",
                            "refresh_s", "retry_s", "expire_s", "honor_cache_intervals"});
            if (auto e = s.duration_field("connect_ms", 1, kHourMs, t.connect)) return e;
            if (auto e = s.duration_field("cache_response_ms", 1, kHourMs, t.cache_response)) return e;
            if (auto e = s.duration_field("end_of_data_ms", 1, kDayMs, t.end_of_data)) return e;
            if (auto e = s.duration_field("response_ms", 1, kHourMs, t.response)) return e;
            if (auto e = s.duration_field("sync_stall_ms", 1, kDayMs, t.sync_stall)) return e;
            if (auto e = s.duration_field("refresh_s", RTR_REFRESH_MIN_S, RTR_REFRESH_MAX_S, t.refresh)) return e;
            if (auto e = s.duration_field("retry_s", RTR_RETRY_MIN_S, RTR_RETRY_MAX_S, t.retry)) return e;
            if (auto e = s.duration_field("expire_s", RTR_EXPIRE_MIN_S, RTR_EXPIRE_MAX_S, t.expire)) return e;
            if (auto e = s.bool_field("honor_cache_intervals", t.honor_cache_refresh)) return e;
            if (t.expire <= t.refresh || t.expire <= t.retry) {
                return ConfigError{s.at("expire_s"), "must exceed refresh_s and retry_s"};
            }
            return std::nullopt;
        }

        Err parse_backoff(const Section& s, rtr::BackoffConfig& b) {
            if (auto e = s.require_object()) return e;
            s.warn_unknown({"base_ms", "max_ms", "reset_after_ms"});
            if (auto e = s.duration_field("base_ms", 1, kHourMs, b.base)) return e;
            if (auto e = s.duration_field("max_ms", 1, kDayMs, b.max)) return e;
            if (auto e = s.duration_field("reset_after_ms", 0, kDayMs, b.reset_after)) return e;
            if (b.max < b.base) return ConfigError{s.at("max_ms"), "must not be below base_ms"};
            return std::nullopt;
        }

        Err parse_cache(const Section& s, rtr::CacheConfig& c) {
            if (auto e = s.require_object()) return e;
            s.warn_unknown({"name", "host", "port", "preference", "protocol_version", "credentials", "timers", "backoff"});
            if (!s.has("host")) return ConfigError{s.at("host"), "is required"};
            if (auto e = s.string_field("host", c.host, true)) return e;
            if (auto e = s.uint_field("port", 1, 65535, c.port)) return e;
            if (auto e = s.uint_field("preference", 0, 65535, c.preference)) return e;
            if (auto e = s.uint_field("protocol_version", RTR_VERSION_MIN, RTR_VERSION_MAX, c.protocol_version)) return e;
            c.name = c.host + ":" + std::to_string(c.port);
            if (auto e = s.string_field("name", c.name, true)) return e;

            if (s.has("credentials")) {
                Section cs(s.get("credentials"), s.at("credentials"));
                if (auto e = cs.require_object()) return e;
                cs.warn_unknown({"username", "password"});
                rtr::Credentials cred;
                if (auto e = cs.string_field("username", cred.username, false)) return e;
                if (auto e = cs.string_field("password", cred.password, false)) return e;
                c.credentials = std::move(cred);
            }
            if (s.has("timers")) {
                if (auto e = parse_timers(Section(s.get("timers"), s.at("timers")), c.timers)) return e;
            }
            if (s.has("backoff")) {
                if (auto e = parse_backoff(Section(s.get("backoff"), s.at("backoff")), c.backoff)) return e;
            }
            return std::nullopt;
        }

    } // namespace

    rpkiv_detail::expected<ValidatorConfig, ConfigError> Loader::parse(const std::string& text) {
        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        Json::Value root;
        std::string errs;
        if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
            return rpkiv_detail::unexpected(ConfigError{"", "invalid JSON: " + errs});
        }

        const Section top(root, "");
        if (auto e = top.require_object()) return rpkiv_detail::unexpected(*e);
        top.warn_unknown({"log", "pool", "caches"});

        ValidatorConfig vc;
        if (top.has("log")) {
            if (auto e = parse_log(Section(root["log"], "log"), vc.log)) return rpkiv_detail::unexpected(*e);
        }
        if (top.has("pool")) {
            if (auto e = parse_pool(Section(root["pool"], "pool"), vc.pool)) return rpkiv_detail::unexpected(*e);
        }

        const auto& caches = root["caches"];
        if (!caches.isArray() || caches.empty()) {
            return rpkiv_detail::unexpected(ConfigError{"caches", "expected a non-empty array"});
        }
        std::set<std::string> names;
        for (Json::ArrayIndex i = 0; i < caches.size(); ++i) {
            const std::string path = "caches[" + std::to_string(i) + "]";
            rtr::CacheConfig c;
            if (auto e = parse_cache(Section(caches[i], path), c)) return rpkiv_detail::unexpected(*e);
            if (!names.insert(c.name).second) {
                return rpkiv_detail::unexpected(ConfigError{path + ".name", "duplicate cache name '" + c.name + "'"});
            }
            vc.caches.push_back(std::move(c));
        }
        return vc;
    }

    rpkiv_detail::expected<ValidatorConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return rpkiv_detail::unexpected(ConfigError{"", "cannot open " + path});
        std::ostringstream ss;
        ss << in.rdbuf();
        return parse(ss.str());
    }

    ValidatorConfig Loader::defaults() {
        ValidatorConfig vc;
        rtr::CacheConfig local;
        local.name = "local";
        local.host = "127.0.0.1";
        vc.caches.push_back(std::move(local));
        return vc;
    }

} // namespace rpkiv::config

/**
 * @file bridge_config.cpp
 * @brief BridgeConfig and LoggingConfig JSON parsing.
 */
#include "bridge/bridge_config.hpp"

#include "utils/logger.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace irbridge::bridge
{

// ============================================================================
// Parsing helpers
// ============================================================================

namespace
{

nlohmann::json load_json_file(const std::string& path, const char* what)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error(std::string(what) + ": cannot open file: " + path);

    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw std::runtime_error(std::string(what) + ": JSON parse error in '" + path +
                                 "': " + e.what());
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* key)
{
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(key))
        return empty;
    if (!j[key].is_object())
        throw std::runtime_error(std::string("Bridge config: invalid '") + key +
                                 "' (must be an object)");
    return j[key];
}

std::string get_string(const nlohmann::json& j, const char* key, const std::string& def)
{
    if (!j.contains(key))
        return def;
    if (!j[key].is_string() || j[key].get<std::string>().empty())
        throw std::runtime_error(std::string("Bridge config: invalid '") + key +
                                 "' (must be a non-empty string)");
    return j[key].get<std::string>();
}

int64_t get_int(const nlohmann::json& j, const char* key, int64_t def, int64_t min, int64_t max)
{
    if (!j.contains(key))
        return def;
    if (!j[key].is_number_integer())
        throw std::runtime_error(std::string("Bridge config: invalid '") + key +
                                 "' (must be an integer)");
    const auto v = j[key].get<int64_t>();
    if (v < min || v > max)
        throw std::runtime_error(std::string("Bridge config: invalid '") + key + "' = " +
                                 std::to_string(v) + " (must be in [" + std::to_string(min) +
                                 ", " + std::to_string(max) + "])");
    return v;
}

constexpr int64_t kMaxPort = std::numeric_limits<std::uint16_t>::max();
constexpr int64_t kMaxMillis = 24LL * 3600 * 1000;

} // namespace

// ============================================================================
// BusConfig
// ============================================================================

void BusConfig::validate() const
{
    if (publish_port == 0 && port == kMaxPort)
        throw std::runtime_error("Bridge config: invalid 'publish_port' (must be set when "
                                 "'port' is 65535)");
}

// ============================================================================
// BridgeConfig
// ============================================================================

BridgeConfig BridgeConfig::from_json_file(const std::string& path)
{
    return from_json(load_json_file(path, "Bridge config"));
}

BridgeConfig BridgeConfig::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::runtime_error("Bridge config: top level must be an object");

    BridgeConfig cfg;

    // ── bus ───────────────────────────────────────────────────────────────────
    const auto& bus = section(j, "bus");
    cfg.bus.host = get_string(bus, "host", cfg.bus.host);
    cfg.bus.port = static_cast<std::uint16_t>(get_int(bus, "port", cfg.bus.port, 1, kMaxPort));
    cfg.bus.publish_port =
        static_cast<std::uint16_t>(get_int(bus, "publish_port", 0, 0, kMaxPort));
    cfg.bus.validate();

    // ── discovery ─────────────────────────────────────────────────────────────
    const auto& disc = section(j, "discovery");
    cfg.discovery.service_type = get_string(disc, "service_type", cfg.discovery.service_type);
    cfg.discovery.query_interval = std::chrono::milliseconds(
        get_int(disc, "query_interval_ms", cfg.discovery.query_interval.count(), 100, kMaxMillis));
    cfg.discovery.interface_address =
        get_string(disc, "interface", cfg.discovery.interface_address);

    // ── device ────────────────────────────────────────────────────────────────
    const auto& dev = section(j, "device");
    cfg.device.poll_interval = std::chrono::milliseconds(
        get_int(dev, "poll_interval_ms", cfg.device.poll_interval.count(), 1, kMaxMillis));
    cfg.device.drain_ticks =
        static_cast<int>(get_int(dev, "drain_ticks", cfg.device.drain_ticks, 1, 1000000));
    cfg.device.get_timeout = std::chrono::milliseconds(
        get_int(dev, "get_timeout_ms", cfg.device.get_timeout.count(), 1, kMaxMillis));
    cfg.device.post_timeout = std::chrono::milliseconds(
        get_int(dev, "post_timeout_ms", cfg.device.post_timeout.count(), 1, kMaxMillis));
    cfg.device.recent_cache_size = static_cast<std::size_t>(get_int(
        dev, "recent_cache_size", static_cast<int64_t>(cfg.device.recent_cache_size), 1, 4096));

    cfg.topic_base = get_string(j, "topic_base", cfg.topic_base);
    return cfg;
}

// ============================================================================
// LoggingConfig
// ============================================================================

LoggingConfig LoggingConfig::from_json_file(const std::string& path)
{
    return from_json(load_json_file(path, "Logging config"));
}

LoggingConfig LoggingConfig::from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw std::runtime_error("Logging config: top level must be an object");

    LoggingConfig cfg;
    cfg.level = j.value("level", cfg.level);
    if (!utils::Logger::level_from_string(cfg.level))
        throw std::runtime_error("Logging config: invalid 'level' = '" + cfg.level +
                                 "' (must be trace, debug, info, warn, error or system)");

    const std::string sink = j.value("sink", std::string{"console"});
    if (sink == "console")
        cfg.sink = Sink::Console;
    else if (sink == "file")
        cfg.sink = Sink::File;
    else if (sink == "syslog")
        cfg.sink = Sink::Syslog;
    else
        throw std::runtime_error("Logging config: invalid 'sink' = '" + sink +
                                 "' (must be 'console', 'file', or 'syslog')");

    cfg.path = j.value("path", std::string{});
    if (cfg.sink == Sink::File && cfg.path.empty())
        throw std::runtime_error("Logging config: sink 'file' requires 'path'");
    return cfg;
}

bool LoggingConfig::apply() const
{
    auto& logger = utils::Logger::instance();
    if (auto lvl = utils::Logger::level_from_string(level))
        logger.set_level(*lvl);

    switch (sink)
    {
    case Sink::File:
        return logger.set_logfile(path);
    case Sink::Syslog:
        return logger.set_syslog("irbridge");
    case Sink::Console:
    default:
        return logger.set_console();
    }
}

} // namespace irbridge::bridge

#pragma once
/**
 * @file topics.hpp
 * @brief Bus topic naming and the JSON events published by the bridge.
 *
 * A device advertised as "IRKitD2A4._irkit._tcp.local." owns the topics:
 *   irkit/IRKitD2A4            status events (added / removed)
 *   irkit/IRKitD2A4/messages   signals, in both directions
 * plus the shared topics irkit/all/messages (broadcast) and irkit/error.
 */
#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace irbridge::bridge
{

inline constexpr std::string_view kDefaultTopicBase = "irkit/";
inline constexpr std::string_view kMessagesSuffix = "/messages";
inline constexpr std::string_view kBroadcastName = "all";
inline constexpr std::string_view kErrorName = "error";

class TopicScheme
{
public:
    /// @param base Prefix of every topic; a trailing '/' is added if missing.
    explicit TopicScheme(std::string base = std::string(kDefaultTopicBase));

    [[nodiscard]] const std::string& base() const noexcept { return m_base; }

    /// base + discovery name up to (not including) the first '.'.
    [[nodiscard]] std::string base_topic(std::string_view discovery_name) const;

    /// base_topic(name) + "/messages".
    [[nodiscard]] std::string message_topic(std::string_view discovery_name) const;

    [[nodiscard]] std::string broadcast_topic() const;
    [[nodiscard]] std::string error_topic() const;

    /// True if the topic has the base prefix and the "/messages" suffix.
    [[nodiscard]] bool is_message_topic(std::string_view topic) const noexcept;

private:
    std::string m_base;
};

/// {"status": status, "type": service_type, "name": discovery_name}
[[nodiscard]] nlohmann::json make_status_event(std::string_view status,
                                               std::string_view service_type,
                                               std::string_view discovery_name);

/// {"message": "Error occurred: <what>"}
[[nodiscard]] nlohmann::json make_error_event(std::string_view what);

} // namespace irbridge::bridge

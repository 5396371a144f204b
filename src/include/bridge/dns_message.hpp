#pragma once
/**
 * @file dns_message.hpp
 * @brief Minimal DNS wire-format codec for multicast DNS service browsing.
 *
 * Only what a browser needs: building a PTR question and decoding responses
 * with PTR, SRV and A records (RFC 1035 / RFC 6762). Names are returned
 * without the trailing root dot, in the case they were sent in. Other record
 * types are kept with their header fields only.
 */
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace irbridge::bridge::dns
{

enum class RecordType : std::uint16_t
{
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255,
};

inline constexpr std::uint16_t kClassIn = 1;
/// mDNS "cache flush" bit in the class field of a record.
inline constexpr std::uint16_t kCacheFlushBit = 0x8000;
inline constexpr std::uint16_t kFlagResponse = 0x8000;

class ParseError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct Question
{
    std::string name;
    std::uint16_t type{0};
    std::uint16_t qclass{0};
};

struct ResourceRecord
{
    std::string name;
    std::uint16_t type{0};
    std::uint16_t rclass{0};
    std::uint32_t ttl{0};

    std::string target;     ///< PTR domain name, or SRV target host
    std::uint16_t port{0};  ///< SRV only
    std::string address;    ///< A only, dotted quad

    [[nodiscard]] bool is(RecordType t) const noexcept
    {
        return type == static_cast<std::uint16_t>(t);
    }
};

struct Message
{
    std::uint16_t id{0};
    std::uint16_t flags{0};
    std::vector<Question> questions;
    /// Answer, authority and additional sections, in that order.
    std::vector<ResourceRecord> records;

    [[nodiscard]] bool is_response() const noexcept { return (flags & kFlagResponse) != 0; }
};

/**
 * @brief Encodes a one-question query for PTR records of `service_type`.
 * @param service_type e.g. "_irkit._tcp.local." (trailing dot optional)
 * @throws std::invalid_argument if a label is empty or longer than 63 bytes.
 */
[[nodiscard]] std::vector<std::uint8_t> build_ptr_query(std::string_view service_type);

/**
 * @brief Decodes a DNS message.
 * @throws ParseError on truncated data, bad label lengths or compression loops.
 */
[[nodiscard]] Message parse(const std::uint8_t* data, std::size_t size);

/// Lower-cases and strips a trailing '.', for comparing names.
[[nodiscard]] std::string normalize_name(std::string_view name);

} // namespace irbridge::bridge::dns

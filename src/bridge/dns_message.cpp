#include "bridge/dns_message.hpp"

#include "utils/format_tools.hpp"

#include <fmt/format.h>

namespace irbridge::bridge::dns
{

namespace
{
constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxName = 255;
constexpr int kMaxPointerJumps = 32;
constexpr std::uint8_t kPointerMask = 0xC0;

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

class Reader
{
public:
    Reader(const std::uint8_t* data, std::size_t size) : m_data(data), m_size(size) {}

    std::uint8_t u8()
    {
        need(1);
        return m_data[m_pos++];
    }

    std::uint16_t u16()
    {
        need(2);
        const auto v = static_cast<std::uint16_t>((m_data[m_pos] << 8) | m_data[m_pos + 1]);
        m_pos += 2;
        return v;
    }

    std::uint32_t u32()
    {
        const std::uint32_t hi = u16();
        const std::uint32_t lo = u16();
        return (hi << 16) | lo;
    }

    // Reads a possibly compressed name starting at the cursor.
    std::string name()
    {
        std::string out;
        std::size_t pos = m_pos;
        bool jumped = false;
        int jumps = 0;

        while (true)
        {
            if (pos >= m_size)
                throw ParseError("name runs past end of message");
            const std::uint8_t len = m_data[pos];

            if ((len & kPointerMask) == kPointerMask)
            {
                if (pos + 1 >= m_size)
                    throw ParseError("truncated compression pointer");
                if (++jumps > kMaxPointerJumps)
                    throw ParseError("compression pointer loop");
                const std::size_t target = ((len & 0x3Fu) << 8) | m_data[pos + 1];
                if (!jumped)
                {
                    m_pos = pos + 2;
                    jumped = true;
                }
                pos = target;
                continue;
            }
            if ((len & kPointerMask) != 0)
                throw ParseError(fmt::format("unsupported label type 0x{:02x}", len));

            if (len == 0)
            {
                if (!jumped)
                    m_pos = pos + 1;
                break;
            }
            if (pos + 1 + len > m_size)
                throw ParseError("label runs past end of message");
            if (!out.empty())
                out.push_back('.');
            out.append(reinterpret_cast<const char*>(m_data + pos + 1), len);
            if (out.size() > kMaxName)
                throw ParseError("name too long");
            pos += 1 + len;
        }
        return out;
    }

    void skip(std::size_t n)
    {
        need(n);
        m_pos += n;
    }

    [[nodiscard]] std::size_t pos() const noexcept { return m_pos; }
    void seek(std::size_t pos) { m_pos = pos; }

private:
    void need(std::size_t n) const
    {
        if (m_pos + n > m_size)
            throw ParseError("message truncated");
    }

    const std::uint8_t* m_data;
    std::size_t m_size;
    std::size_t m_pos{0};
};

ResourceRecord read_record(Reader& r)
{
    ResourceRecord rr;
    rr.name = r.name();
    rr.type = r.u16();
    rr.rclass = r.u16();
    rr.ttl = r.u32();
    const std::uint16_t rdlength = r.u16();
    const std::size_t rdata_start = r.pos();
    r.skip(rdlength);
    const std::size_t rdata_end = r.pos();
    r.seek(rdata_start);

    if (rr.is(RecordType::PTR))
    {
        rr.target = r.name();
    }
    else if (rr.is(RecordType::SRV))
    {
        static_cast<void>(r.u16()); // priority
        static_cast<void>(r.u16()); // weight
        rr.port = r.u16();
        rr.target = r.name();
    }
    else if (rr.is(RecordType::A))
    {
        if (rdlength != 4)
            throw ParseError(fmt::format("A record with {} byte(s) of data", rdlength));
        const auto a = r.u8();
        const auto b = r.u8();
        const auto c = r.u8();
        const auto d = r.u8();
        rr.address = fmt::format("{}.{}.{}.{}", a, b, c, d);
    }

    if (r.pos() > rdata_end)
        throw ParseError("record data overruns its length");
    r.seek(rdata_end);
    return rr;
}

} // namespace

std::vector<std::uint8_t> build_ptr_query(std::string_view service_type)
{
    std::vector<std::uint8_t> out;
    out.reserve(kHeaderSize + service_type.size() + 6);
    put_u16(out, 0); // id: always 0 for mDNS
    put_u16(out, 0); // flags: standard query
    put_u16(out, 1); // qdcount
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);

    if (!service_type.empty() && service_type.back() == '.')
        service_type.remove_suffix(1);

    std::size_t start = 0;
    while (start <= service_type.size())
    {
        auto dot = service_type.find('.', start);
        if (dot == std::string_view::npos)
            dot = service_type.size();
        const auto label = service_type.substr(start, dot - start);
        if (label.empty() || label.size() > kMaxLabel)
            throw std::invalid_argument(
                fmt::format("invalid DNS label in service type '{}'", service_type));
        out.push_back(static_cast<std::uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
        start = dot + 1;
    }
    out.push_back(0);

    put_u16(out, static_cast<std::uint16_t>(RecordType::PTR));
    put_u16(out, kClassIn);
    return out;
}

Message parse(const std::uint8_t* data, std::size_t size)
{
    if (size < kHeaderSize)
        throw ParseError("message shorter than header");

    Reader r(data, size);
    Message msg;
    msg.id = r.u16();
    msg.flags = r.u16();
    const auto qdcount = r.u16();
    const auto ancount = r.u16();
    const auto nscount = r.u16();
    const auto arcount = r.u16();

    for (std::uint16_t i = 0; i < qdcount; ++i)
    {
        Question q;
        q.name = r.name();
        q.type = r.u16();
        q.qclass = r.u16();
        msg.questions.push_back(std::move(q));
    }

    const std::size_t total = static_cast<std::size_t>(ancount) + nscount + arcount;
    for (std::size_t i = 0; i < total; ++i)
    {
        msg.records.push_back(read_record(r));
    }
    return msg;
}

std::string normalize_name(std::string_view name)
{
    if (!name.empty() && name.back() == '.')
        name.remove_suffix(1);
    return format_tools::to_lower(name);
}

} // namespace irbridge::bridge::dns

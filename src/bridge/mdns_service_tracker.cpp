#include "bridge/mdns_service_tracker.hpp"

#include "utils/logger.hpp"

#include <vector>

namespace irbridge::bridge
{

namespace
{
bool ends_with(const std::string& s, const std::string& suffix)
{
    return s.size() > suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0 &&
           s[s.size() - suffix.size() - 1] == '.';
}
} // namespace

MdnsServiceTracker::MdnsServiceTracker(std::string service_type, DiscoveryListener& listener)
    : m_service_type(std::move(service_type))
    , m_service_key(dns::normalize_name(m_service_type))
    , m_listener(listener)
{
}

void MdnsServiceTracker::ingest(const dns::Message& message, Clock::time_point now)
{
    if (!message.is_response())
    {
        return;
    }

    std::vector<std::string> touched;

    // Addresses first, so SRV targets in the same packet resolve immediately.
    for (const auto& rr : message.records)
    {
        if (rr.is(dns::RecordType::A))
        {
            auto key = dns::normalize_name(rr.name);
            if (rr.ttl == 0)
            {
                m_hosts.erase(key);
                continue;
            }
            m_hosts[key] = Host{rr.address, now + std::chrono::seconds(rr.ttl)};
        }
    }

    for (const auto& rr : message.records)
    {
        if (rr.is(dns::RecordType::PTR) && dns::normalize_name(rr.name) == m_service_key)
        {
            auto key = dns::normalize_name(rr.target);
            if (rr.ttl == 0)
            {
                remove(key);
                continue;
            }
            auto& inst = m_instances[key];
            if (inst.name.empty())
            {
                inst.name = rr.target + ".";
            }
            inst.expires = now + std::chrono::seconds(rr.ttl);
            touched.push_back(key);
        }
        else if (rr.is(dns::RecordType::SRV))
        {
            auto key = dns::normalize_name(rr.name);
            if (!ends_with(key, m_service_key))
            {
                continue;
            }
            if (rr.ttl == 0)
            {
                remove(key);
                continue;
            }
            auto it = m_instances.find(key);
            if (it == m_instances.end())
            {
                // SRV without a PTR yet (e.g. an unsolicited announcement); track it.
                auto& inst = m_instances[key];
                inst.name = rr.name + ".";
                inst.expires = now + std::chrono::seconds(rr.ttl);
                it = m_instances.find(key);
            }
            it->second.target = dns::normalize_name(rr.target);
            it->second.port = rr.port;
            touched.push_back(key);
        }
    }

    // A-only packets can complete instances learned earlier.
    for (auto& [key, inst] : m_instances)
    {
        if (!inst.target.empty() && m_hosts.count(inst.target) != 0)
        {
            touched.push_back(key);
        }
    }

    for (const auto& key : touched)
    {
        auto it = m_instances.find(key);
        if (it != m_instances.end())
        {
            resolve(it->second);
        }
    }
}

void MdnsServiceTracker::resolve(Instance& inst)
{
    if (inst.target.empty() || inst.port == 0)
    {
        return;
    }
    auto host = m_hosts.find(inst.target);
    if (host == m_hosts.end())
    {
        return;
    }
    if (inst.announced && inst.announced_address == host->second.address &&
        inst.announced_port == inst.port)
    {
        return;
    }
    inst.announced = true;
    inst.announced_address = host->second.address;
    inst.announced_port = inst.port;
    LOGGER_INFO("mDNS: '{}' at {}:{}", inst.name, inst.announced_address, inst.port);
    m_listener.on_service_added(
        ServiceInfo{inst.name, m_service_type, inst.announced_address, inst.port});
}

void MdnsServiceTracker::remove(const std::string& key)
{
    auto it = m_instances.find(key);
    if (it == m_instances.end())
    {
        return;
    }
    const auto inst = it->second;
    m_instances.erase(it);
    if (inst.announced)
    {
        LOGGER_INFO("mDNS: '{}' gone", inst.name);
        m_listener.on_service_removed(inst.name, m_service_type);
    }
}

void MdnsServiceTracker::expire(Clock::time_point now)
{
    std::vector<std::string> expired;
    for (const auto& [key, inst] : m_instances)
    {
        if (inst.expires <= now)
        {
            expired.push_back(key);
        }
    }
    for (const auto& key : expired)
    {
        remove(key);
    }

    for (auto it = m_hosts.begin(); it != m_hosts.end();)
    {
        it = it->second.expires <= now ? m_hosts.erase(it) : std::next(it);
    }
}

} // namespace irbridge::bridge

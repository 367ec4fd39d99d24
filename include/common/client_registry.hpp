/*
 * File: include/common/client_registry.hpp
 * Project: TAIS Track Relay
 * Purpose: Per-facility subscriber sets
 * Notes:
 *  - Clients own their transport; the registry only holds the handle
 *  - enqueue() must not block; a full or closed client returns false
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>


using Frame = std::shared_ptr<const std::string>; // one serialized envelope, shared by all recipients


class TrackClient
{
public:
    virtual ~TrackClient() = default;
    virtual bool enqueue(Frame frame) = 0;
    virtual bool is_open() const = 0;
};


class ClientRegistry
{
    mutable std::mutex m_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::shared_ptr<TrackClient>>> facilities_;
    boost::uuids::random_generator gen_; // guarded by m_

    std::string next_id_locked()
    {
        auto s = boost::uuids::to_string(gen_());
        s.erase(std::remove(s.begin(), s.end(), '-'), s.end());
        return s;
    }

public:
    std::string add(const std::string &facility, std::shared_ptr<TrackClient> client)
    {
        std::scoped_lock lk(m_);
        auto id = next_id_locked();
        facilities_[facility][id] = std::move(client);
        return id;
    }

    bool remove(const std::string &facility, const std::string &client_id)
    {
        std::scoped_lock lk(m_);
        auto f = facilities_.find(facility);
        if (f == facilities_.end())
            return false;
        bool erased = f->second.erase(client_id) > 0;
        if (f->second.empty())
            facilities_.erase(f);
        return erased;
    }

    std::vector<std::shared_ptr<TrackClient>> clients(const std::string &facility) const
    {
        std::scoped_lock lk(m_);
        std::vector<std::shared_ptr<TrackClient>> out;
        auto f = facilities_.find(facility);
        if (f == facilities_.end())
            return out;
        out.reserve(f->second.size());
        for (const auto &kv : f->second)
            out.push_back(kv.second);
        return out;
    }

    std::size_t count(const std::string &facility) const
    {
        std::scoped_lock lk(m_);
        auto f = facilities_.find(facility);
        return f == facilities_.end() ? 0 : f->second.size();
    }

    std::size_t total() const
    {
        std::scoped_lock lk(m_);
        std::size_t n = 0;
        for (const auto &kv : facilities_)
            n += kv.second.size();
        return n;
    }

    bool has_facility(const std::string &facility) const
    {
        std::scoped_lock lk(m_);
        return facilities_.count(facility) > 0;
    }
};

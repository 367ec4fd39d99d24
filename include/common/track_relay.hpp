/*
 * File: include/common/track_relay.hpp
 * Project: TAIS Track Relay
 * Purpose: Track state engine: ingest, dirty-batch broadcast, stale purge, subscriptions
 * Notes:
 *  - Ingestion only takes the store/dirty locks, never the fan-out lock
 *  - Fan-out (subscribe, flush, purge) is serialized so a client always
 *    sees its snapshot first and never sees a batch after a removal it covers
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/client_registry.hpp"
#include "common/dirty_tracker.hpp"
#include "common/envelope.hpp"
#include "common/tais_normalizer.hpp"
#include "common/track.hpp"


struct FacilitySnapshot
{
    std::string facility;
    std::vector<Track> tracks; // display order
};

inline nlohmann::json snapshot_to_json(const FacilitySnapshot &s, Clock::time_point now)
{
    return nlohmann::json{{"facility", s.facility}, {"tracks", tracks_to_json(s.tracks, now)}};
}

inline nlohmann::json directory_to_json(const std::vector<FacilityCount> &dir)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &e : dir)
        arr.push_back({{"facility", e.facility}, {"trackCount", e.track_count}});
    return arr;
}

struct IngestSummary
{
    NormalizeStatus status{NormalizeStatus::ok};
    std::string facility;
    std::size_t applied{0};
    std::size_t skipped{0};
    std::string error;
};

struct RelayCounters
{
    uint64_t messages{0};
    uint64_t malformed{0};
    uint64_t records_applied{0};
    uint64_t records_skipped{0};
    uint64_t frames_sent{0};
    uint64_t frames_dropped{0};
    uint64_t tracks_purged{0};
};

class TrackRelay
{
public:
    using NowFn = std::function<Clock::time_point()>;

    explicit TrackRelay(std::chrono::seconds stale_after = std::chrono::seconds(60), NowFn now = {})
        : stale_after_(stale_after), now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

    // Bridge entry point. Malformed input is logged and dropped; returns records applied.
    std::size_t process_message(std::string_view topic, std::string_view body)
    {
        return ingest(topic, body).applied;
    }

    IngestSummary ingest(std::string_view topic, std::string_view body)
    {
        auto r = normalize_tais(topic, body);
        IngestSummary s{r.status, r.facility, 0, r.skipped, r.error};
        if (r.status == NormalizeStatus::ignored_topic)
            return s;
        ++messages_;
        if (r.status == NormalizeStatus::malformed)
        {
            ++malformed_;
            std::cerr << "[tais] " << r.error_kind << ": " << r.error << "\n";
            return s;
        }
        if (r.status != NormalizeStatus::ok)
            return s;

        records_skipped_ += r.skipped;
        if (r.updates.empty())
            return s;

        const auto now = now_();
        for (const auto &u : r.updates)
            store_.apply(u, now);
        s.applied = r.updates.size();
        records_applied_ += s.applied;
        dirty_.mark_dirty(r.facility);
        return s;
    }

    // Broadcast timer body: one "batch" per dirty facility that has clients and tracks.
    std::size_t flush_dirty()
    {
        auto facilities = dirty_.drain();
        if (facilities.empty())
            return 0;

        std::scoped_lock lk(fanout_mtx_);
        std::size_t sent = 0;
        for (const auto &facility : facilities)
        {
            auto clients = clients_.clients(facility);
            if (clients.empty())
                continue;
            auto tracks = store_.list(facility);
            if (tracks.empty())
                continue;

            auto frame = batch_frame(tracks, now_());
            for (const auto &c : clients)
            {
                if (!c->is_open())
                    continue;
                sent += deliver(*c, frame);
            }
        }
        return sent;
    }

    // Purge timer body: drop tracks idle past the threshold and tell subscribers.
    std::size_t purge_stale()
    {
        std::scoped_lock lk(fanout_mtx_);
        auto removed = store_.remove_stale(now_() - stale_after_);
        for (const auto &t : removed)
        {
            auto clients = clients_.clients(t.facility);
            if (clients.empty())
                continue;
            auto frame = remove_frame(t.facility, t.track_num);
            for (const auto &c : clients)
                deliver(*c, frame);
        }
        tracks_purged_ += removed.size();
        return removed.size();
    }

    std::string subscribe(const std::string &facility, std::shared_ptr<TrackClient> client)
    {
        if (!client)
            throw std::invalid_argument("subscribe: null client");
        std::scoped_lock lk(fanout_mtx_);
        auto &c = *client;
        auto id = clients_.add(facility, std::move(client));
        auto tracks = store_.list(facility);
        sort_for_display(tracks);
        deliver(c, snapshot_frame(tracks, now_()));
        return id;
    }

    bool unsubscribe(const std::string &facility, const std::string &client_id)
    {
        return clients_.remove(facility, client_id);
    }

    FacilitySnapshot snapshot(const std::string &facility) const
    {
        FacilitySnapshot s{facility, store_.list(facility)};
        sort_for_display(s.tracks);
        return s;
    }

    std::vector<FacilityCount> directory() const
    {
        auto dir = store_.counts();
        std::sort(dir.begin(), dir.end(), [](const FacilityCount &a, const FacilityCount &b)
                  {
            if (a.track_count != b.track_count) return a.track_count > b.track_count;
            return a.facility < b.facility; });
        return dir;
    }

    nlohmann::json snapshot_json(const std::string &facility) const { return snapshot_to_json(snapshot(facility), now_()); }
    nlohmann::json directory_json() const { return directory_to_json(directory()); }

    RelayCounters counters() const
    {
        RelayCounters c;
        c.messages = messages_.load();
        c.malformed = malformed_.load();
        c.records_applied = records_applied_.load();
        c.records_skipped = records_skipped_.load();
        c.frames_sent = frames_sent_.load();
        c.frames_dropped = frames_dropped_.load();
        c.tracks_purged = tracks_purged_.load();
        return c;
    }

    const TrackStore &store() const { return store_; }
    const ClientRegistry &clients() const { return clients_; }
    const DirtyTracker &dirty() const { return dirty_; }

private:
    std::size_t deliver(TrackClient &c, const Frame &frame)
    {
        if (c.enqueue(frame))
        {
            ++frames_sent_;
            return 1;
        }
        ++frames_dropped_;
        return 0;
    }

    const std::chrono::seconds stale_after_;
    NowFn now_;
    TrackStore store_;
    DirtyTracker dirty_;
    ClientRegistry clients_;
    std::mutex fanout_mtx_;

    std::atomic<uint64_t> messages_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> records_applied_{0};
    std::atomic<uint64_t> records_skipped_{0};
    std::atomic<uint64_t> frames_sent_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> tracks_purged_{0};
};

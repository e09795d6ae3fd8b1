#pragma once

#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "IActivitySink.hpp"
#include "ICatalog.hpp"
#include "IPlayer.hpp"
#include "ITagSensor.hpp"
#include "Session.hpp"

// Returns the scripted reads in order, then "no tag" forever.
// A read of "!" throws, to stand in for a failing reader.
class ScriptedSensor : public ITagSensor {
   public:
    ScriptedSensor() = default;
    explicit ScriptedSensor(std::vector<std::optional<TagId>> reads)
        : reads_(reads.begin(), reads.end()) {}

    void Push(std::optional<TagId> read) { reads_.push_back(std::move(read)); }

    std::optional<TagId> Poll() override {
        ++polls;
        if (reads_.empty()) return std::nullopt;
        auto read = reads_.front();
        reads_.pop_front();
        if (read && *read == "!") {
            throw std::runtime_error("reader unplugged");
        }
        return read;
    }

    int polls = 0;

   private:
    std::deque<std::optional<TagId>> reads_;
};

class FakeCatalog : public ICatalog {
   public:
    void Map(const TagId& tag, const std::string& album, bool shuffle, TrackList tracks) {
        mappings_[tag] = AlbumMapping{album, shuffle};
        albums_[album] = std::move(tracks);
    }

    std::optional<AlbumMapping> Resolve(const TagId& tag) const override {
        auto it = mappings_.find(tag);
        if (it == mappings_.end()) return std::nullopt;
        return it->second;
    }

    TrackList Tracks(const std::string& album) const override {
        auto it = albums_.find(album);
        return it == albums_.end() ? TrackList{} : it->second;
    }

   private:
    std::map<TagId, AlbumMapping> mappings_;
    std::map<std::string, TrackList> albums_;
};

// Journal shared by the recording player and sink, to check cross-collaborator ordering.
using EventJournal = std::vector<std::string>;

class RecordingPlayer : public IPlayer {
   public:
    explicit RecordingPlayer(EventJournal* journal = nullptr) : journal_(journal) {}

    bool Start(const TrackList& tracks, bool shuffle) override {
        starts.push_back({tracks, shuffle});
        if (journal_) journal_->push_back("player.start");
        if (!accept_start) return false;
        playing = true;
        return true;
    }

    void Stop() noexcept override {
        ++stops;
        playing = false;
        if (journal_) journal_->push_back("player.stop");
    }

    struct StartCall {
        TrackList tracks;
        bool shuffle;
    };

    std::vector<StartCall> starts;
    int stops = 0;
    bool playing = false;
    bool accept_start = true;

   private:
    EventJournal* journal_;
};

class RecordingSink : public IActivitySink {
   public:
    explicit RecordingSink(EventJournal* journal = nullptr) : journal_(journal) {}

    void Record(const ActivityRecord& record) noexcept override {
        records.push_back(record);
        if (journal_) {
            journal_->push_back(std::string(to_string(record.action)) + " " + record.album);
        }
    }

    std::vector<ActivityRecord> records;

   private:
    EventJournal* journal_;
};

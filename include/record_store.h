// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file record_store.h
 * @brief Append-only JSON array stores for measurement records
 *
 * One file per record kind. The file holds a single JSON array sorted
 * ascending by timestamp and is rewritten wholesale through a temp file and
 * rename, so a crash mid-save leaves the previous contents intact.
 */

#pragma once

#include "measurement_types.h"
#include "moonraker_events.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/**
 * @brief Failure to persist a store (disk full, permissions, ...)
 */
class StoreWriteError : public std::runtime_error {
  public:
    StoreWriteError(const std::string& path, const std::string& reason)
        : std::runtime_error("Failed to write " + path + ": " + reason), path_(path) {}

    const std::string& path() const {
        return path_;
    }

  private:
    std::string path_;
};

namespace store_detail {

/**
 * @brief Write @p content to <path>.tmp, flush, then rename over @p path
 *
 * @throws StoreWriteError on any I/O failure; @p path is untouched in that case
 */
void write_atomic(const std::string& path, const std::string& content);

/**
 * @brief Move an unreadable store aside to <path>.corrupt
 *
 * An existing backup is never replaced: if <path>.corrupt is taken, the first
 * free <path>.corrupt.<n> is used instead.
 *
 * @param backup_path Output: where the file now lives
 * @param error Output: why the move failed
 * @return false if the file could not be moved (it is still at @p path)
 */
bool quarantine(const std::string& path, std::string& backup_path, std::string& error);

enum class ReadStatus {
    OK,     ///< Contents read
    ABSENT, ///< Nothing at the path
    FAILED  ///< Something is there but could not be read
};

/// @brief Read the whole file
ReadStatus read_file(const std::string& path, std::string& out);

/// @brief True if anything (file, directory, link) exists at @p path
bool path_exists(const std::string& path);

} // namespace store_detail

/**
 * @brief Ordered, deduplicated collection of one record kind on disk
 *
 * @tparam Record ProbeRecord, OffsetRecord or MeshSnapshot (needs a double
 *         `timestamp` member and ADL to_json/from_json)
 *
 * Threading: load() and save() do not lock; update() is the exclusive section
 * that serializes concurrent load-modify-save cycles on the same store.
 */
template <typename Record> class RecordStore {
  public:
    /// @brief Mutates the loaded records; returns true if anything changed
    using UpdateFn = std::function<bool(std::vector<Record>&)>;

    RecordStore(std::string name, std::string path, EventEmitter* events = nullptr)
        : name_(std::move(name)), path_(std::move(path)), events_(events) {}

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    const std::string& name() const {
        return name_;
    }

    const std::string& path() const {
        return path_;
    }

    /**
     * @brief Load all records
     *
     * Returns empty if the file is absent or unreadable. A file that exists but
     * does not hold an array of valid records is moved to <path>.corrupt, a
     * STORE_RECOVERED event is emitted, and empty is returned.
     *
     * If the file can be neither read nor moved aside, empty is still returned,
     * but save() refuses to replace it until a later load() finds it usable
     * or gone.
     */
    std::vector<Record> load() const {
        std::string text;
        store_detail::ReadStatus status = store_detail::read_file(path_, text);
        if (status == store_detail::ReadStatus::ABSENT) {
            spdlog::debug("[Record Store] {} store {} not found, starting empty", name_, path_);
            blocked_.store(false);
            return {};
        }
        if (status == store_detail::ReadStatus::FAILED) {
            spdlog::error("[Record Store] {} store {} exists but cannot be read; it will not "
                          "be replaced",
                          name_, path_);
            blocked_.store(true);
            return {};
        }

        std::string problem;
        try {
            json data = json::parse(text);
            if (data.is_array()) {
                std::vector<Record> records = data.get<std::vector<Record>>();
                blocked_.store(false);
                return records;
            }
            problem = std::string("expected a JSON array, got ") + data.type_name();
        } catch (const json::exception& e) {
            problem = e.what();
        }

        spdlog::error("[Record Store] {} store {} is malformed: {}", name_, path_, problem);
        std::string backup;
        std::string move_error;
        if (!store_detail::quarantine(path_, backup, move_error)) {
            spdlog::error("[Record Store] Could not move malformed {} store aside ({}); it "
                          "will not be replaced",
                          name_, move_error);
            blocked_.store(true);
            return {};
        }

        blocked_.store(false);
        if (events_) {
            events_->emit(MoonrakerEventType::STORE_RECOVERED,
                          "Malformed " + name_ + " store moved to " + backup, true, problem);
        }
        return {};
    }

    /**
     * @brief Persist the full collection, stable-sorted by timestamp
     *
     * @throws StoreWriteError if the file cannot be written, or if the last
     *         load() left an unreadable file in place
     */
    void save(std::vector<Record> records) const {
        if (blocked_.load() && store_detail::path_exists(path_)) {
            throw StoreWriteError(path_, "existing file could not be read or moved aside, "
                                         "refusing to replace it");
        }

        std::stable_sort(records.begin(), records.end(),
                         [](const Record& a, const Record& b) { return a.timestamp < b.timestamp; });

        json data = records;
        store_detail::write_atomic(path_, data.dump(2) + "\n");
        spdlog::info("[Record Store] Saved {} {} records to {}", records.size(), name_, path_);
    }

    /**
     * @brief Load, let @p fn modify, save only if @p fn reports a change
     *
     * @return true if the store was rewritten
     */
    bool update(const UpdateFn& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Record> records = load();
        if (!fn(records)) {
            return false;
        }
        save(std::move(records));
        return true;
    }

  private:
    std::string name_;
    std::string path_;
    EventEmitter* events_;
    std::mutex mutex_;
    mutable std::atomic_bool blocked_{false}; // Unpreserved file still at path_
};

/**
 * @brief Incoming records whose timestamp is not yet known
 *
 * Drops records whose timestamp appears in @p existing, and repeats within
 * @p incoming after the first occurrence. Order of @p incoming is preserved.
 */
template <typename Record>
std::vector<Record> merge_by_timestamp(const std::vector<Record>& existing,
                                       const std::vector<Record>& incoming) {
    std::unordered_set<double> seen;
    seen.reserve(existing.size() + incoming.size());
    for (const auto& r : existing) {
        seen.insert(r.timestamp);
    }

    std::vector<Record> fresh;
    for (const auto& r : incoming) {
        if (seen.insert(r.timestamp).second) {
            fresh.push_back(r);
        }
    }
    return fresh;
}

/**
 * @brief True if @p incoming should be appended to the mesh history
 *
 * Compares only against the last saved snapshot: a mesh equal to an older
 * snapshot but different from the most recent one counts as new.
 */
bool is_new_mesh(const std::vector<MeshSnapshot>& existing, const MeshSnapshot& incoming);

using ProbeStore = RecordStore<ProbeRecord>;
using OffsetStore = RecordStore<OffsetRecord>;
using MeshStore = RecordStore<MeshSnapshot>;

} // namespace meshvault

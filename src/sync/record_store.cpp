// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "record_store.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace meshvault {

namespace store_detail {

void write_atomic(const std::string& path, const std::string& content) {
    const std::string tmp_path = path + ".tmp";

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StoreWriteError(path, "cannot create directory " + parent.string() + ": " +
                                            ec.message());
        }
    }

    // write tmp -> flush -> rename
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StoreWriteError(path, "cannot open " + tmp_path);
        }
        out << content;
        out.flush();
        if (!out.good()) {
            out.close();
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw StoreWriteError(path, "write to " + tmp_path + " failed");
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::string reason = "rename failed: " + ec.message();
        fs::remove(tmp_path, ec);
        throw StoreWriteError(path, reason);
    }
}

bool quarantine(const std::string& path, std::string& backup_path, std::string& error) {
    constexpr int MAX_BACKUPS = 1000;

    std::string candidate = path + ".corrupt";
    for (int n = 1; path_exists(candidate); ++n) {
        if (n > MAX_BACKUPS) {
            error = "no free backup name after " + std::to_string(MAX_BACKUPS) + " attempts";
            return false;
        }
        candidate = path + ".corrupt." + std::to_string(n);
    }

    std::error_code ec;
    fs::rename(path, candidate, ec);
    if (ec) {
        error = "cannot move to " + candidate + ": " + ec.message();
        spdlog::warn("[Record Store] Could not move {} to {}: {}", path, candidate, ec.message());
        return false;
    }

    backup_path = candidate;
    spdlog::info("[Record Store] Corrupt store backed up to {}", backup_path);
    return true;
}

ReadStatus read_file(const std::string& path, std::string& out) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (status.type() == fs::file_type::not_found) {
        return ReadStatus::ABSENT;
    }
    if (ec || status.type() != fs::file_type::regular) {
        spdlog::warn("[Record Store] {} is not a readable regular file", path);
        return ReadStatus::FAILED;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        spdlog::warn("[Record Store] Cannot open {} for reading", path);
        return ReadStatus::FAILED;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        spdlog::warn("[Record Store] Read error on {}", path);
        return ReadStatus::FAILED;
    }
    out = buffer.str();
    return ReadStatus::OK;
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::symlink_status(path, ec).type() != fs::file_type::not_found;
}

} // namespace store_detail

bool is_new_mesh(const std::vector<MeshSnapshot>& existing, const MeshSnapshot& incoming) {
    return existing.empty() || !existing.back().same_mesh(incoming);
}

} // namespace meshvault

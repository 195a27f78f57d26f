/**
 * @file disk_tier.cpp
 * @brief File-per-entry disk tier
 */

#include "cache/disk_tier.h"
#include "core/digest.h"
#include "core/errors.h"
#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace cache {

namespace {
const char* const kSuffix = ".entry";
}

DiskTier::DiskTier(const std::string& dir) : dir_(dir) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_)) {
        throw CacheError("cannot create cache directory " + dir + ": " + ec.message());
    }
}

fs::path DiskTier::path_for(const std::string& key) const {
    return dir_ / (sha256_hex(key) + kSuffix);
}

std::optional<CacheEntry> DiskTier::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    fs::path p = path_for(key);

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw CacheError("read failed: " + p.string());
    }
    in.close();

    CacheEntry entry;
    std::error_code ec;
    if (!decode_entry(bytes, entry)) {
        fs::remove(p, ec);
        throw CacheError("corrupt entry: " + p.string());
    }
    if (entry.expired(Clock::now())) {
        fs::remove(p, ec);
        return std::nullopt;
    }
    return entry;
}

void DiskTier::set(const std::string& key, const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    fs::path p = path_for(key);
    fs::path tmp = p;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw CacheError("cannot write " + tmp.string());
        }
        out << encode_entry(entry);
        out.flush();
        if (!out.good()) {
            throw CacheError("write failed: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw CacheError("cannot move entry into place: " + p.string());
    }
}

void DiskTier::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        throw CacheError("cannot delete entry: " + ec.message());
    }
}

void DiskTier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::vector<fs::path> doomed;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (name.find(kSuffix) != std::string::npos) {
            doomed.push_back(it->path());
        }
    }
    if (ec) {
        throw CacheError("cannot list cache directory: " + ec.message());
    }
    for (const auto& p : doomed) {
        fs::remove(p, ec);
    }
}

} // namespace cache

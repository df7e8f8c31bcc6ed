#include "shopstream/io/checkpoint_store.h"
#include "shopstream/core/errors.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <unistd.h>

namespace shopstream {
namespace io {

namespace fs = std::filesystem;

namespace {

const char* const PAYLOAD_PREFIX = "checkpoint_";
const char* const PAYLOAD_SUFFIX = ".ckpt";
const char* const LATEST_FILE = "LATEST";

// fsync a file or directory so a completed write survives a crash
void syncPath(const std::string& path, bool directory) {
    int flags = O_RDONLY;
    if (directory) {
        flags |= O_DIRECTORY;
    }
    int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        throw CheckpointWriteFailed("cannot open " + path + " for sync: " +
                                    std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw CheckpointWriteFailed("fsync of " + path + " failed: " + std::strerror(err));
    }
}

} // anonymous namespace

// ========== FileCheckpointStore ==========

FileCheckpointStore::FileCheckpointStore(const std::string& directory)
    : directory_(directory) {
    std::error_code ec;
    if (!fs::exists(directory_, ec)) {
        fs::create_directories(directory_, ec);
        if (ec) {
            throw CheckpointWriteFailed("cannot create " + directory_ + ": " + ec.message());
        }
    }
}

std::string FileCheckpointStore::getPayloadPath(uint64_t version) const {
    return directory_ + "/" + PAYLOAD_PREFIX + std::to_string(version) + PAYLOAD_SUFFIX;
}

bool FileCheckpointStore::writePayload(uint64_t version,
                                       const std::vector<uint8_t>& payload) {
    std::string path = getPayloadPath(version);
    if (fs::exists(path)) {
        return false;
    }
    writeFileAtomically(path, reinterpret_cast<const char*>(payload.data()), payload.size());
    return true;
}

void FileCheckpointStore::publishLatest(uint64_t version) {
    std::string text = std::to_string(version) + "\n";
    writeFileAtomically(directory_ + "/" + LATEST_FILE, text.data(), text.size());
}

std::optional<uint64_t> FileCheckpointStore::latestVersion() const {
    std::ifstream in(directory_ + "/" + LATEST_FILE);
    if (!in.is_open()) {
        return std::nullopt;
    }
    uint64_t version = 0;
    if (!(in >> version)) {
        std::cerr << "FileCheckpointStore: unreadable LATEST pointer in " << directory_
                  << std::endl;
        return std::nullopt;
    }
    return version;
}

std::vector<uint64_t> FileCheckpointStore::listVersions() const {
    std::vector<uint64_t> versions;
    std::error_code ec;
    const std::string prefix = PAYLOAD_PREFIX;
    const std::string suffix = PAYLOAD_SUFFIX;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() + suffix.size() ||
            name.compare(0, prefix.size(), prefix) != 0 ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string digits = name.substr(prefix.size(),
                                         name.size() - prefix.size() - suffix.size());
        if (digits.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        versions.push_back(std::stoull(digits));
    }
    std::sort(versions.begin(), versions.end());
    return versions;
}

std::optional<std::vector<uint8_t>> FileCheckpointStore::readPayload(uint64_t version) const {
    std::ifstream in(getPayloadPath(version), std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    return data;
}

bool FileCheckpointStore::deleteVersion(uint64_t version) {
    std::error_code ec;
    return fs::remove(getPayloadPath(version), ec);
}

void FileCheckpointStore::writeFileAtomically(const std::string& path, const char* data,
                                              size_t size) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw CheckpointWriteFailed("cannot open " + tmp_path);
        }
        out.write(data, static_cast<std::streamsize>(size));
        out.flush();
        if (!out) {
            throw CheckpointWriteFailed("write to " + tmp_path + " failed");
        }
    }

    std::error_code ec;
    try {
        syncPath(tmp_path, false);
    } catch (const CheckpointWriteFailed&) {
        fs::remove(tmp_path, ec);
        throw;
    }

    // The old file is replaced only once the new contents are on disk
    fs::rename(tmp_path, path, ec);
    if (ec) {
        fs::remove(tmp_path, ec);
        throw CheckpointWriteFailed("cannot rename " + tmp_path + " to " + path);
    }
    syncPath(directory_, true);
}

// ========== InMemoryCheckpointStore ==========

bool InMemoryCheckpointStore::writePayload(uint64_t version,
                                           const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_ > 0) {
        fail_writes_--;
        throw CheckpointWriteFailed("injected payload write failure");
    }
    return payloads_.emplace(version, payload).second;
}

void InMemoryCheckpointStore::publishLatest(uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_publishes_ > 0) {
        fail_publishes_--;
        throw CheckpointWriteFailed("injected pointer publish failure");
    }
    latest_ = version;
}

std::optional<uint64_t> InMemoryCheckpointStore::latestVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::vector<uint64_t> InMemoryCheckpointStore::listVersions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> versions;
    for (const auto& [version, payload] : payloads_) {
        versions.push_back(version);
    }
    return versions;
}

std::optional<std::vector<uint8_t>> InMemoryCheckpointStore::readPayload(
    uint64_t version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = payloads_.find(version);
    if (it == payloads_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryCheckpointStore::deleteVersion(uint64_t version) {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_.erase(version) > 0;
}

void InMemoryCheckpointStore::failNextWrites(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = count;
}

void InMemoryCheckpointStore::failNextPublishes(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_publishes_ = count;
}

void InMemoryCheckpointStore::overwritePayload(uint64_t version,
                                               const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    payloads_[version] = payload;
}

} // namespace io
} // namespace shopstream

#include "peerdrop/storage/resume_store.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/base/utils.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace peerdrop {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* CHECKPOINT_EXTENSION = ".resume";

json checkpoint_to_json(const ResumeCheckpoint& cp) {
    return {
        {"transferId", cp.transfer_id},
        {"fileId", cp.file_id},
        {"fileName", cp.file_name},
        {"fileSize", cp.file_size},
        {"byteOffset", cp.byte_offset},
        {"chunkIndex", cp.chunk_index},
        {"savedAt", cp.saved_at}
    };
}

ResumeCheckpoint checkpoint_from_json(const json& j) {
    ResumeCheckpoint cp;
    cp.transfer_id = j.at("transferId").get<std::string>();
    cp.file_id = j.value("fileId", std::string());
    cp.file_name = j.value("fileName", std::string());
    cp.file_size = j.value("fileSize", uint64_t{0});
    cp.byte_offset = j.at("byteOffset").get<uint64_t>();
    cp.chunk_index = j.at("chunkIndex").get<uint32_t>();
    cp.saved_at = j.value("savedAt", uint64_t{0});
    return cp;
}

} // anonymous namespace

size_t ResumeStore::collect_garbage(std::chrono::milliseconds max_age, uint64_t now_ms) {
    if (now_ms == 0) {
        now_ms = current_time_ms();
    }
    size_t removed = 0;
    for (const auto& cp : list()) {
        if (cp.saved_at + static_cast<uint64_t>(max_age.count()) < now_ms) {
            if (remove(cp.transfer_id)) {
                removed++;
            }
        }
    }
    if (removed > 0) {
        Logger::instance().info("Discarded " + std::to_string(removed) + " stale resume checkpoint(s)");
    }
    return removed;
}

std::optional<ResumeCheckpoint> MemoryResumeStore::get(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = checkpoints_.find(transfer_id);
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryResumeStore::put(const ResumeCheckpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkpoints_[checkpoint.transfer_id] = checkpoint;
    return true;
}

bool MemoryResumeStore::remove(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkpoints_.erase(transfer_id) > 0;
}

std::vector<ResumeCheckpoint> MemoryResumeStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResumeCheckpoint> out;
    out.reserve(checkpoints_.size());
    for (const auto& [id, cp] : checkpoints_) {
        out.push_back(cp);
    }
    return out;
}

FileResumeStore::FileResumeStore(fs::path directory)
    : directory_(std::move(directory)) {}

bool FileResumeStore::initialize() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        Logger::instance().error("Cannot create checkpoint directory " + directory_.string() + ": " + ec.message());
        return false;
    }
    Logger::instance().info("Resume checkpoints stored in " + directory_.string());
    return true;
}

fs::path FileResumeStore::path_for(const std::string& transfer_id) const {
    return directory_ / (sanitize_file_name(transfer_id) + CHECKPOINT_EXTENSION);
}

std::optional<ResumeCheckpoint> FileResumeStore::read_file(const fs::path& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        Logger::instance().warning("Corrupt checkpoint file: " + path.string());
        return std::nullopt;
    }
    try {
        return checkpoint_from_json(j);
    } catch (const json::exception& e) {
        Logger::instance().warning("Invalid checkpoint " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<ResumeCheckpoint> FileResumeStore::get(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cp = read_file(path_for(transfer_id));
    if (cp && cp->transfer_id != transfer_id) {
        return std::nullopt;
    }
    return cp;
}

bool FileResumeStore::put(const ResumeCheckpoint& checkpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path = path_for(checkpoint.transfer_id);
    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            Logger::instance().error("Failed to write checkpoint " + tmp.string());
            return false;
        }
        file << checkpoint_to_json(checkpoint).dump();
        if (!file.good()) {
            Logger::instance().error("Failed to write checkpoint " + tmp.string());
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        Logger::instance().error("Failed to commit checkpoint " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileResumeStore::remove(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::remove(path_for(transfer_id), ec);
}

std::vector<ResumeCheckpoint> FileResumeStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResumeCheckpoint> out;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == CHECKPOINT_EXTENSION) {
            if (auto cp = read_file(entry.path())) {
                out.push_back(std::move(*cp));
            }
        }
    }
    return out;
}

} // namespace peerdrop

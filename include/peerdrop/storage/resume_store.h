#ifndef PEERDROP_STORAGE_RESUME_STORE_H
#define PEERDROP_STORAGE_RESUME_STORE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop {

struct ResumeCheckpoint {
    std::string transfer_id;
    std::string file_id;
    std::string file_name;
    uint64_t file_size = 0;
    uint64_t byte_offset = 0;
    uint32_t chunk_index = 0;
    uint64_t saved_at = 0;      // ms since epoch
};

// Key-value persistence of checkpoints, keyed by transfer id
class ResumeStore {
public:
    virtual ~ResumeStore() = default;

    virtual std::optional<ResumeCheckpoint> get(const std::string& transfer_id) const = 0;
    virtual bool put(const ResumeCheckpoint& checkpoint) = 0;
    virtual bool remove(const std::string& transfer_id) = 0;
    virtual std::vector<ResumeCheckpoint> list() const = 0;

    // Drop checkpoints saved more than max_age ago; returns how many went
    size_t collect_garbage(std::chrono::milliseconds max_age, uint64_t now_ms = 0);
};

class MemoryResumeStore : public ResumeStore {
public:
    std::optional<ResumeCheckpoint> get(const std::string& transfer_id) const override;
    bool put(const ResumeCheckpoint& checkpoint) override;
    bool remove(const std::string& transfer_id) override;
    std::vector<ResumeCheckpoint> list() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ResumeCheckpoint> checkpoints_;
};

// One JSON document per transfer in a directory
class FileResumeStore : public ResumeStore {
public:
    explicit FileResumeStore(std::filesystem::path directory);

    // Creates the directory; false when it cannot be used
    bool initialize();

    std::optional<ResumeCheckpoint> get(const std::string& transfer_id) const override;
    bool put(const ResumeCheckpoint& checkpoint) override;
    bool remove(const std::string& transfer_id) override;
    std::vector<ResumeCheckpoint> list() const override;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path path_for(const std::string& transfer_id) const;
    std::optional<ResumeCheckpoint> read_file(const std::filesystem::path& path) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace peerdrop

#endif // PEERDROP_STORAGE_RESUME_STORE_H

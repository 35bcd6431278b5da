#ifndef PEERDROP_TRANSFER_FILE_SOURCE_H
#define PEERDROP_TRANSFER_FILE_SOURCE_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

// Random-access byte source for an upload. One instance per session.
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual uint64_t size() const = 0;

    // Reads [offset, offset + length) clipped to the end of the file
    virtual std::optional<std::vector<uint8_t>> read(uint64_t offset, uint32_t length) = 0;

    // Drop any held handle; later reads may reopen
    virtual void release() {}
};

class DiskFileSource : public FileSource {
public:
    explicit DiskFileSource(std::filesystem::path path);
    ~DiskFileSource() override;

    uint64_t size() const override { return size_; }
    std::optional<std::vector<uint8_t>> read(uint64_t offset, uint32_t length) override;
    void release() override;

private:
    std::filesystem::path path_;
    uint64_t size_ = 0;
    std::unique_ptr<std::ifstream> stream_;
    std::mutex mutex_;
};

class MemoryFileSource : public FileSource {
public:
    explicit MemoryFileSource(std::shared_ptr<const std::vector<uint8_t>> data);

    uint64_t size() const override { return data_->size(); }
    std::optional<std::vector<uint8_t>> read(uint64_t offset, uint32_t length) override;

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
};

// Hex SHA-256 of a whole buffer / source
std::string compute_checksum(const std::vector<uint8_t>& data);
std::optional<std::string> compute_checksum(FileSource& source);

} // namespace peerdrop

#endif // PEERDROP_TRANSFER_FILE_SOURCE_H

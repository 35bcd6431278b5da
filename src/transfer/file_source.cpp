#include "peerdrop/transfer/file_source.h"
#include "peerdrop/base/logger.h"
#include <elio/hash/sha256.hpp>
#include <algorithm>

namespace peerdrop {

DiskFileSource::DiskFileSource(std::filesystem::path path)
    : path_(std::move(path)) {
    std::error_code ec;
    size_ = std::filesystem::file_size(path_, ec);
    if (ec) {
        Logger::instance().warning("Cannot stat " + path_.string() + ": " + ec.message());
        size_ = 0;
    }
}

DiskFileSource::~DiskFileSource() {
    release();
}

std::optional<std::vector<uint8_t>> DiskFileSource::read(uint64_t offset, uint32_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset > size_) {
        return std::nullopt;
    }
    if (!stream_) {
        stream_ = std::make_unique<std::ifstream>(path_, std::ios::binary);
        if (!stream_->is_open()) {
            Logger::instance().error("Failed to open " + path_.string());
            stream_.reset();
            return std::nullopt;
        }
    }

    uint64_t count = std::min<uint64_t>(length, size_ - offset);
    std::vector<uint8_t> data(count);
    stream_->clear();
    stream_->seekg(static_cast<std::streamoff>(offset));
    if (count > 0) {
        stream_->read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(count));
        if (static_cast<uint64_t>(stream_->gcount()) != count) {
            Logger::instance().error("Short read from " + path_.string() + " at offset " + std::to_string(offset));
            return std::nullopt;
        }
    }
    return data;
}

void DiskFileSource::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
}

MemoryFileSource::MemoryFileSource(std::shared_ptr<const std::vector<uint8_t>> data)
    : data_(std::move(data)) {}

std::optional<std::vector<uint8_t>> MemoryFileSource::read(uint64_t offset, uint32_t length) {
    if (offset > data_->size()) {
        return std::nullopt;
    }
    uint64_t count = std::min<uint64_t>(length, data_->size() - offset);
    auto begin = data_->begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(count));
}

std::string compute_checksum(const std::vector<uint8_t>& data) {
    auto digest = elio::hash::sha256(data.data(), data.size());
    return elio::hash::sha256_hex(digest);
}

std::optional<std::string> compute_checksum(FileSource& source) {
    auto data = source.read(0, static_cast<uint32_t>(std::min<uint64_t>(source.size(), UINT32_MAX)));
    if (!data || data->size() != source.size()) {
        return std::nullopt;
    }
    return compute_checksum(*data);
}

} // namespace peerdrop

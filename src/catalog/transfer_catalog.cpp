#include "peerdrop/catalog/transfer_catalog.h"
#include "peerdrop/base/logger.h"
#include "peerdrop/base/utils.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <unordered_map>

namespace peerdrop {

namespace {

struct LocalShare {
    FileManifestEntry entry;
    std::filesystem::path path;                          // empty for in-memory shares
    std::shared_ptr<const std::vector<uint8_t>> data;
};

} // anonymous namespace

struct TransferCatalog::Impl {
    std::string local_peer_id;
    mutable std::mutex mutex;
    std::unordered_map<std::string, LocalShare> local;
    std::unordered_map<std::string, FileManifestEntry> remote;
};

TransferCatalog::TransferCatalog(std::string local_peer_id)
    : impl_(std::make_unique<Impl>()) {
    impl_->local_peer_id = std::move(local_peer_id);
}

TransferCatalog::~TransferCatalog() = default;

const std::string& TransferCatalog::local_peer_id() const {
    return impl_->local_peer_id;
}

std::optional<FileManifestEntry> TransferCatalog::share_file(const std::filesystem::path& path,
                                                             uint64_t checksum_max_bytes) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        Logger::instance().error("Cannot share " + path.string() + ": not a regular file");
        return std::nullopt;
    }

    LocalShare share;
    share.path = path;
    share.entry.id = generate_id("file");
    share.entry.name = path.filename().string();
    share.entry.byte_size = std::filesystem::file_size(path, ec);
    if (ec) {
        Logger::instance().error("Cannot share " + path.string() + ": " + ec.message());
        return std::nullopt;
    }
    share.entry.mime_type = guess_mime_type(share.entry.name);
    share.entry.advertised_at = current_time_ms();
    share.entry.owner_peer_id = impl_->local_peer_id;

    if (checksum_max_bytes > 0 && share.entry.byte_size <= checksum_max_bytes) {
        DiskFileSource source(path);
        auto checksum = compute_checksum(source);
        if (!checksum) {
            Logger::instance().error("Cannot share " + path.string() + ": read failed");
            return std::nullopt;
        }
        share.entry.checksum = *checksum;
    }

    Logger::instance().info("Sharing {} as {} ({} bytes, {})",
                            path.string(), share.entry.id, share.entry.byte_size, share.entry.mime_type);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto entry = share.entry;
    impl_->local[entry.id] = std::move(share);
    return entry;
}

FileManifestEntry TransferCatalog::share_bytes(const std::string& name,
                                               std::vector<uint8_t> data,
                                               const std::string& mime_type,
                                               bool with_checksum) {
    LocalShare share;
    share.entry.id = generate_id("file");
    share.entry.name = name;
    share.entry.byte_size = data.size();
    share.entry.mime_type = mime_type.empty() ? guess_mime_type(name) : mime_type;
    share.entry.advertised_at = current_time_ms();
    share.entry.owner_peer_id = impl_->local_peer_id;
    if (with_checksum) {
        share.entry.checksum = compute_checksum(data);
    }
    share.data = std::make_shared<const std::vector<uint8_t>>(std::move(data));

    Logger::instance().debug("Sharing buffer {} as {} ({} bytes)", name, share.entry.id, share.entry.byte_size);

    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto entry = share.entry;
    impl_->local[entry.id] = std::move(share);
    return entry;
}

bool TransferCatalog::unshare(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->local.erase(file_id) > 0;
}

std::vector<FileManifestEntry> TransferCatalog::local_files() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<FileManifestEntry> result;
    result.reserve(impl_->local.size());
    for (const auto& [id, share] : impl_->local) {
        result.push_back(share.entry);
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.advertised_at != b.advertised_at ? a.advertised_at < b.advertised_at : a.id < b.id;
    });
    return result;
}

std::optional<FileManifestEntry> TransferCatalog::find_local(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->local.find(file_id);
    if (it == impl_->local.end()) {
        return std::nullopt;
    }
    return it->second.entry;
}

std::shared_ptr<FileSource> TransferCatalog::open_local(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->local.find(file_id);
    if (it == impl_->local.end()) {
        return nullptr;
    }
    if (it->second.data) {
        return std::make_shared<MemoryFileSource>(it->second.data);
    }
    return std::make_shared<DiskFileSource>(it->second.path);
}

bool TransferCatalog::merge_remote(const FileManifestEntry& entry, const std::string& from_peer) {
    if (entry.id.empty()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->local.count(entry.id)) {
        return false;
    }
    auto stored = entry;
    if (stored.owner_peer_id.empty()) {
        stored.owner_peer_id = from_peer;
    }
    impl_->remote[stored.id] = std::move(stored);
    return true;
}

size_t TransferCatalog::merge_remote(const std::vector<FileManifestEntry>& entries, const std::string& from_peer) {
    size_t merged = 0;
    for (const auto& entry : entries) {
        if (merge_remote(entry, from_peer)) {
            merged++;
        }
    }
    return merged;
}

size_t TransferCatalog::remove_peer(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t removed = 0;
    for (auto it = impl_->remote.begin(); it != impl_->remote.end();) {
        if (it->second.owner_peer_id == peer_id) {
            it = impl_->remote.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        Logger::instance().debug("Catalog dropped {} entries of {}", removed, peer_id);
    }
    return removed;
}

std::optional<FileManifestEntry> TransferCatalog::find_remote(const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->remote.find(file_id);
    if (it == impl_->remote.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileManifestEntry> TransferCatalog::available_downloads() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<FileManifestEntry> result;
    for (const auto& [id, entry] : impl_->remote) {
        if (!impl_->local.count(id)) {
            result.push_back(entry);
        }
    }
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return a.advertised_at != b.advertised_at ? a.advertised_at < b.advertised_at : a.id < b.id;
    });
    return result;
}

size_t TransferCatalog::local_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->local.size();
}

size_t TransferCatalog::remote_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->remote.size();
}

std::string guess_mime_type(const std::string& file_name) {
    static const std::map<std::string, std::string> types = {
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"js", "application/javascript"},
        {"json", "application/json"},
        {"xml", "application/xml"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"wav", "audio/wav"},
        {"ogg", "audio/ogg"},
        {"mp4", "video/mp4"},
        {"webm", "video/webm"},
        {"mkv", "video/x-matroska"},
    };

    auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "application/octet-stream";
    }
    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

} // namespace peerdrop

#ifndef PEERDROP_CATALOG_TRANSFER_CATALOG_H
#define PEERDROP_CATALOG_TRANSFER_CATALOG_H

#include "peerdrop/protocol/control_message.h"
#include "peerdrop/transfer/file_source.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop {

// Local shares and the entries peers advertise to us, merged by id
class TransferCatalog {
public:
    explicit TransferCatalog(std::string local_peer_id);
    ~TransferCatalog();

    const std::string& local_peer_id() const;

    // Share a file from disk. Computes the checksum when the file is at most
    // checksum_max_bytes (0 disables it).
    std::optional<FileManifestEntry> share_file(const std::filesystem::path& path,
                                                uint64_t checksum_max_bytes = 0);

    // Share an in-memory buffer
    FileManifestEntry share_bytes(const std::string& name,
                                  std::vector<uint8_t> data,
                                  const std::string& mime_type = "",
                                  bool with_checksum = true);

    bool unshare(const std::string& file_id);

    std::vector<FileManifestEntry> local_files() const;
    std::optional<FileManifestEntry> find_local(const std::string& file_id) const;

    // Fresh reader over a local share; null when the id is not shared here
    std::shared_ptr<FileSource> open_local(const std::string& file_id) const;

    // Last write wins by id. Returns false for entries we own ourselves.
    bool merge_remote(const FileManifestEntry& entry, const std::string& from_peer);
    size_t merge_remote(const std::vector<FileManifestEntry>& entries, const std::string& from_peer);

    // Drops everything a peer advertised; returns how many entries went away
    size_t remove_peer(const std::string& peer_id);

    std::optional<FileManifestEntry> find_remote(const std::string& file_id) const;

    // Remote entries not shared locally, oldest advertisement first
    std::vector<FileManifestEntry> available_downloads() const;

    size_t local_count() const;
    size_t remote_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// MIME type from a file name's extension
std::string guess_mime_type(const std::string& file_name);

} // namespace peerdrop

#endif // PEERDROP_CATALOG_TRANSFER_CATALOG_H

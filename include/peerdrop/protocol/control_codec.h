#ifndef PEERDROP_PROTOCOL_CONTROL_CODEC_H
#define PEERDROP_PROTOCOL_CONTROL_CODEC_H

#include "peerdrop/protocol/control_message.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace peerdrop {

using json = nlohmann::json;

// JSON text encoding of control messages. Every message is an object
// carrying a "type" tag; binary payloads never pass through here.
class ControlCodec {
public:
    static std::string encode(const ControlMessage& message);
    static json to_json(const ControlMessage& message);

    // Returns nullopt for malformed JSON, unknown types or missing fields
    static std::optional<ControlMessage> decode(const std::string& text, std::string* error = nullptr);
    static std::optional<ControlMessage> from_json(const json& j, std::string* error = nullptr);
};

json manifest_to_json(const FileManifestEntry& entry);
FileManifestEntry manifest_from_json(const json& j);

} // namespace peerdrop

#endif // PEERDROP_PROTOCOL_CONTROL_CODEC_H

#include "peerdrop/base/utils.h"
#include <chrono>
#include <mutex>
#include <random>

namespace peerdrop {

uint64_t current_time_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string generate_id(const std::string& prefix) {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static std::mutex mutex;
    static std::mt19937_64 rng(std::random_device{}());

    std::string suffix(9, '0');
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);
        for (auto& c : suffix) {
            c = alphabet[dist(rng)];
        }
    }
    return prefix + "_" + std::to_string(current_time_ms()) + "_" + suffix;
}

std::string sanitize_file_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                    c == '-' || c == '_' || c == '.';
        out.push_back(safe ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") {
        out = "unnamed";
    }
    return out;
}

} // namespace peerdrop

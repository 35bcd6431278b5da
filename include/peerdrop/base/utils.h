#ifndef PEERDROP_BASE_UTILS_H
#define PEERDROP_BASE_UTILS_H

#include <cstdint>
#include <string>

namespace peerdrop {

// Wall clock, milliseconds since epoch
uint64_t current_time_ms();

// "<prefix>_<ms>_<random>", e.g. file_1718000000000_k3j9x2a1b
std::string generate_id(const std::string& prefix);

// Replace characters that are unsafe in file names
std::string sanitize_file_name(const std::string& name);

} // namespace peerdrop

#endif // PEERDROP_BASE_UTILS_H

#pragma once

#include "types.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace raw_view::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();

// Worker count for a parallel pass: requested, capped by the CPU count and
// the number of tasks, never below one.
int compute_worker_count(int requested, size_t task_count);

// String utilities
std::string to_lower(const std::string& s);
std::vector<std::string> split(const std::string& str, char delimiter);

// Lower-case extension without the dot ("NEF" -> "nef").
std::string extension_of(const fs::path& path);

// Approximate resident size of an image in MiB.
uint64_t memory_footprint_mib(int width, int height, int bytes_per_pixel);

} // namespace raw_view::core

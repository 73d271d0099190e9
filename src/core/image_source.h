#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "errors.h"
#include "image.h"

namespace collager::core {

namespace fs = std::filesystem;

constexpr uintmax_t k_max_file_bytes = 1000000000; // 1GB limit

enum class InputType { Directory, Archive, Unknown };

InputType detect_input_type(const fs::path& path);

struct ArchiveEntry {
    std::string name;
    std::vector<unsigned char> bytes;
};

struct LoadResult {
    std::vector<ImagePtr> images;
    size_t candidates = 0;
    size_t skipped = 0;  // files that did not decode
};

// Every regular file below dir, recursively, sorted by path.
bool collect_directory_files(const fs::path& dir, std::vector<fs::path>& out, Error& error);

// Regular file entries of a tar (optionally compressed) archive, in archive
// order. Entries without a name or above max_entry_bytes are listed with no
// bytes.
bool read_archive_entries(const fs::path& archive_path,
                          std::vector<ArchiveEntry>& out,
                          Error& error,
                          uintmax_t max_entry_bytes = k_max_file_bytes);

// Decodes every candidate of a directory or archive, one unit of work per
// file spread over a worker pool. Files that fail to decode are dropped and
// counted in LoadResult::skipped; a missing input or a failed walk is a
// TraversalError.
bool load_images(const fs::path& input, unsigned int threads, LoadResult& out, Error& error);

} // namespace collager::core

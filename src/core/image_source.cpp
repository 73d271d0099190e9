#include "image_source.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <functional>
#include <system_error>
#include <thread>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

#include "collage_driver.h"
#include "image_codec.h"

namespace collager::core {
namespace {

constexpr size_t k_archive_block_size = 10240;

std::string lower_filename(const fs::path& path) {
    std::string name = path.filename().string();
    std::ranges::transform(name, name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

bool has_suffix(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_archive_name(const std::string& name) {
    return has_suffix(name, ".tar") || has_suffix(name, ".tar.gz") || has_suffix(name, ".tgz") ||
           has_suffix(name, ".tar.bz2") || has_suffix(name, ".tbz2") || has_suffix(name, ".tar.xz") ||
           has_suffix(name, ".txz");
}

// Runs decode(idx, slot) for every index on a pool of workers and keeps the
// successful slots in index order.
void decode_all(size_t count,
                unsigned int threads,
                const std::function<bool(size_t, ImagePtr&)>& decode,
                LoadResult& out) {
    std::vector<ImagePtr> slots(count);
    const unsigned int worker_count = resolve_worker_count(threads, count);

    std::atomic<size_t> next_index{0};
    auto work = [&]() {
        while (true) {
            const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
            if (idx >= count) {
                break;
            }
            ImagePtr image;
            if (decode(idx, image)) {
                slots[idx] = std::move(image);
            }
        }
    };

    if (worker_count <= 1) {
        work();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (unsigned int i = 0; i < worker_count; ++i) {
            workers.emplace_back(work);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    out.candidates = count;
    out.skipped = 0;
    out.images.clear();
    for (auto& slot : slots) {
        if (slot) {
            out.images.push_back(std::move(slot));
        } else {
            ++out.skipped;
        }
    }
}

} // namespace

InputType detect_input_type(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return InputType::Directory;
    }
    if (fs::is_regular_file(path, ec) && is_archive_name(lower_filename(path))) {
        return InputType::Archive;
    }
    return InputType::Unknown;
}

bool collect_directory_files(const fs::path& dir, std::vector<fs::path>& out, Error& error) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec) {
        error.set(ErrorCode::TraversalError, "Failed to read directory " + dir.string() + ": " + ec.message());
        return false;
    }

    std::vector<fs::path> files;
    const fs::recursive_directory_iterator end_it = fs::end(it);
    while (it != end_it) {
        std::error_code status_ec;
        if (it->is_regular_file(status_ec)) {
            files.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            break;
        }
    }
    if (ec) {
        error.set(ErrorCode::TraversalError, "Failed to walk directory " + dir.string() + ": " + ec.message());
        return false;
    }

    std::ranges::sort(files);
    out = std::move(files);
    return true;
}

bool read_archive_entries(const fs::path& archive_path,
                          std::vector<ArchiveEntry>& out,
                          Error& error,
                          uintmax_t max_entry_bytes) {
    struct archive* a = archive_read_new();
    if (a == nullptr) {
        error.set(ErrorCode::TraversalError, "Failed to create archive reader");
        return false;
    }
    archive_read_support_format_all(a);
    archive_read_support_filter_all(a);

    if (archive_read_open_filename(a, archive_path.string().c_str(), k_archive_block_size) != ARCHIVE_OK) {
        error.set(ErrorCode::TraversalError,
                  "Failed to open archive " + archive_path.string() + ": " + archive_error_string(a));
        archive_read_free(a);
        return false;
    }

    std::vector<ArchiveEntry> entries;
    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            error.set(ErrorCode::TraversalError, std::string("Failed to read archive header: ") + archive_error_string(a));
            ok = false;
            break;
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const char* name = archive_entry_pathname(entry);
        const la_int64_t declared = archive_entry_size(entry);
        if (name == nullptr || declared < 0 || static_cast<uintmax_t>(declared) > max_entry_bytes) {
            // Still a candidate; its empty payload fails to decode and is counted as skipped.
            entries.push_back(ArchiveEntry{name != nullptr ? name : "", {}});
            continue;
        }

        ArchiveEntry item;
        item.name = name;
        item.bytes.resize(static_cast<size_t>(declared));
        size_t filled = 0;
        while (filled < item.bytes.size()) {
            const la_ssize_t n = archive_read_data(a, item.bytes.data() + filled, item.bytes.size() - filled);
            if (n < 0) {
                error.set(ErrorCode::TraversalError, std::string("Failed to read archive data: ") + archive_error_string(a));
                ok = false;
                break;
            }
            if (n == 0) {
                break;
            }
            filled += static_cast<size_t>(n);
        }
        if (!ok) {
            break;
        }
        item.bytes.resize(filled);
        entries.push_back(std::move(item));
    }

    archive_read_close(a);
    archive_read_free(a);
    if (!ok) {
        return false;
    }
    out = std::move(entries);
    return true;
}

bool load_images(const fs::path& input, unsigned int threads, LoadResult& out, Error& error) {
    switch (detect_input_type(input)) {
        case InputType::Directory: {
            std::vector<fs::path> files;
            if (!collect_directory_files(input, files, error)) {
                return false;
            }
            decode_all(files.size(), threads,
                       [&](size_t idx, ImagePtr& image) {
                           std::error_code ec;
                           const uintmax_t size = fs::file_size(files[idx], ec);
                           if (ec || size > k_max_file_bytes) {
                               return false;
                           }
                           Error decode_error;
                           return decode_image_file(files[idx], image, decode_error);
                       },
                       out);
            return true;
        }
        case InputType::Archive: {
            std::vector<ArchiveEntry> entries;
            if (!read_archive_entries(input, entries, error)) {
                return false;
            }
            decode_all(entries.size(), threads,
                       [&](size_t idx, ImagePtr& image) {
                           const ArchiveEntry& item = entries[idx];
                           Error decode_error;
                           return decode_image_memory(item.bytes.data(), item.bytes.size(), image, decode_error);
                       },
                       out);
            return true;
        }
        case InputType::Unknown:
            break;
    }
    error.set(ErrorCode::TraversalError, "Input is not a directory or tar archive: " + input.string());
    return false;
}

} // namespace collager::core

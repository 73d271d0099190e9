// collager.cpp
// MIT License (c) 2026 Pedro

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <fcntl.h>
#include <io.h>
#include <stdio.h>
#ifndef _O_BINARY
#define _O_BINARY 0x8000
#endif
#ifndef _fileno
#define _fileno fileno
#endif
#ifndef _setmode
#define _setmode setmode
#endif
#endif
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "commands.h"
#include "core/cli_parse.h"
#include "core/collage_driver.h"
#include "core/errors.h"
#include "core/geometry.h"
#include "core/image_codec.h"
#include "core/image_source.h"
#include "core/profile_config.h"

namespace fs = std::filesystem;

namespace {
using namespace collager::core;

constexpr size_t k_legacy_positional_count = 5;

struct Config {
    fs::path input_path;
    fs::path output_path;
    std::optional<Shape> shape;
    std::optional<int> rows;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<unsigned int> threads;
    std::optional<DrawMode> draw_mode;
    std::optional<Color> background;
    std::string profile_name;
    std::string profiles_config_path;
    bool verbose = false;
};

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

void print_usage() {
    std::cout << "Usage: collager <Rectangle|Circle> <rows> <width> <height> <folder|archive> [OPTIONS]\n"
              << "       collager <folder|archive> [OPTIONS]\n"
              << "\n"
              << "Arrange every image found in a folder or tar archive into one collage and\n"
              << "write it as PNG to stdout (or --output PATH).\n"
              << "\n"
              << "Options:\n"
              << "  --shape rectangle|circle      Cell shape (default: rectangle)\n"
              << "  --rows N                      Number of rows\n"
              << "  --width N                     Target width used to size columns\n"
              << "  --height N                    Target height (validated, not used by the layout)\n"
              << "  --profile NAME                Load defaults from a profile\n"
              << "  --profiles-config PATH        Profile file to read\n"
              << "  -j, --threads N               Worker threads (default: auto)\n"
              << "  --draw-mode serial|joined|detached\n"
              << "                                How cells are dispatched (default: joined)\n"
              << "  --background R,G,B[,A]        Canvas colour (default: 0,0,0,255)\n"
              << "  -o, --output PATH             Write the PNG to PATH instead of stdout\n"
              << "  -v, --verbose                 Log counts and timings to stderr\n"
              << "  -h, --help                    Show this help message\n";
}

// Fills unset fields from the selected profile.
bool apply_profile(Config& config, const fs::path& exec_dir) {
    std::vector<ProfileDefinition> profiles;
    std::vector<std::string> tried;
    bool loaded = false;
    for (const fs::path& candidate : profiles_config_candidates(config.profiles_config_path, exec_dir)) {
        std::error_code ec;
        if (!fs::exists(candidate, ec) || ec) {
            tried.push_back(candidate.string());
            continue;
        }
        std::string config_error;
        if (!load_profiles_config_from_file(candidate, profiles, config_error)) {
            std::cerr << "Failed to load profile config (" << candidate << "): " << config_error << "\n";
            return false;
        }
        loaded = true;
        break;
    }
    if (!loaded) {
        std::cerr << "Failed to load profile config. Tried:";
        for (const std::string& candidate : tried) {
            std::cerr << " " << candidate;
        }
        std::cerr << "\n";
        return false;
    }

    const ProfileDefinition* profile = find_profile(profiles, config.profile_name);
    if (profile == nullptr) {
        std::string available;
        for (size_t idx = 0; idx < profiles.size(); ++idx) {
            if (idx > 0) {
                available += ", ";
            }
            available += profiles[idx].name;
        }
        std::cerr << "Invalid profile '" << config.profile_name << "'. Available profiles: " << available << "\n";
        return false;
    }

    if (!config.shape) {
        config.shape = profile->shape;
    }
    if (!config.rows) {
        config.rows = profile->rows;
    }
    if (!config.width) {
        config.width = profile->width;
    }
    if (!config.height) {
        config.height = profile->height;
    }
    if (!config.threads) {
        config.threads = profile->threads;
    }
    if (!config.draw_mode) {
        config.draw_mode = profile->draw_mode;
    }
    if (!config.background) {
        config.background = profile->background;
    }
    return true;
}

void print_error(const Error& error) {
    std::cerr << "Error: " << error.message << " [" << error_code_name(error.code) << "]\n";
}

bool parse_positive_option(const std::string& name, const std::string& value, std::optional<int>& out) {
    int parsed = 0;
    if (!parse_positive_int(value, parsed)) {
        std::cerr << "Invalid " << name << " value: " << value << "\n";
        return false;
    }
    out = parsed;
    return true;
}

} // namespace

int run_collager(int argc, char** argv) {
    Config config;
    std::vector<std::string> positionals;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& value) {
            if (i + 1 >= argc) {
                std::cerr << "Error: Missing value for " << arg << "\n";
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--shape") {
            Shape shape = Shape::Rectangle;
            if (!next_value(value)) {
                return 1;
            }
            if (!parse_shape(value, shape)) {
                std::cerr << "Invalid shape value: " << value << "\n";
                return 1;
            }
            config.shape = shape;
        } else if (arg == "--rows") {
            if (!next_value(value) || !parse_positive_option("rows", value, config.rows)) {
                return 1;
            }
        } else if (arg == "--width") {
            if (!next_value(value) || !parse_positive_option("width", value, config.width)) {
                return 1;
            }
        } else if (arg == "--height") {
            if (!next_value(value) || !parse_positive_option("height", value, config.height)) {
                return 1;
            }
        } else if (arg == "--profile") {
            if (!next_value(config.profile_name)) {
                return 1;
            }
        } else if (arg == "--profiles-config") {
            if (!next_value(config.profiles_config_path)) {
                return 1;
            }
        } else if (arg == "-j" || arg == "--threads") {
            unsigned int threads = 0;
            if (!next_value(value)) {
                return 1;
            }
            if (!parse_non_negative_uint(value, threads)) {
                std::cerr << "Invalid thread count: " << value << "\n";
                return 1;
            }
            config.threads = threads;
        } else if (arg == "--draw-mode") {
            DrawMode mode = DrawMode::Joined;
            if (!next_value(value)) {
                return 1;
            }
            if (!parse_draw_mode(value, mode)) {
                std::cerr << "Invalid draw mode: " << value << "\n";
                return 1;
            }
            config.draw_mode = mode;
        } else if (arg == "--background") {
            Color color;
            if (!next_value(value)) {
                return 1;
            }
            if (!parse_color(value, color)) {
                std::cerr << "Invalid background color: " << value << "\n";
                std::cerr << "Expected format: R,G,B or R,G,B,A with 0-255 channels\n";
                return 1;
            }
            config.background = color;
        } else if (arg == "-o" || arg == "--output") {
            if (!next_value(value)) {
                return 1;
            }
            config.output_path = value;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            positionals.push_back(std::move(arg));
        }
    }

    if (positionals.size() == k_legacy_positional_count) {
        Shape shape = Shape::Rectangle;
        if (!parse_shape(positionals[0], shape)) {
            std::cerr << "Invalid shape value: " << positionals[0] << " (expected Rectangle or Circle)\n";
            return 1;
        }
        if (!config.shape) {
            config.shape = shape;
        }
        std::optional<int> rows;
        std::optional<int> width;
        std::optional<int> height;
        if (!parse_positive_option("rows", positionals[1], rows)
            || !parse_positive_option("width", positionals[2], width)
            || !parse_positive_option("height", positionals[3], height)) {
            return 1;
        }
        if (!config.rows) {
            config.rows = rows;
        }
        if (!config.width) {
            config.width = width;
        }
        if (!config.height) {
            config.height = height;
        }
        config.input_path = positionals[4];
    } else if (positionals.size() == 1) {
        config.input_path = positionals[0];
    } else {
        print_usage();
        return 1;
    }

    if (!config.profile_name.empty()) {
        fs::path exec_path(argv[0]);
        std::error_code ec;
        const fs::path cwd = fs::current_path(ec);
        if (exec_path.is_relative() && !cwd.empty()) {
            exec_path = cwd / exec_path;
        }
        fs::path exec_dir = exec_path.parent_path();
        if (exec_dir.empty()) {
            exec_dir = cwd;
        }
        if (!apply_profile(config, exec_dir)) {
            return 1;
        }
    }

    if (!config.rows || !config.width || !config.height) {
        std::cerr << "Error: rows, width and height are required (positionally, as options or from a profile)\n";
        return 1;
    }

    CompositeOptions options;
    options.shape = config.shape.value_or(Shape::Rectangle);
    options.target_width = *config.width;
    options.threads = config.threads.value_or(0);
    options.draw_mode = config.draw_mode.value_or(DrawMode::Joined);
    options.background = config.background.value_or(k_default_background);

    const auto reading_start = std::chrono::steady_clock::now();
    LoadResult loaded;
    Error error;
    if (!load_images(config.input_path, options.threads, loaded, error)) {
        print_error(error);
        return 1;
    }
    if (config.verbose) {
        std::cerr << loaded.images.size() << " images read in " << elapsed_ms(reading_start) << " ms";
        if (loaded.skipped > 0) {
            std::cerr << " (" << loaded.skipped << " files skipped)";
        }
        std::cerr << "\n";
    }

    const auto collage_start = std::chrono::steady_clock::now();
    CompositeJob job;
    if (!make_collage(std::move(loaded.images), *config.rows, *config.height, options, job, error)) {
        print_error(error);
        return 1;
    }
    if (job.draw_mode != options.draw_mode) {
        std::cerr << "Warning: cell rectangles overlap, drew " << draw_mode_name(job.draw_mode) << " instead of "
                  << draw_mode_name(options.draw_mode) << "\n";
    }
    if (job.draw_mode == DrawMode::Detached) {
        // Detached tasks may still be drawing; the canvas is only read once all have reported.
        job.progress->wait();
    }
    if (config.verbose) {
        std::cerr << "Making " << shape_name(options.shape) << " collage (" << job.canvas->width() << "x"
                  << job.canvas->height() << ", " << draw_mode_name(job.draw_mode) << ") took "
                  << elapsed_ms(collage_start) << " ms\n";
    }

    if (!config.output_path.empty()) {
        if (!write_png_file(*job.canvas, config.output_path, error)) {
            print_error(error);
            return 1;
        }
        return 0;
    }

#ifdef _WIN32
    if (_setmode(_fileno(stdout), _O_BINARY) == -1) {
        std::cerr << "Failed to set stdout to binary mode\n";
        return 1;
    }
#endif

    if (!encode_png(*job.canvas, std::cout, error)) {
        print_error(error);
        return 1;
    }
    std::cout.flush();
    return 0;
}

#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "canvas.h"
#include "collage_driver.h"
#include "geometry.h"

#ifndef COLLAGER_GLOBAL_PROFILE_CONFIG
#define COLLAGER_GLOBAL_PROFILE_CONFIG "/usr/local/share/collager/collagerprofiles.cfg"
#endif

namespace collager::core {

namespace fs = std::filesystem;

constexpr const char* k_profiles_config_filename = "collagerprofiles.cfg";
constexpr const char* k_user_profiles_config_relpath = ".config/collager/collagerprofiles.cfg";
constexpr const char* k_global_profiles_config_path = COLLAGER_GLOBAL_PROFILE_CONFIG;

struct ProfileDefinition {
    std::string name;
    std::optional<Shape> shape;
    std::optional<int> rows;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<unsigned int> threads;
    std::optional<DrawMode> draw_mode;
    std::optional<Color> background;
};

// [profile NAME] sections of key = value lines; '#' and ';' start comments.
bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error);

bool load_profiles_config_from_file(const fs::path& path, std::vector<ProfileDefinition>& out, std::string& error);

std::optional<fs::path> resolve_user_profiles_config_path();

// Explicit path when given, otherwise user, executable dir, then global.
std::vector<fs::path> profiles_config_candidates(const std::string& explicit_path, const fs::path& exec_dir);

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name);

} // namespace collager::core

#include "profile_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "cli_parse.h"

namespace collager::core {

bool parse_profiles_config(std::istream& input, std::vector<ProfileDefinition>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<ProfileDefinition> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }
        const std::string at_line = " at line " + std::to_string(line_number);

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(std::move(*current));
                current.reset();
            }
            std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header" + at_line;
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "'" + at_line;
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name" + at_line;
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header" + at_line;
                return false;
            }
            if (!seen_names.insert(name).second) {
                error = "duplicate profile '" + name + "'" + at_line;
                return false;
            }
            ProfileDefinition def;
            def.name = name;
            current = std::move(def);
            continue;
        }

        if (!current) {
            error = "entry outside of profile section" + at_line;
            return false;
        }

        const size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "'" + at_line;
            return false;
        }
        const std::string key = to_lower_copy(trim_copy(trimmed.substr(0, equals)));
        const std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key" + at_line;
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "'" + at_line;
            return false;
        }

        if (key == "shape") {
            Shape shape = Shape::Rectangle;
            if (!parse_shape(value, shape)) {
                error = "invalid shape '" + value + "'" + at_line;
                return false;
            }
            current->shape = shape;
        } else if (key == "rows" || key == "width" || key == "height") {
            int parsed = 0;
            if (!parse_positive_int(value, parsed)) {
                error = "invalid " + key + " '" + value + "'" + at_line;
                return false;
            }
            if (key == "rows") {
                current->rows = parsed;
            } else if (key == "width") {
                current->width = parsed;
            } else {
                current->height = parsed;
            }
        } else if (key == "threads") {
            unsigned int parsed = 0;
            if (!parse_non_negative_uint(value, parsed)) {
                error = "invalid threads '" + value + "'" + at_line;
                return false;
            }
            current->threads = parsed;
        } else if (key == "draw_mode") {
            DrawMode mode = DrawMode::Joined;
            if (!parse_draw_mode(value, mode)) {
                error = "invalid draw_mode '" + value + "'" + at_line;
                return false;
            }
            current->draw_mode = mode;
        } else if (key == "background") {
            Color color;
            if (!parse_color(value, color)) {
                error = "invalid background '" + value + "'" + at_line;
                return false;
            }
            current->background = color;
        } else {
            error = "unknown key '" + key + "'" + at_line;
            return false;
        }
    }

    if (current) {
        out.push_back(std::move(*current));
    }
    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_profiles_config_from_file(const fs::path& path, std::vector<ProfileDefinition>& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_profiles_config(input, out, error);
}

std::optional<fs::path> resolve_user_profiles_config_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_profiles_config_relpath;
}

std::vector<fs::path> profiles_config_candidates(const std::string& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        candidates.emplace_back(explicit_path);
        return candidates;
    }
    if (std::optional<fs::path> user_config = resolve_user_profiles_config_path()) {
        candidates.push_back(*user_config);
    }
    candidates.push_back(exec_dir / k_profiles_config_filename);
    candidates.emplace_back(k_global_profiles_config_path);
    return candidates;
}

const ProfileDefinition* find_profile(const std::vector<ProfileDefinition>& profiles, const std::string& name) {
    for (const auto& def : profiles) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

} // namespace collager::core

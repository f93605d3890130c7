#include "models/model_scanner.h"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "models/metadata_reader.h"
#include "utils/text.h"

namespace fs = std::filesystem;

namespace loradeck {

namespace {

// "/a/b/" and "/a/b" both name folder "b".
std::string root_folder_name(const fs::path& root) {
    auto normal = root.lexically_normal();
    auto name = normal.filename().string();
    if (name.empty()) {
        name = normal.parent_path().filename().string();
    }
    return name;
}

std::string join_segments(const std::vector<std::string>& segments) {
    std::string out;
    for (const auto& segment : segments) {
        if (!out.empty()) out += '/';
        out += segment;
    }
    return out;
}

// Node under which a card sits when source trees are merged: the base model,
// or "<root> (Unmerged)" when it is blank or UNKNOWN.
std::string merged_base_node(const std::string& base_model) {
    auto base = trim_ascii(base_model);
    if (base.empty() || equals_ignore_case(base, "UNKNOWN")) return {};
    return base;
}

}  // namespace

ModelScanner::ModelScanner(ScanOptions options) : options_(std::move(options)) {}

bool ModelScanner::is_model_file(const std::string& path) const {
    const auto ext = fs::path(path).extension().string();
    if (ext.empty()) return false;
    return std::any_of(options_.extensions.begin(), options_.extensions.end(),
                       [&](const std::string& candidate) { return equals_ignore_case(ext, candidate); });
}

std::vector<CardSeed> ModelScanner::scan(const std::string& source_root) const {
    std::vector<CardSeed> seeds;
    const fs::path root(source_root);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::warn("ModelScanner::scan: source folder not found: {}", source_root);
        return seeds;
    }

    std::vector<std::pair<std::string, fs::path>> files;
    try {
        for (const auto& entry : fs::recursive_directory_iterator(
                 root, fs::directory_options::skip_permission_denied)) {
            std::error_code file_ec;
            if (!entry.is_regular_file(file_ec) || file_ec) continue;
            if (!is_model_file(entry.path().string())) continue;
            auto relative = entry.path().lexically_relative(root).generic_string();
            files.emplace_back(std::move(relative), entry.path());
        }
    } catch (const fs::filesystem_error& ex) {
        spdlog::warn("ModelScanner::scan: stopped walking {}: {}", source_root, ex.what());
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    const auto root_name = root_folder_name(root);
    seeds.reserve(files.size());
    for (const auto& [relative, path] : files) {
        CardSeed seed;
        seed.model = read_model_record(path);
        seed.source_path = source_root;
        seed.folder_path = path.parent_path().string();

        std::vector<std::string> folders;
        for (const auto& part : fs::path(relative).parent_path()) {
            auto segment = part.string();
            if (!segment.empty() && segment != ".") folders.push_back(std::move(segment));
        }

        auto first_folder = folders.begin();
        if (options_.merge_sources) {
            const auto base = merged_base_node(seed.model.base_model);
            if (base.empty()) {
                seed.tree_segments.push_back(
                    (root_name.empty() ? source_root : root_name) + " (Unmerged)");
            } else {
                seed.tree_segments.push_back(base);
                // "<root>/SDXL/x" under base SDXL is not nested twice.
                if (first_folder != folders.end() && equals_ignore_case(*first_folder, base)) {
                    ++first_folder;
                }
            }
        } else if (!root_name.empty()) {
            seed.tree_segments.push_back(root_name);
        }
        seed.tree_segments.insert(seed.tree_segments.end(), first_folder, folders.end());
        seed.tree_path = join_segments(seed.tree_segments);
        seeds.push_back(std::move(seed));
    }

    spdlog::debug("ModelScanner::scan: found {} model files under {}", seeds.size(), source_root);
    return seeds;
}

std::vector<CardSeed> ModelScanner::scan_all(const std::vector<std::string>& source_roots) const {
    std::vector<CardSeed> seeds;
    for (const auto& root : source_roots) {
        auto found = scan(root);
        seeds.insert(seeds.end(), std::make_move_iterator(found.begin()),
                     std::make_move_iterator(found.end()));
    }
    return seeds;
}

}  // namespace loradeck

#include "models/metadata_reader.h"

#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "utils/json_utils.h"
#include "utils/text.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace loradeck {

namespace {

bool is_existing_file(const fs::path& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) return false;
    return st.type() == fs::file_type::regular;
}

void assign_if_present(std::string& field, const std::optional<std::string>& value) {
    if (value && !is_blank(*value)) field = trim_ascii(*value);
}

// Civitai model-version payload as saved by Civitai helper extensions.
void apply_civitai_info(const json& j, ModelRecord& record) {
    assign_if_present(record.model_id, find_text(j, {"modelId"}));
    if (record.model_id.empty()) {
        assign_if_present(record.model_id, find_text(j, {"model", "id"}));
    }
    assign_if_present(record.base_model, find_text(j, {"baseModel"}));
    assign_if_present(record.version_name, find_text(j, {"name"}));
    if (record.version_name.empty()) {
        assign_if_present(record.version_name, find_text(j, {"model", "name"}));
    }
    assign_if_present(record.model_type, find_text(j, {"model", "type"}));
    if (record.model_type.empty()) {
        assign_if_present(record.model_type, find_text(j, {"type"}));
    }
    if (j.contains("model")) {
        record.tags = string_array(j.at("model"), "tags");
    }
    if (record.tags.empty()) {
        record.tags = string_array(j, "tags");
    }
}

// A1111-style user metadata ("sd version", "activation text", ...).
void apply_user_metadata(const json& j, ModelRecord& record) {
    assign_if_present(record.base_model, find_text(j, {"sd version"}));
    if (record.base_model.empty()) {
        assign_if_present(record.base_model, find_text(j, {"baseModel"}));
    }
    assign_if_present(record.model_id, find_text(j, {"modelId"}));
    if (record.model_id.empty()) {
        assign_if_present(record.model_id, find_text(j, {"civitai", "modelId"}));
    }
    assign_if_present(record.version_name, find_text(j, {"versionName"}));
    assign_if_present(record.model_type, find_text(j, {"type"}));
    record.tags = string_array(j, "tags");
}

bool has_any_metadata(const ModelRecord& record) {
    return !record.model_id.empty() || !record.base_model.empty() ||
           !record.version_name.empty() || !record.model_type.empty() || !record.tags.empty();
}

}  // namespace

std::optional<Sidecar> find_sidecar(const fs::path& model_file) {
    const auto dir = model_file.parent_path();
    const auto stem = model_file.stem().string();
    const std::pair<SidecarKind, const char*> candidates[] = {
        {SidecarKind::CivitaiInfo, ".civitai.info"},
        {SidecarKind::Json, ".json"},
        {SidecarKind::MetadataJson, ".metadata.json"},
    };
    for (const auto& candidate : candidates) {
        auto path = dir / (stem + candidate.second);
        if (is_existing_file(path)) {
            return Sidecar{candidate.first, path};
        }
    }
    return std::nullopt;
}

ModelRecord read_model_record(const fs::path& model_file) {
    ModelRecord record;
    record.file_path = model_file.string();
    record.safetensor_file_name = model_file.stem().string();

    if (auto sidecar = find_sidecar(model_file)) {
        std::string error;
        auto j = read_json_file(sidecar->path, &error);
        if (!j || !j->is_object()) {
            spdlog::warn("Ignoring malformed metadata {}: {}", sidecar->path.string(),
                         error.empty() ? "not a JSON object" : error);
        } else if (sidecar->kind == SidecarKind::CivitaiInfo) {
            apply_civitai_info(*j, record);
        } else {
            apply_user_metadata(*j, record);
        }
    }

    record.base_model = normalize_base_model(record.base_model);
    record.has_metadata = has_any_metadata(record);
    if (record.version_name.empty()) {
        record.version_name = record.safetensor_file_name;
    }
    return record;
}

}  // namespace loradeck

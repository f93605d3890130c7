#include "variants/key_normalizer.h"

#include <cctype>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace loradeck {

namespace {

std::string strip_to_alphanumeric(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

}  // namespace

KeyNormalizer::KeyNormalizer(UniqueIdGenerator generate_id)
    : generate_id_(std::move(generate_id)) {
    if (!generate_id_) {
        throw std::invalid_argument("KeyNormalizer requires a unique id generator");
    }
}

VariantClassification KeyNormalizer::resolve(const ModelRecord& model) const {
    auto classification = classify_variant(ClassificationInput::structured(model));
    classification.normalized_key = derive_key(model, classification);
    return classification;
}

std::string KeyNormalizer::normalize(const ModelRecord& model) const {
    return resolve(model).normalized_key;
}

std::string KeyNormalizer::derive_key(const ModelRecord& model,
                                      const VariantClassification& primary) const {
    if (!primary.normalized_key.empty()) return primary.normalized_key;

    auto from_file = classify_variant(ClassificationInput::raw_text(model.safetensor_file_name));
    if (!from_file.normalized_key.empty()) return from_file.normalized_key;

    auto from_version = classify_variant(ClassificationInput::raw_text(model.version_name));
    if (!from_version.normalized_key.empty()) return from_version.normalized_key;

    for (const auto* name : {&model.safetensor_file_name, &model.version_name}) {
        auto stripped = strip_to_alphanumeric(*name);
        if (!stripped.empty()) return stripped;
    }

    auto id = generate_id_();
    if (id.empty()) {
        throw std::logic_error("unique id generator returned an empty id");
    }
    spdlog::debug("No usable identity for '{}', assigned unique key {}", model.file_path, id);
    return id;
}

}  // namespace loradeck

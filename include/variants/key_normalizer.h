#pragma once

#include <string>

#include "models/model_record.h"
#include "utils/unique_id.h"
#include "variants/variant_classifier.h"

namespace loradeck {

// Derives the grouping key for a model through an ordered fallback chain:
//   1. structured classification of the model
//   2. the safetensor file name classified as raw text
//   3. the version name classified as raw text
//   4. file name (or version name) reduced to lowercase letters and digits
//   5. a freshly generated unique id
// The result is never empty, and two models that reach step 5 never share a key.
class KeyNormalizer {
public:
    explicit KeyNormalizer(UniqueIdGenerator generate_id = generate_unique_id);

    // Variant label from the structured classification, key from the chain above.
    VariantClassification resolve(const ModelRecord& model) const;

    std::string normalize(const ModelRecord& model) const;

private:
    std::string derive_key(const ModelRecord& model, const VariantClassification& primary) const;

    UniqueIdGenerator generate_id_;
};

}  // namespace loradeck

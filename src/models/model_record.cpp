#include "models/model_record.h"

#include "utils/text.h"

namespace loradeck {

std::string normalize_base_model(const std::string& base_model) {
    auto trimmed = trim_ascii(base_model);
    if (trimmed == "SDXL 1.0") return "SDXL";
    return trimmed;
}

}  // namespace loradeck

#include "variants/variant_classifier.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

#include "utils/text.h"

namespace loradeck {

namespace {

struct VariantMarker {
    const char* token;
    const char* label;
};

// Longest first; equal lengths keep High ahead of Low.
constexpr VariantMarker kVariantMarkers[] = {
    {"high_noise", kHighVariantLabel},
    {"highnoise", kHighVariantLabel},
    {"low_noise", kLowVariantLabel},
    {"lownoise", kLowVariantLabel},
    {"high", kHighVariantLabel},
    {"low", kLowVariantLabel},
    {"hn", kHighVariantLabel},
    {"ln", kLowVariantLabel},
    {"h", kHighVariantLabel},
    {"l", kLowVariantLabel},
};

constexpr const char* kStrippedExtensions[] = {".safetensors", ".pt", ".ckpt", ".bin"};

constexpr const char kTokenSeparators[] = " _-.()[]{}";

bool is_letter(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_upper(char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; }
bool is_letter_or_digit(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

bool all_digits(const std::string& value) {
    return std::all_of(value.begin(), value.end(), is_digit);
}

bool has_letter(const std::string& value) {
    return std::any_of(value.begin(), value.end(), is_letter);
}

bool starts_with(const std::string& value, const char* prefix) {
    return value.compare(0, std::strlen(prefix), prefix) == 0;
}

const char* lookup_marker(const std::string& candidate) {
    for (const auto& marker : kVariantMarkers) {
        if (equals_ignore_case(candidate, marker.token)) return marker.label;
    }
    return nullptr;
}

// The occurrence at [pos, pos + len) is not glued to other letters or digits.
bool is_bounded(const std::string& source, size_t pos, size_t len) {
    bool start_boundary = pos == 0 || !is_letter_or_digit(source[pos - 1]);
    size_t end = pos + len;
    bool end_boundary = end >= source.size() || !is_letter_or_digit(source[end]);
    return start_boundary && end_boundary;
}

bool contains_bounded_token(const std::string& source, const std::string& token) {
    size_t index = 0;
    while (index < source.size()) {
        size_t found = find_ignore_case(source, token, index);
        if (found == std::string::npos) return false;
        if (is_bounded(source, found, token.size())) return true;
        index = found + 1;
    }
    return false;
}

std::string remove_bounded_token(std::string source, const std::string& token) {
    size_t index = 0;
    while (index < source.size()) {
        size_t found = find_ignore_case(source, token, index);
        if (found == std::string::npos) break;
        if (is_bounded(source, found, token.size())) {
            source.erase(found, token.size());
            continue;
        }
        index = found + 1;
    }
    return source;
}

std::vector<std::string> tokenize(const std::string& source) {
    std::vector<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        auto token = trim_ascii(current);
        if (!token.empty()) tokens.push_back(std::move(token));
        current.clear();
    };
    for (char c : source) {
        if (c != '\0' && std::strchr(kTokenSeparators, c) != nullptr) {
            flush();
            continue;
        }
        current.push_back(c);
    }
    flush();
    return tokens;
}

std::string trim_numeric_edges(const std::string& token) {
    size_t start = 0;
    while (start < token.size() && is_digit(token[start])) ++start;
    size_t end = token.size();
    while (end > start && is_digit(token[end - 1])) --end;
    return token.substr(start, end - start);
}

// A multi-letter marker inside a token, e.g. "T2VHIGHNOISEJIGGLE".
const char* detect_embedded_variant(const std::string& token) {
    for (const auto& marker : kVariantMarkers) {
        const std::string key = marker.token;
        if (key.size() == 1) continue;

        size_t index = find_ignore_case(token, key);
        while (index != std::string::npos) {
            bool has_before = index > 0;
            size_t after_index = index + key.size();
            bool has_after = after_index < token.size();
            bool before_is_letter = has_before && is_letter(token[index - 1]);
            bool after_is_letter = has_after && is_letter(token[after_index]);

            if (!before_is_letter || !after_is_letter) return marker.label;
            if (key.size() > 3 && is_upper(token[index - 1]) && is_upper(token[after_index])) {
                return marker.label;
            }
            index = find_ignore_case(token, key, index + 1);
        }
    }
    return nullptr;
}

std::string detect_variant_label(const std::string& source) {
    for (const auto& marker : kVariantMarkers) {
        if (contains_bounded_token(source, marker.token)) return marker.label;
    }

    for (const auto& token : tokenize(source)) {
        if (const char* label = lookup_marker(token)) return label;

        auto trimmed = trim_numeric_edges(token);
        if (!equals_ignore_case(trimmed, token)) {
            if (const char* label = lookup_marker(trimmed)) return label;
        }

        if (const char* label = detect_embedded_variant(token)) return label;
    }
    return {};
}

bool is_version_token(const std::string& lower) {
    if (lower.empty()) return false;
    if (starts_with(lower, "ver")) return true;
    if (lower == "v") return true;
    if ((lower[0] == 'v' || lower[0] == 'e') && lower.size() > 1 && all_digits(lower.substr(1))) {
        return true;
    }
    return starts_with(lower, "epoch");
}

bool has_other_alphabetic_token(const std::vector<std::string>& tokens, size_t exclude) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i == exclude) continue;
        auto lower = to_lower_ascii(tokens[i]);
        if (lookup_marker(lower) || is_version_token(lower)) continue;
        if (has_letter(lower)) return true;
    }
    return false;
}

bool has_subsequent_alphabetic_token(const std::vector<std::string>& tokens, size_t index) {
    for (size_t i = index + 1; i < tokens.size(); ++i) {
        auto lower = to_lower_ascii(tokens[i]);
        if (lookup_marker(lower) || is_version_token(lower)) continue;
        if (all_digits(lower)) continue;
        if (has_letter(lower)) return true;
    }
    return false;
}

// Drops an upper-case variant suffix such as "MommyH" -> "Mommy".
std::string trim_variant_suffix(const std::string& token, const std::string& suffix) {
    if (token.size() <= suffix.size()) return token;
    if (!ends_with_ignore_case(token, suffix)) return token;
    if (token.size() - suffix.size() < 4) return token;

    const auto segment = token.substr(token.size() - suffix.size());
    if (std::none_of(segment.begin(), segment.end(), is_upper)) return token;

    char preceding = token[token.size() - suffix.size() - 1];
    if (is_digit(preceding)) return token;
    return token.substr(0, token.size() - suffix.size());
}

std::string remove_embedded_marker(std::string token, const std::string& key) {
    size_t index = find_ignore_case(token, key);
    while (index != std::string::npos) {
        bool has_before = index > 0;
        size_t after_index = index + key.size();
        bool has_after = after_index < token.size();
        bool before_is_letter = has_before && is_letter(token[index - 1]);
        bool after_is_letter = has_after && is_letter(token[after_index]);

        bool should_remove = !before_is_letter || !after_is_letter;
        if (!should_remove && key.size() > 3 &&
            is_upper(token[index - 1]) && is_upper(token[after_index])) {
            should_remove = true;
        }

        if (!should_remove) {
            index = find_ignore_case(token, key, index + 1);
            continue;
        }

        token.erase(index, key.size());
        index = find_ignore_case(token, key);
    }
    return token;
}

std::string normalize_token(std::string token, const std::string& label) {
    if (label.empty()) return token;

    if (is_high_label(label)) {
        token = trim_variant_suffix(token, "hn");
        token = trim_variant_suffix(token, "h");
    } else if (is_low_label(label)) {
        token = trim_variant_suffix(token, "ln");
        token = trim_variant_suffix(token, "l");
    }

    for (const auto& marker : kVariantMarkers) {
        if (std::strlen(marker.token) == 1) continue;
        if (!equals_ignore_case(marker.label, label)) continue;
        token = remove_embedded_marker(std::move(token), marker.token);
    }
    return token;
}

std::string build_normalized_key(const std::string& source, const std::string& label) {
    std::string sanitized = source;
    for (const auto& marker : kVariantMarkers) {
        sanitized = remove_bounded_token(std::move(sanitized), marker.token);
    }

    const auto tokens = tokenize(sanitized);
    std::string key;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        const auto lower = to_lower_ascii(token);

        if (lookup_marker(lower)) continue;
        if (lower == "noise") continue;
        if (is_version_token(lower)) continue;

        if (is_digit(lower[0])) {
            if (all_digits(lower)) {
                // Keep "2" in "wan-2-i2v", drop the trailing "30" in "wan_30".
                if (!has_subsequent_alphabetic_token(tokens, i)) continue;
            } else if (has_other_alphabetic_token(tokens, i)) {
                continue;
            }
        }

        auto normalized = normalize_token(token, label);
        if (!is_blank(normalized)) key += normalized;
    }
    return to_lower_ascii(key);
}

// Strips model-file extensions; other dotted suffixes ("v1.0") stay.
std::string normalize_source(const std::string& value) {
    if (is_blank(value)) return {};

    auto trimmed = trim_ascii(value);
    size_t name_start = trimmed.find_last_of("/\\");
    name_start = name_start == std::string::npos ? 0 : name_start + 1;
    size_t dot = trimmed.find_last_of('.');
    if (dot == std::string::npos || dot < name_start || dot + 1 == trimmed.size()) {
        return trimmed;
    }

    const auto extension = trimmed.substr(dot);
    bool known = std::any_of(std::begin(kStrippedExtensions), std::end(kStrippedExtensions),
                             [&](const char* ext) { return equals_ignore_case(extension, ext); });
    if (!known) return trimmed;

    auto stem = trimmed.substr(name_start, dot - name_start);
    return is_blank(stem) ? trimmed : stem;
}

VariantClassification classify_source(const std::string& source) {
    if (is_blank(source)) return {};
    VariantClassification result;
    result.variant_label = detect_variant_label(source);
    result.normalized_key = build_normalized_key(source, result.variant_label);
    return result;
}

VariantClassification classify_model(const ModelRecord& model) {
    auto classification = classify_source(normalize_source(model.safetensor_file_name));
    if (!classification.variant_label.empty() && !classification.normalized_key.empty()) {
        return classification;
    }

    auto fallback_source = normalize_source(model.version_name);
    if (fallback_source.empty()) return classification;

    auto fallback = classify_source(fallback_source);
    if (classification.variant_label.empty()) {
        classification.variant_label = fallback.variant_label;
    }
    if (classification.normalized_key.empty()) {
        classification.normalized_key = fallback.normalized_key;
    }
    return classification;
}

}  // namespace

ClassificationInput ClassificationInput::structured(const ModelRecord& model) {
    ClassificationInput input;
    input.kind_ = Kind::Structured;
    input.model_ = model;
    return input;
}

ClassificationInput ClassificationInput::raw_text(std::string text) {
    ClassificationInput input;
    input.kind_ = Kind::RawText;
    input.text_ = std::move(text);
    return input;
}

VariantClassification classify_variant(const ClassificationInput& input) {
    switch (input.kind()) {
        case ClassificationInput::Kind::Structured:
            return classify_model(input.model());
        case ClassificationInput::Kind::RawText:
            return classify_source(normalize_source(input.text()));
    }
    return {};
}

bool is_high_label(const std::string& label) {
    return equals_ignore_case(label, kHighVariantLabel);
}

bool is_low_label(const std::string& label) {
    return equals_ignore_case(label, kLowVariantLabel);
}

}  // namespace loradeck

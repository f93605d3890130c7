// unique_id.h - random identifiers used when a model has no usable identity
#pragma once

#include <functional>
#include <string>

namespace loradeck {

// Source of process-unique tokens; injected so tests can supply a fake.
using UniqueIdGenerator = std::function<std::string()>;

// 32 lowercase hex characters (128 random bits).
std::string generate_unique_id();

}  // namespace loradeck

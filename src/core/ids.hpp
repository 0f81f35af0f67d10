#pragma once

#include <functional>
#include <string>

namespace termdeck
{

using IdGenerator = std::function<std::string()>;

// Random RFC 4122 version-4 style id ("8-4-4-4-12" lowercase hex).
std::string random_id();

// Deterministic "<prefix>1", "<prefix>2", ... generator for tests and demos.
IdGenerator sequential_ids(std::string prefix);

}   // namespace termdeck

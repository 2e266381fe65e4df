#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace sentneuron {

/// Hidden dimension -> additive bias applied before each generation step.
using OverrideMap = std::map<int, float>;

/// Parses `{"<int>": <number>, ...}`. Throws std::runtime_error on invalid
/// JSON, a non-object document, a non-integer key or a non-numeric value.
OverrideMap parse_override(const std::string& text);

/// Reads and parses an override file; throws std::runtime_error on failure.
OverrideMap load_override(const std::filesystem::path& path);

/// Writes an override file; throws std::runtime_error on I/O failure.
void save_override(const std::filesystem::path& path, const OverrideMap& overrides);

} // namespace sentneuron

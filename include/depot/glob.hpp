#pragma once

#include <depot/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace depot {

// Match a shell-style pattern against a single file name.
// Supports: * (any run of chars), ? (single char), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& name);

// List the entries (files and directories) directly inside dir whose file
// name matches pattern. Sorted by path. A missing dir yields an empty list.
Result<std::vector<std::filesystem::path>> glob_entries(
    const std::filesystem::path& dir,
    const std::string& pattern);

} // namespace depot

#pragma once

#include <depot/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace depot {

using SwapMap = std::unordered_map<std::string, std::string>;

// Substitute {{ var }} placeholders in a template string.
// Returns an error on undefined variables or unclosed braces.
// Supports \{{ to produce literal {{ in output.
Result<std::string> swap_template(const std::string& tmpl, const SwapMap& vars);

// Names referenced by {{ var }} placeholders, in order of appearance.
// Escaped and unclosed placeholders are not reported.
std::vector<std::string> swap_variables(const std::string& tmpl);

} // namespace depot

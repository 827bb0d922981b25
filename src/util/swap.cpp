#include <depot/swap.hpp>
#include <algorithm>

namespace depot {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

static std::string available_vars_hint(const SwapMap& vars) {
    if (vars.empty()) return "no variables defined";
    std::vector<std::string> keys;
    keys.reserve(vars.size());
    for (const auto& kv : vars) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    std::string hint = "available variables: ";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) hint += ", ";
        hint += keys[i];
    }
    return hint;
}

static bool is_escaped_open(const std::string& s, size_t i) {
    return i + 2 < s.size() && s[i] == '\\' && s[i + 1] == '{' && s[i + 2] == '{';
}

static bool is_open(const std::string& s, size_t i) {
    return i + 1 < s.size() && s[i] == '{' && s[i + 1] == '{';
}

Result<std::string> swap_template(const std::string& tmpl, const SwapMap& vars) {
    std::string out;
    out.reserve(tmpl.size());
    size_t i = 0;

    while (i < tmpl.size()) {
        if (is_escaped_open(tmpl, i)) {
            out += "{{";
            i += 3;
            continue;
        }

        if (is_open(tmpl, i)) {
            size_t start = i + 2;
            size_t end = tmpl.find("}}", start);
            if (end == std::string::npos) {
                return DepotError(DepotError::Parse,
                    "unclosed '{{' in '" + tmpl + "' at position " + std::to_string(i));
            }

            std::string varname = trim(tmpl.substr(start, end - start));
            if (varname.empty()) {
                return DepotError(DepotError::Parse,
                    "empty variable name in '" + tmpl + "' at position " + std::to_string(i));
            }

            auto it = vars.find(varname);
            if (it == vars.end()) {
                return DepotError(DepotError::NotFound,
                    "undefined variable '" + varname + "' in '" + tmpl + "'",
                    available_vars_hint(vars));
            }

            out += it->second;
            i = end + 2;
            continue;
        }

        out.push_back(tmpl[i]);
        i++;
    }

    return Result<std::string>::ok(std::move(out));
}

std::vector<std::string> swap_variables(const std::string& tmpl) {
    std::vector<std::string> names;
    size_t i = 0;
    while (i < tmpl.size()) {
        if (is_escaped_open(tmpl, i)) {
            i += 3;
            continue;
        }
        if (is_open(tmpl, i)) {
            size_t end = tmpl.find("}}", i + 2);
            if (end == std::string::npos) break;
            std::string varname = trim(tmpl.substr(i + 2, end - i - 2));
            if (!varname.empty()) names.push_back(std::move(varname));
            i = end + 2;
            continue;
        }
        i++;
    }
    return names;
}

} // namespace depot

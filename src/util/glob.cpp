#include <depot/glob.hpp>
#include <algorithm>

namespace depot {

namespace fs = std::filesystem;

static bool match_from(const std::string& pat, size_t pi,
                       const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            // Consecutive stars collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_from(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            pi++;
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

bool glob_match(const std::string& pattern, const std::string& name) {
    return match_from(pattern, 0, name, 0);
}

Result<std::vector<fs::path>> glob_entries(const fs::path& dir,
                                           const std::string& pattern) {
    std::vector<fs::path> results;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<std::vector<fs::path>>::ok(std::move(results));
    }

    for (auto it = fs::directory_iterator(dir, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (glob_match(pattern, it->path().filename().string())) {
            results.push_back(it->path());
        }
    }
    if (ec) {
        return DepotError(DepotError::IO,
            "cannot list directory " + dir.string() + ": " + ec.message());
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<fs::path>>::ok(std::move(results));
}

} // namespace depot

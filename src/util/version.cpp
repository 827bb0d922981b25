#include <depot/version.hpp>
#include <algorithm>
#include <cctype>

namespace depot {

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

static bool is_numeric(const std::string& c) {
    if (c.empty()) return false;
    return std::all_of(c.begin(), c.end(),
        [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Compare two digit strings of any length without converting them.
static int compare_digits(const std::string& a, const std::string& b) {
    size_t ia = a.find_first_not_of('0');
    size_t ib = b.find_first_not_of('0');
    std::string na = ia == std::string::npos ? "" : a.substr(ia);
    std::string nb = ib == std::string::npos ? "" : b.substr(ib);
    if (na.size() != nb.size()) return na.size() < nb.size() ? -1 : 1;
    int c = na.compare(nb);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

static int compare_component(const std::string& a, const std::string& b) {
    bool na = is_numeric(a);
    bool nb = is_numeric(b);
    if (na && nb) return compare_digits(a, b);
    if (!na && !nb) {
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    // Malformed sorts below well-formed
    return na ? 1 : -1;
}

// ---------------------------------------------------------------------------
// VersionSpec
// ---------------------------------------------------------------------------

VersionSpec VersionSpec::parse(const std::string& s) {
    VersionSpec v;
    v.text_ = trim(s);

    std::string body = v.text_;
    if (body == "LATEST") {
        v.latest = true;
        return v;
    }
    if (!body.empty() && body.back() == '+') {
        v.open_ended = true;
        body.pop_back();
    }
    if (body.empty()) return v;

    size_t pos = 0;
    while (true) {
        size_t dot = body.find('.', pos);
        if (dot == std::string::npos) {
            v.components.push_back(body.substr(pos));
            break;
        }
        v.components.push_back(body.substr(pos, dot - pos));
        pos = dot + 1;
    }
    return v;
}

std::string VersionSpec::to_string() const {
    return text_;
}

bool VersionSpec::satisfied_by(const VersionSpec& candidate) const {
    if (latest) return true;
    Ordering ord = compare(candidate, *this);
    if (open_ended) return ord != Ordering::Less;
    return ord == Ordering::Equal;
}

bool VersionSpec::operator==(const VersionSpec& o) const {
    return compare(*this, o) == Ordering::Equal;
}

bool VersionSpec::operator!=(const VersionSpec& o) const { return !(*this == o); }

bool VersionSpec::operator<(const VersionSpec& o) const {
    return compare(*this, o) == Ordering::Less;
}

bool VersionSpec::operator<=(const VersionSpec& o) const { return !(o < *this); }
bool VersionSpec::operator>(const VersionSpec& o) const { return o < *this; }
bool VersionSpec::operator>=(const VersionSpec& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

Ordering compare(const VersionSpec& a, const VersionSpec& b) {
    static const std::string zero = "0";
    size_t n = std::max(a.components.size(), b.components.size());
    for (size_t i = 0; i < n; ++i) {
        const std::string& ca = i < a.components.size() ? a.components[i] : zero;
        const std::string& cb = i < b.components.size() ? b.components[i] : zero;
        int c = compare_component(ca, cb);
        if (c < 0) return Ordering::Less;
        if (c > 0) return Ordering::Greater;
    }
    return Ordering::Equal;
}

Ordering compare_versions(const std::string& a, const std::string& b) {
    return compare(VersionSpec::parse(a), VersionSpec::parse(b));
}

bool satisfies(const std::string& constraint, const std::string& candidate) {
    return VersionSpec::parse(constraint).satisfied_by(VersionSpec::parse(candidate));
}

} // namespace depot

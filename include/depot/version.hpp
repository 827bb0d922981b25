#pragma once

#include <string>
#include <vector>

namespace depot {

enum class Ordering { Less, Equal, Greater };

// A concrete version or a version constraint.
//
//   "1.2.3"   exactly 1.2.3 (trailing zeros implied: "1.2" == "1.2.0")
//   "1.2.3+"  1.2.3 or anything greater, any higher major included
//   "LATEST"  the greatest version available
//
// Components are compared numerically when both sides are integers and
// lexically when both are not; a non-numeric component sorts below any
// numeric one. Parsing never fails.
struct VersionSpec {
    std::vector<std::string> components;
    bool open_ended = false;
    bool latest = false;

    static VersionSpec parse(const std::string& s);
    std::string to_string() const;

    bool is_concrete() const { return !open_ended && !latest; }

    // True if the concrete version `candidate` meets this constraint.
    // LATEST accepts every version here; picking the maximum is up to the
    // caller, which knows what is available.
    bool satisfied_by(const VersionSpec& candidate) const;

    bool operator==(const VersionSpec& o) const;
    bool operator!=(const VersionSpec& o) const;
    bool operator<(const VersionSpec& o) const;
    bool operator<=(const VersionSpec& o) const;
    bool operator>(const VersionSpec& o) const;
    bool operator>=(const VersionSpec& o) const;

private:
    std::string text_;
};

Ordering compare(const VersionSpec& a, const VersionSpec& b);
Ordering compare_versions(const std::string& a, const std::string& b);
bool satisfies(const std::string& constraint, const std::string& candidate);

// Orders version strings with compare_versions(). Use as a set comparator.
struct VersionLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return compare_versions(a, b) == Ordering::Less;
    }
};

} // namespace depot

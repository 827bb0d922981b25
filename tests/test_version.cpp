#include <catch2/catch.hpp>
#include <depot/version.hpp>

#include <set>

using namespace depot;

// ===== Parsing =====

TEST_CASE("parse concrete version", "[version]") {
    auto v = VersionSpec::parse("1.2.3");
    REQUIRE(v.components == std::vector<std::string>{"1", "2", "3"});
    REQUIRE_FALSE(v.open_ended);
    REQUIRE_FALSE(v.latest);
    REQUIRE(v.is_concrete());
    REQUIRE(v.to_string() == "1.2.3");
}

TEST_CASE("parse open-ended version", "[version]") {
    auto v = VersionSpec::parse("23.0+");
    REQUIRE(v.components == std::vector<std::string>{"23", "0"});
    REQUIRE(v.open_ended);
    REQUIRE_FALSE(v.is_concrete());
    REQUIRE(v.to_string() == "23.0+");
}

TEST_CASE("parse LATEST", "[version]") {
    auto v = VersionSpec::parse("LATEST");
    REQUIRE(v.latest);
    REQUIRE(v.components.empty());
    REQUIRE_FALSE(v.is_concrete());
}

TEST_CASE("parse keeps the constraint text", "[version]") {
    REQUIRE(VersionSpec::parse(" 1.0+ ").to_string() == "1.0+");
    REQUIRE(VersionSpec::parse("1.0.0-rc1").to_string() == "1.0.0-rc1");
}

TEST_CASE("parse never fails on odd input", "[version]") {
    REQUIRE(VersionSpec::parse("").components.empty());
    REQUIRE(VersionSpec::parse("+").open_ended);
    REQUIRE(VersionSpec::parse("..").components.size() == 3);
    REQUIRE(VersionSpec::parse("abc").components == std::vector<std::string>{"abc"});
}

// ===== Comparison =====

TEST_CASE("numeric components compare as numbers", "[version]") {
    REQUIRE(compare_versions("1.10", "1.9") == Ordering::Greater);
    REQUIRE(compare_versions("1.2.3", "1.2.4") == Ordering::Less);
    REQUIRE(compare_versions("2.0.0", "10.0.0") == Ordering::Less);
    REQUIRE(compare_versions("007", "7") == Ordering::Equal);
}

TEST_CASE("missing trailing components count as zero", "[version]") {
    REQUIRE(compare_versions("1.2", "1.2.0") == Ordering::Equal);
    REQUIRE(compare_versions("1", "1.0.0.0") == Ordering::Equal);
    REQUIRE(compare_versions("1.2", "1.2.1") == Ordering::Less);
}

TEST_CASE("huge components do not overflow", "[version]") {
    REQUIRE(compare_versions("1.99999999999999999999999", "1.99999999999999999999998")
            == Ordering::Greater);
    REQUIRE(compare_versions("1.100000000000000000000", "1.2") == Ordering::Greater);
}

TEST_CASE("non-numeric components sort below numeric ones", "[version]") {
    REQUIRE(compare_versions("1.0.0-rc1", "1.0.0") == Ordering::Less);
    REQUIRE(compare_versions("1.x", "1.0") == Ordering::Less);
    REQUIRE(compare_versions("1.beta", "1.alpha") == Ordering::Greater);
}

TEST_CASE("comparison operators agree with compare", "[version]") {
    auto a = VersionSpec::parse("1.0.0");
    auto b = VersionSpec::parse("1.1.0");
    REQUIRE(a < b);
    REQUIRE(a <= b);
    REQUIRE(b > a);
    REQUIRE(b >= a);
    REQUIRE(a != b);
    REQUIRE(a == VersionSpec::parse("1.0"));
}

TEST_CASE("compare is antisymmetric and transitive", "[version]") {
    std::vector<std::string> versions = {
        "0.9", "1.0", "1.0.1", "1.0.10", "1.0.2", "1.1", "2", "10.0", "1.0.0-rc1", "1.a"};
    for (const auto& a : versions) {
        for (const auto& b : versions) {
            Ordering ab = compare_versions(a, b);
            Ordering ba = compare_versions(b, a);
            if (ab == Ordering::Less) REQUIRE(ba == Ordering::Greater);
            if (ab == Ordering::Equal) REQUIRE(ba == Ordering::Equal);
            for (const auto& c : versions) {
                if (ab == Ordering::Less && compare_versions(b, c) == Ordering::Less) {
                    REQUIRE(compare_versions(a, c) == Ordering::Less);
                }
            }
        }
    }
}

TEST_CASE("VersionLess orders a set by version", "[version]") {
    std::set<std::string, VersionLess> s = {"1.10", "1.2", "1.9", "2.0"};
    std::vector<std::string> ordered(s.begin(), s.end());
    REQUIRE(ordered == std::vector<std::string>{"1.2", "1.9", "1.10", "2.0"});
}

// ===== Constraints =====

TEST_CASE("exact constraint matches only equal versions", "[version]") {
    REQUIRE(satisfies("1.2", "1.2.0"));
    REQUIRE(satisfies("1.2.0", "1.2"));
    REQUIRE_FALSE(satisfies("1.2", "1.2.1"));
    REQUIRE_FALSE(satisfies("1.2", "1.1"));
}

TEST_CASE("open-ended constraint has no upper bound", "[version]") {
    REQUIRE(satisfies("1.2.3+", "1.2.3"));
    REQUIRE(satisfies("1.2.3+", "1.2.4"));
    REQUIRE(satisfies("1.2.3+", "1.3.0"));
    REQUIRE(satisfies("1.2.3+", "2.0.0"));
    REQUIRE_FALSE(satisfies("1.2.3+", "1.2.2"));
}

TEST_CASE("open-ended matches iff not below the floor", "[version]") {
    std::vector<std::string> versions = {"0.1", "1.0", "1.0.5", "1.1", "2.0", "1.0.0-rc1"};
    for (const auto& floor : versions) {
        for (const auto& v : versions) {
            bool expected = compare_versions(v, floor) != Ordering::Less;
            REQUIRE(satisfies(floor + "+", v) == expected);
        }
    }
}

TEST_CASE("LATEST accepts any version", "[version]") {
    REQUIRE(satisfies("LATEST", "0.0.1"));
    REQUIRE(satisfies("LATEST", "99.0"));
}

TEST_CASE("bare plus accepts everything", "[version]") {
    REQUIRE(satisfies("+", "0"));
    REQUIRE(satisfies("+", "3.1.4"));
}

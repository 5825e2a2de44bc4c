#include <doctest/doctest.h>
#include <safepath/path_component.hpp>

#include <filesystem>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

using safepath::ComponentError;
using safepath::PathComponent;
using safepath::classify_component;
using safepath::validate_component;

namespace fs = std::filesystem;

// ============================================================================
// Valid Components
// ============================================================================

TEST_CASE("plain names are valid components") {
    const std::vector<std::string> names = {
        "foo", "foo.txt", ".hidden", "...", "a b", "name-with_symbols!", "x", "..foo", "foo..",
    };
    for (const auto& name : names) {
        CAPTURE(name);
        auto c = validate_component(name);
        REQUIRE(c.has_value());
        CHECK(c->string() == name);
        CHECK(c->path() == fs::path(name));
    }
}

TEST_CASE("validate accepts an existing path value") {
    fs::path p("report.pdf");
    auto c = PathComponent::create(p);
    REQUIRE(c.has_value());
    CHECK(c->path() == p);
    CHECK(c->native() == p.native());
}

TEST_CASE("component converts to a read-only path view") {
    auto c = validate_component("data");
    REQUIRE(c.has_value());
    const fs::path& view = *c;
    CHECK(view == fs::path("data"));
    CHECK((fs::path("root") / c->path()) == fs::path("root") / "data");
}

// ============================================================================
// Invalid Components
// ============================================================================

TEST_CASE("empty candidate is rejected") {
    CHECK_FALSE(validate_component("").has_value());
    CHECK(classify_component("") == ComponentError::Empty);
}

TEST_CASE("dot and dotdot are rejected") {
    CHECK_FALSE(validate_component(".").has_value());
    CHECK_FALSE(validate_component("..").has_value());
    CHECK(classify_component(".") == ComponentError::CurrentDirectory);
    CHECK(classify_component("..") == ComponentError::ParentDirectory);
}

TEST_CASE("candidates containing a separator are rejected") {
    const std::vector<std::string> candidates = {
        "a/b", "foo/", "../etc/passwd", "./foo", "foo/..", "a//b",
    };
    for (const auto& s : candidates) {
        CAPTURE(s);
        CHECK_FALSE(validate_component(s).has_value());
        CHECK(classify_component(s) == ComponentError::MultipleComponents);
    }
}

TEST_CASE("root candidates are rejected") {
    CHECK_FALSE(validate_component("/").has_value());
    CHECK_FALSE(validate_component("/etc").has_value());
    CHECK_FALSE(validate_component("/etc/shadow").has_value());
#ifdef _WIN32
    CHECK(classify_component("\\") == ComponentError::RootDirectory);
#else
    CHECK(classify_component("/") == ComponentError::RootDirectory);
    CHECK(classify_component("/etc") == ComponentError::RootDirectory);
#endif
}

#ifdef _WIN32
TEST_CASE("drive and UNC prefixes are rejected") {
    CHECK(classify_component("C:") == ComponentError::RootName);
    CHECK(classify_component("C:foo") == ComponentError::RootName);
    CHECK(classify_component("C:\\Windows") == ComponentError::RootName);
    CHECK(classify_component("\\\\server\\share") == ComponentError::RootName);
    CHECK(classify_component("a\\b") == ComponentError::MultipleComponents);
}
#else
TEST_CASE("backslash is an ordinary character on POSIX") {
    auto c = validate_component("a\\b");
    REQUIRE(c.has_value());
    CHECK(c->string() == "a\\b");
}

TEST_CASE("colon is an ordinary character on POSIX") {
    CHECK(validate_component("C:").has_value());
}
#endif

TEST_CASE("error keys are stable") {
    CHECK(std::string(safepath::component_error_to_string(ComponentError::None)) == "none");
    CHECK(std::string(safepath::component_error_to_string(ComponentError::Empty)) == "empty");
    CHECK(std::string(safepath::component_error_to_string(ComponentError::MultipleComponents)) ==
          "multiple_components");
    CHECK(std::string(safepath::component_error_to_string(ComponentError::ParentDirectory)) ==
          "parent_directory");
}

// ============================================================================
// Value Semantics
// ============================================================================

TEST_CASE("revalidating a component yields an equal component") {
    auto c = validate_component("notes.md");
    REQUIRE(c.has_value());
    auto again = PathComponent::create(c->path());
    REQUIRE(again.has_value());
    CHECK(*again == *c);

    auto from_string = validate_component(c->string());
    REQUIRE(from_string.has_value());
    CHECK(*from_string == *c);
}

TEST_CASE("components work as set members and map keys") {
    std::unordered_set<PathComponent> set;
    set.insert(*validate_component("a"));
    set.insert(*validate_component("b"));
    set.insert(*validate_component("a"));
    CHECK(set.size() == 2);
    CHECK(set.count(*validate_component("b")) == 1);

    std::map<PathComponent, int> ordered;
    ordered[*validate_component("z")] = 1;
    ordered[*validate_component("m")] = 2;
    CHECK(ordered.begin()->first.string() == "m");
}

TEST_CASE("components compare by value") {
    CHECK(*validate_component("x") == *validate_component("x"));
    CHECK(*validate_component("x") != *validate_component("y"));
    CHECK(*validate_component("a") < *validate_component("b"));
}

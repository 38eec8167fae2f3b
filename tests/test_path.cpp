/**
 * @file test_path.cpp
 * @brief Unit tests for the path grammar (GoogleTest)
 */

#include <gtest/gtest.h>
#include "routerkit/Errors.hpp"
#include "routerkit/Path.hpp"

using namespace routerkit;

// ============================================================================
// Validation
// ============================================================================

TEST(PathValidation, AcceptsKeysAndIndices) {
    EXPECT_TRUE(is_valid_path("spec.template.spec.containers[0].env"));
    EXPECT_TRUE(is_valid_path("a.b[0].c"));
    EXPECT_TRUE(is_valid_path("[0]"));
    EXPECT_TRUE(is_valid_path("items[-1]"));
    EXPECT_TRUE(is_valid_path(""));
}

TEST(PathValidation, AcceptsKeyPunctuation) {
    EXPECT_TRUE(is_valid_path("metadata.annotations.openshift.io/host.generated"));
    EXPECT_TRUE(is_valid_path("max-connections_50%"));
}

TEST(PathValidation, RejectsForeignCharacters) {
    EXPECT_FALSE(is_valid_path("a b"));
    EXPECT_FALSE(is_valid_path("a.b*"));
    EXPECT_FALSE(is_valid_path("a..b"));
}

TEST(PathValidation, RejectsBrokenIndices) {
    EXPECT_FALSE(is_valid_path("a[]"));
    EXPECT_FALSE(is_valid_path("a[x]"));
    EXPECT_FALSE(is_valid_path("a[0"));
}

TEST(PathValidation, InactiveSeparatorsAreKeyCharacters) {
    EXPECT_TRUE(is_valid_path("a#b", '#'));
    EXPECT_TRUE(is_valid_path("a.b", '#'));
    EXPECT_TRUE(is_valid_path("a:b|c", '#'));
}

TEST(PathValidation, SeparatorCandidates) {
    EXPECT_TRUE(is_separator_candidate('.'));
    EXPECT_TRUE(is_separator_candidate('#'));
    EXPECT_TRUE(is_separator_candidate('|'));
    EXPECT_TRUE(is_separator_candidate(':'));
    EXPECT_FALSE(is_separator_candidate('/'));
}

// ============================================================================
// Parsing
// ============================================================================

TEST(PathParse, SplitsSegments) {
    auto segments = parse_path("spec.ports[1].port");
    ASSERT_EQ(segments.size(), 4u);
    EXPECT_EQ(segments[0], PathSegment::make_key("spec"));
    EXPECT_EQ(segments[1], PathSegment::make_key("ports"));
    EXPECT_EQ(segments[2], PathSegment::make_index(1));
    EXPECT_EQ(segments[3], PathSegment::make_key("port"));
}

TEST(PathParse, RootPathIsEmpty) {
    EXPECT_TRUE(parse_path("").empty());
}

TEST(PathParse, NegativeIndex) {
    auto segments = parse_path("env[-1]");
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_TRUE(segments[1].is_index());
    EXPECT_EQ(segments[1].index, -1);
}

TEST(PathParse, DottedKeyWithAlternativeSeparator) {
    auto segments = parse_path("data#tls.crt", '#');
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].key, "data");
    EXPECT_EQ(segments[1].key, "tls.crt");
}

TEST(PathParse, InvalidPathThrows) {
    try {
        parse_path("a b");
        FAIL() << "Expected InvalidPathError";
    } catch (const InvalidPathError& e) {
        EXPECT_EQ(e.path(), "a b");
        EXPECT_EQ(e.separator(), '.');
    }
}

TEST(PathJoin, RoundTrip) {
    const std::string path = "spec.template.spec.containers[0].env[2].value";
    EXPECT_EQ(join_path(parse_path(path)), path);
    EXPECT_EQ(join_path(parse_path("a#b[0]", '#'), '#'), "a#b[0]");
}

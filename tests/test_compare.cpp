/**
 * @file test_compare.cpp
 * @brief Unit tests for the structural comparator (GoogleTest)
 */

#include <gtest/gtest.h>
#include "routerkit/Compare.hpp"

using namespace routerkit;

namespace {
    Value service() {
        return Value{
            {"kind", "Service"},
            {"metadata", {{"name", "router"}}},
            {"spec", {
                {"selector", {{"router", "router"}}},
                {"ports", Value::array({
                    {{"name", "80-tcp"}, {"port", 80}, {"protocol", "TCP"}},
                    {{"name", "443-tcp"}, {"port", 443}, {"protocol", "TCP"}}
                })}
            }}
        };
    }
}

// ============================================================================
// Basic properties
// ============================================================================

TEST(EqualUnderSkip, Reflexive) {
    EXPECT_TRUE(equal_under_skip(service(), service()));
}

TEST(EqualUnderSkip, LeafChangeDetected) {
    Value observed = service();
    observed["spec"]["selector"]["router"] = "other";
    EXPECT_FALSE(equal_under_skip(service(), observed));
}

TEST(EqualUnderSkip, MetadataAndStatusAlwaysSkipped) {
    Value observed = service();
    observed["metadata"]["uid"] = "6b0f3c1e";
    observed["metadata"]["resourceVersion"] = "1042";
    observed["status"] = {{"loadBalancer", Value::object()}};
    EXPECT_TRUE(equal_under_skip(service(), observed));
}

TEST(EqualUnderSkip, NonObjectsCompareByEquality) {
    EXPECT_TRUE(equal_under_skip(Value(1), Value(1)));
    EXPECT_FALSE(equal_under_skip(Value("a"), Value("b")));
}

// ============================================================================
// Sequences
// ============================================================================

TEST(EqualUnderSkip, SequenceOrderMatters) {
    Value observed = service();
    std::swap(observed["spec"]["ports"][0], observed["spec"]["ports"][1]);
    EXPECT_FALSE(equal_under_skip(service(), observed));
}

TEST(EqualUnderSkip, SequenceLengthMatters) {
    Value observed = service();
    observed["spec"]["ports"].erase(1);
    EXPECT_FALSE(equal_under_skip(service(), observed));
}

TEST(EqualUnderSkip, SequenceOfScalars) {
    Value desired = {{"args", {"--a", "--b"}}};
    EXPECT_TRUE(equal_under_skip(desired, Value{{"args", {"--a", "--b"}}}));
    EXPECT_FALSE(equal_under_skip(desired, Value{{"args", {"--a", "--c"}}}));
}

TEST(EqualUnderSkip, DesiredMustHoldSequence) {
    Value observed = {{"args", {"--a"}}};
    EXPECT_FALSE(equal_under_skip(Value{{"args", "--a"}}, observed));
}

TEST(EqualUnderSkip, SkippedKeysInsideSequenceElements) {
    Value desired = {{"ports", Value::array({{{"containerPort", 80}}})}};
    Value observed = {{"ports", Value::array({{{"containerPort", 80}, {"hostPort", 80}}})}};
    EXPECT_FALSE(equal_under_skip(desired, observed));
    EXPECT_TRUE(equal_under_skip(desired, observed, {"hostPort"}));
}

// ============================================================================
// Mappings
// ============================================================================

TEST(EqualUnderSkip, MissingKeyInDesired) {
    Value observed = service();
    observed["spec"]["sessionAffinity"] = "None";
    EXPECT_FALSE(equal_under_skip(service(), observed));
    EXPECT_TRUE(equal_under_skip(service(), observed, {"sessionAffinity"}));
}

TEST(EqualUnderSkip, NestedKeySetMustMatch) {
    Value desired = service();
    desired["spec"]["selector"]["zone"] = "a";
    EXPECT_FALSE(equal_under_skip(desired, service()));
}

TEST(EqualUnderSkip, ExtraTopLevelDesiredKeyNotDetected) {
    Value desired = service();
    desired["apiVersion"] = "v1";
    EXPECT_TRUE(equal_under_skip(desired, service()));
}

TEST(EqualUnderSkip, DesiredMustHoldMapping) {
    Value observed = {{"selector", {{"router", "router"}}}};
    EXPECT_FALSE(equal_under_skip(Value{{"selector", "router=router"}}, observed));
}

TEST(EqualUnderSkip, SkipAppliesAtEveryDepth) {
    Value desired = {{"spec", {{"template", {{"spec", {{"hostNetwork", true}}}}}}}};
    Value observed = desired;
    observed["spec"]["template"]["spec"]["dnsPolicy"] = "ClusterFirst";
    observed["spec"]["template"]["spec"]["restartPolicy"] = "Always";

    EXPECT_FALSE(equal_under_skip(desired, observed));
    EXPECT_TRUE(equal_under_skip(desired, observed, {"dnsPolicy", "restartPolicy"}));
}

TEST(EqualUnderSkip, DebugDoesNotChangeResult) {
    Value observed = service();
    observed["spec"]["selector"]["router"] = "other";
    EXPECT_FALSE(equal_under_skip(service(), observed, {}, true));
    EXPECT_TRUE(equal_under_skip(service(), service(), {}, true));
}

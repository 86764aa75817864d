#include <gtest/gtest.h>
#include "store/widget_layout.hpp"

using namespace dashstore::store;
namespace json = boost::json;

namespace {

json::value parsed(const TransformOutcome& outcome) {
    return json::parse(outcome.value.value());
}

}  // anonymous namespace

TEST(WidgetLayoutTest, NullStaysNull) {
    auto outcome = scale_widget_heights(std::nullopt, 2.0);
    EXPECT_FALSE(outcome.value.has_value());
    EXPECT_EQ(outcome.status, TransformStatus::Unchanged);
}

TEST(WidgetLayoutTest, EmptyStringUnchanged) {
    auto outcome = scale_widget_heights("", 2.0);
    EXPECT_EQ(outcome.value, "");
    EXPECT_EQ(outcome.status, TransformStatus::Unchanged);
}

TEST(WidgetLayoutTest, ScalesBareArray) {
    auto outcome = scale_widget_heights(R"([{"i":"clock","h":4},{"i":"weather","h":3}])", 2.0);
    EXPECT_EQ(outcome.status, TransformStatus::Changed);
    EXPECT_EQ(outcome.value, R"([{"i":"clock","h":8},{"i":"weather","h":6}])");
}

TEST(WidgetLayoutTest, ScalesDashboardConfigObject) {
    auto outcome = scale_widget_heights(
        R"({"widgets":[{"i":"a","h":2,"layouts":{"lg":{"h":3},"sm":{"h":5}}}],"theme":"dark"})", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);

    auto value = parsed(outcome);
    auto& root = value.as_object();
    auto& widget = root["widgets"].as_array()[0].as_object();
    EXPECT_EQ(widget["h"].as_int64(), 4);
    EXPECT_EQ(widget["layouts"].as_object()["lg"].as_object()["h"].as_int64(), 6);
    EXPECT_EQ(widget["layouts"].as_object()["sm"].as_object()["h"].as_int64(), 10);
    EXPECT_EQ(root["theme"].as_string(), "dark");
}

TEST(WidgetLayoutTest, ScalesNestedLayoutHeight) {
    auto outcome = scale_widget_heights(R"([{"layout":{"x":0,"y":1,"h":3}}])", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);

    auto value = parsed(outcome);
    auto& layout = value.as_array()[0].as_object()["layout"].as_object();
    EXPECT_EQ(layout["h"].as_int64(), 6);
    EXPECT_EQ(layout["x"].as_int64(), 0);
    EXPECT_EQ(layout["y"].as_int64(), 1);
}

TEST(WidgetLayoutTest, WholeResultsStayIntegers) {
    auto outcome = scale_widget_heights(R"([{"h":1.5}])", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);
    EXPECT_EQ(outcome.value, R"([{"h":3}])");
}

TEST(WidgetLayoutTest, FractionalResultsStayDoubles) {
    auto outcome = scale_widget_heights(R"([{"h":1.25}])", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);

    auto value = parsed(outcome);
    auto& h = value.as_array()[0].as_object()["h"];
    ASSERT_TRUE(h.is_double());
    EXPECT_DOUBLE_EQ(h.as_double(), 2.5);
}

TEST(WidgetLayoutTest, UntouchedDoublesKeepDecimalNotation) {
    auto outcome = scale_widget_heights(
        R"([{"i":"a \"q\"","h":0.75,"x":0.5,"y":12.75,"opacity":0.1,"tags":[1,true,null]}])", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);
    EXPECT_EQ(outcome.value,
              R"([{"i":"a \"q\"","h":1.5,"x":0.5,"y":12.75,"opacity":0.1,"tags":[1,true,null]}])");
}

TEST(WidgetLayoutTest, NothingToScaleKeepsOriginalBytes) {
    const std::string original = R"([ {"i": "notes", "w": 4},  {"i": "links", "h": "auto"} ])";
    auto outcome = scale_widget_heights(original, 2.0);
    EXPECT_EQ(outcome.status, TransformStatus::Unchanged);
    EXPECT_EQ(outcome.value, original);
}

TEST(WidgetLayoutTest, ZeroHeightIsUnchanged) {
    auto outcome = scale_widget_heights(R"([{"h":0}])", 2.0);
    EXPECT_EQ(outcome.status, TransformStatus::Unchanged);
}

TEST(WidgetLayoutTest, InvalidJsonSkippedWithOriginal) {
    auto outcome = scale_widget_heights("{\"widgets\": [", 2.0);
    EXPECT_EQ(outcome.status, TransformStatus::Skipped);
    EXPECT_EQ(outcome.value, "{\"widgets\": [");
    EXPECT_EQ(outcome.reason.rfind("invalid JSON", 0), 0u);
}

TEST(WidgetLayoutTest, OpaquePayloadsUntouched) {
    for (std::string_view raw : {R"({"panels":[{"h":2}]})", R"("just text")", "42", R"({"widgets":"none"})"}) {
        auto outcome = scale_widget_heights(raw, 2.0);
        EXPECT_EQ(outcome.status, TransformStatus::Unchanged) << raw;
        EXPECT_EQ(outcome.value, std::string(raw));
    }
}

TEST(WidgetLayoutTest, NonObjectWidgetsIgnored) {
    auto outcome = scale_widget_heights(R"([null, 3, {"h":2}])", 2.0);
    ASSERT_EQ(outcome.status, TransformStatus::Changed);
    EXPECT_EQ(outcome.value, R"([null,3,{"h":4}])");
}

TEST(WidgetLayoutTest, ApplyingTwiceScalesTwice) {
    auto first = scale_widget_heights(R"([{"h":4}])", 2.0);
    auto second = scale_widget_heights(*first.value, 2.0);
    EXPECT_EQ(second.value, R"([{"h":16}])");
}

TEST(WidgetLayoutTest, ClassifyPayload) {
    EXPECT_TRUE(std::holds_alternative<WidgetArrayV1>(classify_payload(json::parse("[]"))));
    EXPECT_TRUE(std::holds_alternative<DashboardConfigV1>(classify_payload(json::parse(R"({"widgets":[]})"))));
    EXPECT_TRUE(std::holds_alternative<OpaquePayload>(classify_payload(json::parse(R"({"tabs":[]})"))));
    EXPECT_TRUE(std::holds_alternative<OpaquePayload>(classify_payload(json::parse("true"))));
}

TEST(WidgetLayoutTest, ScaleWidgetCountsEveryPath) {
    auto value = json::parse(R"({"h":1,"layouts":{"lg":{"h":1},"sm":{"h":1}},"layout":{"h":1}})");
    auto& widget = value.as_object();
    EXPECT_EQ(scale_widget(widget, 3.0), 4);
    EXPECT_EQ(widget["h"].as_int64(), 3);
    EXPECT_EQ(widget["layout"].as_object()["h"].as_int64(), 3);
}

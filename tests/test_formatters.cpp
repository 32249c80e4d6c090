/**
 * @file test_formatters.cpp
 * @brief Tests for the four change set renderers (GoogleTest)
 *
 * Tests cover:
 * - value rendering and truncation
 * - "no changes" sentinels of every formatter
 * - exact output shapes of unified, side-by-side, json-patch, semantic
 * - formatter selection from options
 * - strict JSON encoding failures
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "structdiff/Errors.hpp"
#include "structdiff/Formatters.hpp"
#include "structdiff/Summary.hpp"

using namespace structdiff;

namespace {

DiffResult make_result(std::vector<Change> changes,
                       const std::string& left = "left.json",
                       const std::string& right = "right.json") {
    DiffResult result;
    result.has_changes = !changes.empty();
    result.summary = summarize(changes);
    result.changes = std::move(changes);
    result.left_label = left;
    result.right_label = right;
    return result;
}

std::string pad(const std::string& text, std::size_t width) {
    return text + std::string(width - text.size(), ' ');
}

} // namespace

// ============================================================================
// Value rendering
// ============================================================================

TEST(FormatValue, StringsAreQuoted) {
    EXPECT_EQ(format_value("hello"), "\"hello\"");
    EXPECT_EQ(format_value("say \"hi\""), "\"say \\\"hi\\\"\"");
}

TEST(FormatValue, ContainersAreCompactJson) {
    EXPECT_EQ(format_value(Value::parse(R"({"a": [1, 2], "b": null})")),
              R"({"a":[1,2],"b":null})");
    EXPECT_EQ(format_value(Value::array()), "[]");
}

TEST(FormatValue, Scalars) {
    EXPECT_EQ(format_value(42), "42");
    EXPECT_EQ(format_value(3.5), "3.5");
    EXPECT_EQ(format_value(true), "true");
    EXPECT_EQ(format_value(nullptr), "null");
}

TEST(FormatValue, InvalidUtf8DoesNotThrow) {
    EXPECT_NO_THROW(format_value(std::string("bad\xff")));
}

TEST(Truncate, ShortTextUnchanged) {
    EXPECT_EQ(structdiff::truncate("abc", 5), "abc");
    EXPECT_EQ(structdiff::truncate("abcde", 5), "abcde");
}

TEST(Truncate, LongTextGetsEllipsis) {
    EXPECT_EQ(structdiff::truncate("abcdefgh", 6), "abc...");
}

TEST(Truncate, TinyWidthCutsWithoutEllipsis) {
    EXPECT_EQ(structdiff::truncate("abcdef", 2), "ab");
}

// ============================================================================
// "No changes" sentinels
// ============================================================================

TEST(NoChangesSentinel, EveryFormatter) {
    DiffResult empty = make_result({});
    EXPECT_EQ(UnifiedFormatter().format(empty), "");
    EXPECT_EQ(SideBySideFormatter().format(empty), "");
    EXPECT_EQ(JsonPatchFormatter().format(empty), "[]");
    EXPECT_EQ(SemanticFormatter().format(empty), "No changes detected\n");
}

// ============================================================================
// Unified
// ============================================================================

TEST(UnifiedFormatter, ReplaceAddRemove) {
    DiffResult result = make_result({
        Change::add("added", 1),
        Change::remove("gone", Value::parse(R"({"x": true})")),
        Change::replace("key", "old", "new"),
    }, "a.yaml", "b.yaml");

    EXPECT_EQ(UnifiedFormatter().format(result),
              "--- a.yaml\n"
              "+++ b.yaml\n"
              "+ added: 1\n"
              "- gone: {\"x\":true}\n"
              "- key: \"old\"\n"
              "+ key: \"new\"\n");
}

TEST(UnifiedFormatter, ReservedHintsAreKept) {
    UnifiedFormatter formatter(7, true);
    EXPECT_EQ(formatter.context_lines(), 7);
    EXPECT_TRUE(formatter.colorize());
    EXPECT_EQ(formatter.name(), "unified");
}

// ============================================================================
// Side-by-side
// ============================================================================

TEST(SideBySideFormatter, HeaderAndRows) {
    DiffResult result = make_result({
        Change::replace("key", "old", "new"),
        Change::add("extra", 2),
        Change::remove("stale", false),
    }, "left", "right");

    const std::string rule(59, '-');
    EXPECT_EQ(SideBySideFormatter().format(result),
              pad("left", 57) + " | right\n" +
              rule + "|" + rule + "\n" +
              pad("key: \"old\"", 57) + " | key: \"new\"\n" +
              pad("", 57) + " | extra: 2\n" +
              pad("stale: false", 57) + " | \n");
}

TEST(SideBySideFormatter, LongCellsAreTruncated) {
    const std::string long_text(100, 'x');
    DiffResult result = make_result({Change::replace("k", long_text, long_text + "y")});

    std::string out = SideBySideFormatter().format(result);
    std::string expected_cell = truncate("k: \"" + long_text + "\"", 57);
    EXPECT_EQ(expected_cell.size(), 57u);
    EXPECT_NE(out.find(expected_cell + " | " + expected_cell + "\n"), std::string::npos);
}

TEST(SideBySideFormatter, CustomWidth) {
    DiffResult result = make_result({Change::add("a", 1)}, "L", "R");
    std::string out = SideBySideFormatter(20).format(result);
    EXPECT_EQ(out,
              pad("L", 7) + " | R\n" +
              std::string(9, '-') + "|" + std::string(9, '-') + "\n" +
              pad("", 7) + " | a: 1\n");
}

// ============================================================================
// JSON-Patch-like
// ============================================================================

TEST(JsonPatchFormatter, ExactOutput) {
    DiffResult result = make_result({Change::replace("key", "old", "new")});
    EXPECT_EQ(JsonPatchFormatter().format(result),
              "[\n"
              "  {\n"
              "    \"op\": \"replace\",\n"
              "    \"path\": \"/key\",\n"
              "    \"value\": \"new\"\n"
              "  }\n"
              "]");
}

TEST(JsonPatchFormatter, OperationsAndPaths) {
    DiffResult result = make_result({
        Change::add("outer.inner", Value::parse(R"({"a": 1})")),
        Change::remove("items[2]", "c"),
        Change::replace("spec.replicas", 1, 3),
    });

    Value patch = Value::parse(JsonPatchFormatter().format(result));
    ASSERT_TRUE(patch.is_array());
    ASSERT_EQ(patch.size(), 3u);

    EXPECT_EQ(patch[0]["op"], "add");
    EXPECT_EQ(patch[0]["path"], "/outer/inner");
    EXPECT_EQ(patch[0]["value"], Value::parse(R"({"a": 1})"));

    EXPECT_EQ(patch[1]["op"], "remove");
    EXPECT_EQ(patch[1]["path"], "/items[2]");
    EXPECT_FALSE(patch[1].contains("value"));

    EXPECT_EQ(patch[2]["op"], "replace");
    EXPECT_EQ(patch[2]["path"], "/spec/replicas");
    EXPECT_EQ(patch[2]["value"], 3);
}

TEST(JsonPatchFormatter, NullValueIsKept) {
    DiffResult result = make_result({Change::replace("x", 1, nullptr)});
    Value patch = Value::parse(JsonPatchFormatter().format(result));
    ASSERT_TRUE(patch[0].contains("value"));
    EXPECT_TRUE(patch[0]["value"].is_null());
}

TEST(JsonPatchFormatter, UnencodableValueRaisesFormatError) {
    DiffResult result = make_result({Change::add("name", std::string("bad\xff"))});
    try {
        JsonPatchFormatter().format(result);
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.formatter(), "json-patch");
        EXPECT_FALSE(e.details().empty());
    }
}

// ============================================================================
// Semantic
// ============================================================================

TEST(SemanticFormatter, ExactReport) {
    DiffResult result = make_result({
        Change::add("labels.team", "core"),
        Change::remove("spec.debug", true),
        Change::replace("key", "old", "new"),
    }, "remote: workflow/wf-1", "local: wf.yaml");

    EXPECT_EQ(SemanticFormatter().format(result),
              "Comparing: remote: workflow/wf-1 vs local: wf.yaml\n"
              "\n"
              "Changes:\n"
              "  + labels.team: \"core\"\n"
              "  - spec.debug: true\n"
              "  ~ key: \"old\" \xE2\x86\x92 \"new\"\n"
              "\n"
              "Summary: 1 modified, 1 added, 1 removed\n"
              "Impact: medium\n");
}

// ============================================================================
// Selection
// ============================================================================

TEST(MakeFormatter, DefaultIsUnified) {
    EXPECT_EQ(make_formatter(DiffOptions{})->name(), "unified");
}

TEST(MakeFormatter, FollowsFormat) {
    DiffOptions opts;
    opts.format = DiffFormat::SideBySide;
    EXPECT_EQ(make_formatter(opts)->name(), "side-by-side");
    opts.format = DiffFormat::JsonPatch;
    EXPECT_EQ(make_formatter(opts)->name(), "json-patch");
    opts.format = DiffFormat::Semantic;
    EXPECT_EQ(make_formatter(opts)->name(), "semantic");
}

TEST(MakeFormatter, SemanticFlagOverridesFormat) {
    DiffOptions opts;
    opts.format = DiffFormat::JsonPatch;
    opts.semantic = true;
    EXPECT_EQ(make_formatter(opts)->name(), "semantic");
}

TEST(MakeFormatter, UnifiedReceivesHints) {
    DiffOptions opts;
    opts.context_lines = 9;
    opts.colorize = true;
    auto formatter = make_formatter(opts);
    auto* unified = dynamic_cast<UnifiedFormatter*>(formatter.get());
    ASSERT_NE(unified, nullptr);
    EXPECT_EQ(unified->context_lines(), 9);
    EXPECT_TRUE(unified->colorize());
}

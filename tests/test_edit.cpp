/**
 * @file test_edit.cpp
 * @brief Tests for edit parsing and batch processing (GoogleTest)
 */

#include <gtest/gtest.h>
#include "yedit/Edit.hpp"
#include "yedit/Errors.hpp"

using namespace yedit;

namespace {

Edit make_edit(const std::string& key, const Value& value,
               EditAction action = EditAction::Set) {
    Edit e;
    e.key = key;
    e.value = value;
    e.action = action;
    return e;
}

} // namespace

// ============================================================================
// Edit::from_value
// ============================================================================

TEST(EditFromValue, DefaultsToSet) {
    Edit e = Edit::from_value(Value::parse(R"({"key": "a.b", "value": "1"})"));
    EXPECT_EQ(e.key, "a.b");
    EXPECT_EQ(e.value, "1");
    EXPECT_EQ(e.action, EditAction::Set);
    EXPECT_FALSE(e.index.has_value());
    EXPECT_EQ(e.curr_value_format, ValueFormat::Yaml);
}

TEST(EditFromValue, ActionName) {
    Edit e = Edit::from_value(Value::parse(
        R"({"key": "a", "value": 2, "action": "update", "curr_value": "1",
            "curr_value_format": "str"})"));
    EXPECT_EQ(e.action, EditAction::Update);
    ASSERT_TRUE(e.curr_value.has_value());
    EXPECT_EQ(*e.curr_value, "1");
    EXPECT_EQ(e.curr_value_format, ValueFormat::PlainString);
}

TEST(EditFromValue, BooleanSelectors) {
    EXPECT_EQ(Edit::from_value(Value::parse(R"({"key": "a", "value": 1, "append": true})")).action,
              EditAction::Append);
    Edit ins = Edit::from_value(Value::parse(
        R"({"key": "a", "value": 1, "insert": "yes", "index": "2"})"));
    EXPECT_EQ(ins.action, EditAction::Insert);
    EXPECT_EQ(ins.index, 2);
}

TEST(EditFromValue, Rejects) {
    EXPECT_THROW(Edit::from_value(Value::parse("[1]")), ParameterError);
    EXPECT_THROW(Edit::from_value(Value::parse(R"({"key": "a"})")), ParameterError);
    EXPECT_THROW(Edit::from_value(Value::parse(R"({"key": "a", "value": 1, "action": "merge"})")),
                 ParameterError);
    EXPECT_THROW(Edit::from_value(Value::parse(R"({"key": "a", "value": 1, "index": "x"})")),
                 ParameterError);
}

TEST(EditsFromValue, ListOrWrappedList) {
    auto list = edits_from_value(Value::parse(R"([{"key": "a", "value": 1}, {"key": "b", "value": 2}])"));
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1].key, "b");

    auto wrapped = edits_from_value(Value::parse(R"({"edits": [{"key": "c", "value": 3}]})"));
    ASSERT_EQ(wrapped.size(), 1u);
    EXPECT_EQ(wrapped[0].key, "c");

    EXPECT_THROW(edits_from_value(Value("a")), ParameterError);
}

TEST(EditActionNames, RoundTrip) {
    for (auto action : {EditAction::Set, EditAction::Update, EditAction::Append, EditAction::Insert}) {
        EXPECT_EQ(parse_edit_action(to_string(action)), action);
    }
    EXPECT_EQ(parse_edit_action("put"), EditAction::Set);
}

TEST(EditActionNames, DeleteIsNotAnEditAction) {
    EXPECT_THROW(parse_edit_action("delete"), ParameterError);
    EXPECT_THROW(Edit::from_value(Value::parse(R"({"key": "a", "value": 1, "action": "delete"})")),
                 ParameterError);
}

// ============================================================================
// process_edits
// ============================================================================

TEST(ProcessEdits, AppliesInOrderAndCoerces) {
    Document doc;
    auto batch = process_edits(doc, {
        make_edit("a.b", "1"),
        make_edit("a.list", "x", EditAction::Append),
        make_edit("a.list", "first", EditAction::Insert),
    });

    EXPECT_TRUE(batch.changed);
    ASSERT_EQ(batch.results.size(), 3u);
    EXPECT_EQ(batch.results[0].key, "a.b");
    EXPECT_EQ(batch.results[0].edit, Value::parse(R"({"a": {"b": 1}})"));
    EXPECT_EQ(doc.tree(), Value::parse(R"({"a": {"b": 1, "list": ["first", "x"]}})"));
}

TEST(ProcessEdits, UnchangedEditsNotRecorded) {
    Document doc;
    doc.set_tree(Value::parse(R"({"a": 1})"));
    auto batch = process_edits(doc, {make_edit("a", "1"), make_edit("b", "2")});
    EXPECT_TRUE(batch.changed);
    ASSERT_EQ(batch.results.size(), 1u);
    EXPECT_EQ(batch.results[0].key, "b");

    auto again = process_edits(doc, {make_edit("a", "1"), make_edit("b", "2")});
    EXPECT_FALSE(again.changed);
    EXPECT_TRUE(again.results.empty());
    EXPECT_EQ(again.results_value(), Value::array());
}

TEST(ProcessEdits, ConditionalUpdateUsesFormat) {
    Document doc;
    doc.set_tree(Value::parse(R"({"a": ["1", 1]})"));

    Edit e = make_edit("a", "2", EditAction::Update);
    e.curr_value = Value("1");
    e.curr_value_format = ValueFormat::PlainString;
    process_edits(doc, {e});
    EXPECT_EQ(doc.tree()["a"], Value::parse(R"([2, 1])"));

    e.value = "3";
    e.curr_value_format = ValueFormat::Yaml;
    process_edits(doc, {e});
    EXPECT_EQ(doc.tree()["a"], Value::parse(R"([2, 3])"));
}

TEST(ProcessEdits, DeclaredTypes) {
    Document doc;
    Edit flag = make_edit("flag", "yes");
    flag.value_type = "bool";
    Edit text = make_edit("text", "5");
    text.value_type = "str";
    process_edits(doc, {flag, text});
    EXPECT_EQ(doc.tree(), Value::parse(R"({"flag": true, "text": "5"})"));
}

TEST(ProcessEdits, FailingBatchIsAllOrNothing) {
    Document doc;
    EXPECT_THROW(process_edits(doc, {make_edit("x", "1"), make_edit("x.y", "2")}),
                 PathConflictError);
    EXPECT_TRUE(doc.tree().is_object());
    EXPECT_TRUE(doc.tree().empty());
}

TEST(ProcessEdits, CoercionFailureRollsBack) {
    Document doc;
    doc.set_tree(Value::parse(R"({"keep": 1})"));
    Edit bad = make_edit("flag", "perhaps");
    bad.value_type = "bool";
    EXPECT_THROW(process_edits(doc, {make_edit("a", "1"), bad}), TypeMismatchError);
    EXPECT_EQ(doc.tree(), Value::parse(R"({"keep": 1})"));
}

TEST(BatchResult, ResultsValueShape) {
    BatchResult batch;
    batch.changed = true;
    batch.results.push_back(EditRecord{"a", Value::parse(R"({"a": 1})")});
    EXPECT_EQ(batch.results_value(), Value::parse(R"([{"key": "a", "edit": {"a": 1}}])"));
}

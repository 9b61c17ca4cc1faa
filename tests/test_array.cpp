/**
 * @file test_array.cpp
 * @brief Unit tests for arrays and element type unification (GoogleTest)
 *
 * Tests cover:
 * - fold_native_type promotion and rejection rules
 * - element_type() for flat and nested arrays
 * - dimensions() depth and length
 * - finalize() source text
 */

#include <gtest/gtest.h>
#include "tomlet/Array.hpp"

#include <initializer_list>
#include <utility>

using namespace tomlet;

// ============================================================================
// Test helpers
// ============================================================================

namespace {

void add_scalar(Array& array, ValueType type, const std::string& text) {
    array.add_entry(std::make_unique<Entry>(array.group(), array.next_entry_name(),
                                            text, 1, 0, type, true));
}

std::unique_ptr<Array> make_array(std::initializer_list<std::pair<ValueType, std::string>> values) {
    auto array = std::make_unique<Array>("", "a", 1, 4);
    for (const auto& [type, text] : values) {
        add_scalar(*array, type, text);
    }
    array->finalize();
    return array;
}

Array& add_child_array(Array& parent, std::initializer_list<std::pair<ValueType, std::string>> values) {
    auto child = std::make_unique<Array>(parent.group(), parent.size(), 1, 0);
    for (const auto& [type, text] : values) {
        add_scalar(*child, type, text);
    }
    child->finalize();
    return static_cast<Array&>(parent.add_entry(std::move(child)));
}

} // namespace

// ============================================================================
// fold_native_type
// ============================================================================

TEST(FoldNativeTypeTest, FirstElementEstablishesType) {
    for (NativeType t : {NativeType::Int64, NativeType::Double, NativeType::Bool,
                         NativeType::Timestamp, NativeType::Text}) {
        NativeType current = NativeType::None;
        EXPECT_TRUE(fold_native_type(current, t));
        EXPECT_EQ(current, t);
    }
}

TEST(FoldNativeTypeTest, IntegerPromotesToDouble) {
    NativeType current = NativeType::Int64;
    EXPECT_TRUE(fold_native_type(current, NativeType::Double));
    EXPECT_EQ(current, NativeType::Double);

    EXPECT_TRUE(fold_native_type(current, NativeType::Int64));
    EXPECT_EQ(current, NativeType::Double);
}

TEST(FoldNativeTypeTest, BoolOnlyFoldsWithBool) {
    NativeType current = NativeType::Bool;
    EXPECT_FALSE(fold_native_type(current, NativeType::Int64));

    current = NativeType::Int64;
    EXPECT_FALSE(fold_native_type(current, NativeType::Bool));

    current = NativeType::Text;
    EXPECT_FALSE(fold_native_type(current, NativeType::Bool));
}

TEST(FoldNativeTypeTest, TextAbsorbsBoolAndTimestamp) {
    NativeType current = NativeType::Bool;
    EXPECT_TRUE(fold_native_type(current, NativeType::Text));
    EXPECT_EQ(current, NativeType::Text);

    current = NativeType::Timestamp;
    EXPECT_TRUE(fold_native_type(current, NativeType::Text));
    EXPECT_EQ(current, NativeType::Text);

    EXPECT_TRUE(fold_native_type(current, NativeType::Timestamp));
    EXPECT_EQ(current, NativeType::Text);
}

TEST(FoldNativeTypeTest, TextRejectsNumbers) {
    NativeType current = NativeType::Int64;
    EXPECT_FALSE(fold_native_type(current, NativeType::Text));

    current = NativeType::Text;
    EXPECT_FALSE(fold_native_type(current, NativeType::Double));
}

TEST(FoldNativeTypeTest, ObjectNeverFolds) {
    NativeType current = NativeType::None;
    EXPECT_FALSE(fold_native_type(current, NativeType::Object));
}

// ============================================================================
// element_type
// ============================================================================

TEST(ArrayElementTypeTest, Integers) {
    auto a = make_array({{ValueType::Int, "1"}, {ValueType::Int, "2"}, {ValueType::Int, "3"}});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Int64, 1}));
}

TEST(ArrayElementTypeTest, IntThenFloatIsDouble) {
    auto a = make_array({{ValueType::Int, "1"}, {ValueType::Float, "2.0"}});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Double, 1}));
}

TEST(ArrayElementTypeTest, BoolAndIntFallBackToObject) {
    auto a = make_array({{ValueType::Boolean, "true"}, {ValueType::Int, "1"}});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Object, 1}));
}

TEST(ArrayElementTypeTest, StringAbsorbsDateTimeEitherOrder) {
    auto a = make_array({{ValueType::String, "x"}, {ValueType::DateTime, "2020-01-01"}});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Text, 1}));

    auto b = make_array({{ValueType::DateTime, "2020-01-01"}, {ValueType::String, "x"}});
    EXPECT_EQ(b->element_type(), (ArrayType{NativeType::Text, 1}));
}

TEST(ArrayElementTypeTest, BoolThenStringIsText) {
    auto a = make_array({{ValueType::Boolean, "true"}, {ValueType::String, "x"}});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Text, 1}));

    auto b = make_array({{ValueType::String, "x"}, {ValueType::Boolean, "true"}});
    EXPECT_EQ(b->element_type(), (ArrayType{NativeType::Object, 1}));
}

TEST(ArrayElementTypeTest, EmptyArrayIsObject) {
    auto a = make_array({});
    EXPECT_EQ(a->element_type(), (ArrayType{NativeType::Object, 1}));
}

TEST(ArrayElementTypeTest, NestedIntegers) {
    auto outer = std::make_unique<Array>("", "m", 1, 4);
    add_child_array(*outer, {{ValueType::Int, "1"}, {ValueType::Int, "2"}});
    add_child_array(*outer, {{ValueType::Int, "3"}, {ValueType::Int, "4"}});
    outer->finalize();

    EXPECT_EQ(outer->element_type(), (ArrayType{NativeType::Int64, 2}));
    EXPECT_EQ(outer->element_type().to_string(), "Int64[][]");
}

TEST(ArrayElementTypeTest, NestedDisagreeingChildren) {
    auto outer = std::make_unique<Array>("", "m", 1, 4);
    add_child_array(*outer, {{ValueType::Int, "1"}});
    add_child_array(*outer, {{ValueType::String, "a"}});
    outer->finalize();

    EXPECT_EQ(outer->element_type(), (ArrayType{NativeType::Object, 1}));
}

TEST(ArrayElementTypeTest, MixedScalarAndArrayChildren) {
    auto outer = std::make_unique<Array>("", "m", 1, 4);
    add_child_array(*outer, {{ValueType::Int, "1"}});
    add_scalar(*outer, ValueType::Int, "2");
    outer->finalize();

    EXPECT_EQ(outer->element_type(), (ArrayType{NativeType::Object, 1}));
}

// ============================================================================
// dimensions
// ============================================================================

TEST(ArrayDimensionsTest, Flat) {
    auto a = make_array({{ValueType::Int, "1"}, {ValueType::Int, "2"}, {ValueType::Int, "3"}});
    EXPECT_EQ(a->dimensions().depth, 1u);
    EXPECT_EQ(a->dimensions().length, 3u);
}

TEST(ArrayDimensionsTest, NestedSquare) {
    auto outer = std::make_unique<Array>("", "m", 1, 4);
    add_child_array(*outer, {{ValueType::Int, "1"}, {ValueType::Int, "2"}});
    add_child_array(*outer, {{ValueType::Int, "3"}, {ValueType::Int, "4"}});
    outer->finalize();

    EXPECT_EQ(outer->dimensions().depth, 2u);
    EXPECT_EQ(outer->dimensions().length, 2u);
}

TEST(ArrayDimensionsTest, LengthIsLongestLevel) {
    auto outer = std::make_unique<Array>("", "m", 1, 4);
    add_child_array(*outer, {{ValueType::Int, "1"}, {ValueType::Int, "2"},
                             {ValueType::Int, "3"}, {ValueType::Int, "4"}});
    outer->finalize();

    EXPECT_EQ(outer->dimensions().depth, 2u);
    EXPECT_EQ(outer->dimensions().length, 4u);
}

// ============================================================================
// finalize / rendering
// ============================================================================

TEST(ArrayFinalizeTest, SourceTextFromChildren) {
    auto a = make_array({{ValueType::String, "x"}, {ValueType::Int, "2"}});
    EXPECT_TRUE(a->finalized());
    EXPECT_EQ(a->source_text(), "[\"x\",2]");
}

TEST(ArrayFinalizeTest, ToString) {
    auto a = make_array({{ValueType::Int, "1"}, {ValueType::Int, "2"}});
    EXPECT_EQ(a->to_string(), "Array a = [1, 2]");
}

TEST(ArrayFinalizeTest, ChildArraysAreMarkedInArray) {
    auto outer = std::make_unique<Array>("grp", "m", 1, 4);
    Array& child = add_child_array(*outer, {{ValueType::Int, "1"}});
    EXPECT_TRUE(child.in_array());
    EXPECT_EQ(child.name(), "0");
    EXPECT_EQ(child.group(), "grp");
    EXPECT_EQ(outer->next_entry_name(), "1");
}

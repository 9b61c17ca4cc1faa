/**
 * @file test_serializer.cpp
 * @brief Unit tests for the object graph writer (GoogleTest)
 *
 * Tests cover:
 * - Member ordering (scalars, arrays, sub-groups)
 * - Root key group trimming and nested headers
 * - Literal formatting (strings, floats)
 * - Rejected shapes
 * - Reading the output back with the parser
 */

#include <gtest/gtest.h>
#include "tomlet/Serializer.hpp"
#include "tomlet/Parser.hpp"
#include "tomlet/Errors.hpp"

#include <limits>
#include <sstream>
#include <vector>

using namespace tomlet;

// ============================================================================
// Test types
// ============================================================================

namespace {

struct Endpoint {
    std::string ip;
    int port = 0;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Endpoint, ip, port)

struct Service {
    std::string name;
    bool enabled = false;
    double ratio = 0.0;
    std::vector<int> ports;
    std::vector<std::vector<int>> matrix;
    Endpoint endpoint;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Service, name, enabled, ratio, ports, matrix, endpoint)

Service make_service() {
    Service s;
    s.name = "api \"edge\"";
    s.enabled = true;
    s.ratio = 0.5;
    s.ports = {8080, 8081};
    s.matrix = {{1, 2}, {3}};
    s.endpoint = Endpoint{"10.0.0.1", 9000};
    return s;
}

} // namespace

// ============================================================================
// Layout
// ============================================================================

TEST(SerializerTest, FlatObjectUnderHeader) {
    std::ostringstream out;
    Serializer::write(Endpoint{"10.0.0.1", 8080}, "server", out);
    EXPECT_EQ(out.str(), "[server]\nip = \"10.0.0.1\"\nport = 8080\n");
}

TEST(SerializerTest, NoHeaderForEmptyRoot) {
    std::ostringstream out;
    Serializer::write(Endpoint{"h", 1}, "", out);
    EXPECT_EQ(out.str(), "ip = \"h\"\nport = 1\n");
}

TEST(SerializerTest, ScalarsThenArraysThenGroups) {
    std::ostringstream out;
    Serializer::write(make_service(), "svc", out);
    EXPECT_EQ(out.str(),
              "[svc]\n"
              "enabled = true\n"
              "name = \"api \\\"edge\\\"\"\n"
              "ratio = 0.5\n"
              "matrix = [[1, 2], [3]]\n"
              "ports = [8080, 8081]\n"
              "\n"
              "[svc.endpoint]\n"
              "ip = \"10.0.0.1\"\n"
              "port = 9000\n");
}

TEST(SerializerTest, RootKeyGroupIsTrimmed) {
    nlohmann::json j = {{"a", 1}};
    EXPECT_EQ(Serializer::to_string(j, "[server]"), "[server]\na = 1\n");
    EXPECT_EQ(Serializer::to_string(j, " .x.y. "), "[x.y]\na = 1\n");
}

TEST(SerializerTest, NullMembersAreSkipped) {
    nlohmann::json j = {{"a", nullptr}, {"b", 2}};
    EXPECT_EQ(Serializer::to_string(j), "b = 2\n");
}

// ============================================================================
// Literals
// ============================================================================

TEST(SerializerLiteralTest, Strings) {
    EXPECT_EQ(Serializer::literal("tab\there\n", "s"), "\"tab\\there\\n\"");
    EXPECT_EQ(Serializer::literal("back\\slash", "s"), "\"back\\\\slash\"");
}

TEST(SerializerLiteralTest, FloatsAlwaysHaveAPoint) {
    EXPECT_EQ(Serializer::format_float(1.0, "f"), "1.0");
    EXPECT_EQ(Serializer::format_float(-2.5, "f"), "-2.5");
    EXPECT_EQ(Serializer::format_float(0.1, "f"), "0.1");
    EXPECT_EQ(Serializer::format_float(0.0, "f"), "0.0");
}

TEST(SerializerLiteralTest, FloatsNeverUseExponents) {
    EXPECT_EQ(Serializer::format_float(1e20, "f"), "100000000000000000000.0");
    EXPECT_EQ(Serializer::format_float(1.5e-7, "f"), "0.00000015");
}

TEST(SerializerLiteralTest, Integers) {
    EXPECT_EQ(Serializer::literal(nlohmann::json(-42), "n"), "-42");
    EXPECT_EQ(Serializer::literal(nlohmann::json(std::uint64_t{18446744073709551615ULL}), "n"),
              "18446744073709551615");
}

// ============================================================================
// Rejected shapes
// ============================================================================

TEST(SerializerErrorTest, ObjectInArray) {
    nlohmann::json j = {{"items", nlohmann::json::array({nlohmann::json{{"a", 1}}})}};
    try {
        Serializer::to_string(j);
        FAIL() << "Expected SerializeError";
    } catch (const SerializeError& e) {
        EXPECT_EQ(e.path(), "items.0");
        EXPECT_NE(std::string(e.what()).find("complex types"), std::string::npos);
    }
}

TEST(SerializerErrorTest, NullInArray) {
    nlohmann::json j = {{"items", nlohmann::json::array({1, nullptr})}};
    EXPECT_THROW(Serializer::to_string(j), SerializeError);
}

TEST(SerializerErrorTest, NonObjectRoot) {
    EXPECT_THROW(Serializer::to_string(nlohmann::json::array({1, 2})), SerializeError);
    EXPECT_THROW(Serializer::to_string(nlohmann::json(5)), SerializeError);
}

TEST(SerializerErrorTest, InvalidKey) {
    nlohmann::json j = {{"bad key", 1}};
    EXPECT_THROW(Serializer::to_string(j), SerializeError);
}

TEST(SerializerErrorTest, NonFiniteFloat) {
    nlohmann::json j = {{"x", std::numeric_limits<double>::infinity()}};
    EXPECT_THROW(Serializer::to_string(j), SerializeError);
}

// ============================================================================
// Reading the output back
// ============================================================================

TEST(SerializerRoundTripTest, ParsesBack) {
    std::ostringstream out;
    Serializer::write(make_service(), "svc", out);
    Document doc = parse_string(out.str());

    EXPECT_EQ(doc.get_field_value<std::string>("svc.name"), "api \"edge\"");
    EXPECT_TRUE(doc.get_field_value<bool>("svc.enabled"));
    EXPECT_DOUBLE_EQ(doc.get_field_value<double>("svc.ratio"), 0.5);
    EXPECT_EQ(doc.get_array_value<int>("svc.ports"), (std::vector<int>{8080, 8081}));
    EXPECT_EQ(doc.get_array_value<std::vector<int>>("svc.matrix"),
              (std::vector<std::vector<int>>{{1, 2}, {3}}));
    EXPECT_EQ(doc.get_field_value<std::string>("svc.endpoint.ip"), "10.0.0.1");
    EXPECT_EQ(doc.get_field_value<int>("svc.endpoint.port"), 9000);
}

TEST(SerializerRoundTripTest, JsonMirrorMatchesInput) {
    nlohmann::json j = {
        {"title", "x"},
        {"count", 3},
        {"tags", {"a", "b"}},
        {"owner", {{"name", "Tom"}, {"limits", {{"max", 10}}}}}
    };
    Document doc = parse_string(Serializer::to_string(j));
    EXPECT_EQ(doc.to_json(), j);
}

// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "forkmap/Payload.hxx"

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using std::string_view_literals::operator""sv;
using namespace ForkMap;

namespace {

struct Point {
	int x, y;
	std::string label;

	bool operator==(const Point &) const noexcept = default;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Point, x, y, label)

struct NotTransportable {};

} // anonymous namespace

static_assert(Transportable<int>);
static_assert(Transportable<void>);
static_assert(Transportable<std::string>);
static_assert(Transportable<std::vector<Point>>);
static_assert(!Transportable<NotTransportable>);

TEST(Payload, Format)
{
	EXPECT_EQ(EncodeSuccess(42), R"({"Ok":42})");
	EXPECT_EQ(EncodeSuccess(std::string{"foo"}), R"({"Ok":"foo"})");
	EXPECT_EQ(EncodeSuccessJson(nullptr), R"({"Ok":null})");
	EXPECT_EQ(EncodeError("boom"sv), R"({"Err":"boom"})");
}

TEST(Payload, Success)
{
	EXPECT_EQ(DecodeOutcome<int>(EncodeSuccess(42)), 42);
	EXPECT_EQ(DecodeOutcome<std::string>(EncodeSuccess(std::string{})), "");

	const std::map<std::string, std::vector<Point>> m{
		{"a", {{1, 2, "first"}, {-3, 4, "second"}}},
		{"b", {}},
	};
	EXPECT_EQ((DecodeOutcome<std::map<std::string, std::vector<Point>>>(EncodeSuccess(m))), m);

	DecodeOutcome<void>(EncodeSuccessJson(nullptr));
}

TEST(Payload, Error)
{
	try {
		DecodeOutcome<int>(EncodeError("Something \"bad\"\nhappened"sv));
		FAIL();
	} catch (const ComputationError &e) {
		EXPECT_STREQ(e.what(), "Something \"bad\"\nhappened");
	}

	/* the error tag wins over the expected value type */
	EXPECT_THROW(DecodeOutcome<void>(EncodeError("x"sv)), ComputationError);
}

TEST(Payload, ErrorFromException)
{
	try {
		DecodeOutcome<int>(EncodeError(std::make_exception_ptr(std::runtime_error{"boom"})));
		FAIL();
	} catch (const ComputationError &e) {
		EXPECT_STREQ(e.what(), "boom");
	}

	try {
		DecodeOutcome<int>(EncodeError(std::make_exception_ptr(42)));
		FAIL();
	} catch (const ComputationError &e) {
		EXPECT_STREQ(e.what(), "Unknown error");
	}
}

TEST(Payload, InvalidUtf8)
{
	/* a success value must be valid UTF-8 */
	EXPECT_THROW(EncodeSuccess(std::string{"\xff"}), nlohmann::json::type_error);

	/* an error description is repaired */
	try {
		DecodeOutcome<int>(EncodeError("bad \xff byte"sv));
		FAIL();
	} catch (const ComputationError &e) {
		EXPECT_STREQ(e.what(), "bad \xef\xbf\xbd byte");
	}
}

TEST(Payload, Corrupted)
{
	EXPECT_THROW(DecodeOutcome<int>(""sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>(R"({"Ok":4)"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>("42"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>("[42]"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>("{}"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>(R"({"Ok":1,"Err":"x"})"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>(R"({"Value":1})"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<int>(R"({"Err":42})"sv), PayloadCorrupted);

	/* the value does not match the expected type */
	EXPECT_THROW(DecodeOutcome<int>(R"({"Ok":"foo"})"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<void>(R"({"Ok":[1,2,3]})"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<void>(R"({"Ok":0})"sv), PayloadCorrupted);
	EXPECT_THROW(DecodeOutcome<Point>(R"({"Ok":{"x":1}})"sv), PayloadCorrupted);
}

TEST(Payload, CorruptedIsNested)
{
	try {
		DecodeOutcome<int>(R"({"Ok":"foo"})"sv);
		FAIL();
	} catch (const PayloadCorrupted &e) {
		EXPECT_STREQ(e.what(), "Malformed result value");
		EXPECT_THROW(std::rethrow_if_nested(e), nlohmann::json::type_error);
	}
}

// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <modern-oid/object_id.h>

#include <vector>

using namespace moid;
using namespace std::literals;

TEST_SUITE("parse") {

TEST_CASE("from_chars") {

    constexpr object_id expected("507f1f77bcf86cd799439011");

    constexpr auto o1 = object_id::from_chars("507f1f77bcf86cd799439011");
    static_assert(o1.has_value());
    CHECK(*o1 == expected);

    CHECK(object_id::from_chars("507F1F77BCF86CD799439011"s) == expected);
    CHECK(object_id::from_chars("507f1F77bCf86cD799439011"sv) == expected);
    CHECK(object_id::from_chars(L"507f1f77bcf86cd799439011"s) == expected);
    CHECK(object_id::from_chars(u"507f1f77bcf86cd799439011") == expected);
    CHECK(object_id::from_chars(U"507f1f77bcf86cd799439011"sv) == expected);
    CHECK(object_id::from_chars(u8"507f1f77bcf86cd799439011") == expected);

    std::vector<char> buf{'5','0','7','f','1','f','7','7','b','c','f','8','6','c','d','7','9','9','4','3','9','0','1','1'};
    CHECK(object_id::from_chars(buf) == expected);
    CHECK(object_id::from_chars(std::span<char>(buf)) == expected);
}

TEST_CASE("from_chars rejects") {
    CHECK(!object_id::from_chars(""));
    CHECK(!object_id::from_chars(""sv));
    CHECK(!object_id::from_chars("507f1f77bcf86cd79943901"));
    CHECK(!object_id::from_chars("507f1f77bcf86cd7994390111"));
    CHECK(!object_id::from_chars("507f1f77bcf86cd79943901g"));
    CHECK(!object_id::from_chars("x07f1f77bcf86cd799439011"));
    CHECK(!object_id::from_chars(" 507f1f77bcf86cd79943901"));
    CHECK(!object_id::from_chars("507f1f77-bcf86cd79943901"));
    CHECK(!object_id::from_chars("0x507f1f77bcf86cd7994390"));
    CHECK(!object_id::from_chars("507f1f77bcf86cd79943901\xff"sv));
    CHECK(!object_id::from_chars(L"507f1f77bcf86cd79943901é"));
    CHECK(!object_id::from_chars("507f1f77bcf86cd79943901\0"sv));
}

TEST_CASE("parse") {
    constexpr object_id expected("507f1f77bcf86cd799439011");

    CHECK(object_id::parse("507f1f77bcf86cd799439011") == expected);
    CHECK(object_id::parse("507F1F77BCF86CD799439011"s) == expected);
    CHECK(object_id::parse("507f1f77bcf86cd799439011"sv) == expected);
}

TEST_CASE("parse failures") {
    CHECK_THROWS_ERRC(object_id::parse(""), errc::invalid_format);
    CHECK_THROWS_ERRC(object_id::parse("507f1f77bcf86cd79943901"), errc::invalid_format);
    CHECK_THROWS_ERRC(object_id::parse("507f1f77bcf86cd7994390111"), errc::invalid_format);
    CHECK_THROWS_ERRC(object_id::parse("507f1f77bcf86cd79943901z"), errc::invalid_format);

    const char * null_str = nullptr;
    CHECK_THROWS_ERRC(object_id::parse(null_str), errc::null_input);
}

TEST_CASE("parse error message") {
    try {
        (void)object_id::parse("not an object id");
        FAIL("parse did not throw");
    } catch (const object_id_error & ex) {
        CHECK(ex.code() == errc::invalid_format);
        CHECK(ex.code().category() == error_category());
        CHECK(std::string_view(ex.what()).find("'not an object id'") != std::string_view::npos);
    }
}

TEST_CASE("round trip") {
    const std::string_view samples[] = {
        "000000000000000000000000",
        "000000010000000000000001",
        "507f1f77bcf86cd799439011",
        "ffffffffffffffffffffffff",
        "80000000deadbeefcafe0001"
    };
    for (auto s: samples) {
        CHECK(object_id::parse(s).to_string() == s);
        CHECK(object_id::from_chars(s)->to_string() == s);
    }
    CHECK(object_id::parse("DEADBEEFDEADBEEFDEADBEEF").to_string() == "deadbeefdeadbeefdeadbeef");
}

}

// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include "test_util.h"

#include <string>

using namespace moid;

TEST_SUITE("errors") {

TEST_CASE("category") {
    CHECK(std::string(error_category().name()) == "moid");
    CHECK(&error_category() == &error_category());

    CHECK(error_category().message(int(errc::null_input)) == "required input is missing");
    CHECK(error_category().message(int(errc::invalid_length)) == "invalid length");
    CHECK(error_category().message(int(errc::invalid_format)) == "invalid format");
    CHECK(error_category().message(int(errc::out_of_range)) == "value out of range");
    CHECK(error_category().message(int(errc::invalid_conversion)) == "invalid conversion");
    CHECK(error_category().message(0) == "unknown error");
}

TEST_CASE("error codes") {
    std::error_code ec = errc::invalid_format;
    CHECK(ec.value() == int(errc::invalid_format));
    CHECK(&ec.category() == &error_category());
    CHECK(ec == make_error_code(errc::invalid_format));
    CHECK(ec != make_error_code(errc::invalid_length));
    CHECK(bool(ec));
}

TEST_CASE("exception") {
    object_id_error e1(errc::out_of_range);
    CHECK(e1.code() == make_error_code(errc::out_of_range));

    object_id_error e2(errc::null_input, "buffer is null");
    CHECK(e2.code() == make_error_code(errc::null_input));
    CHECK(std::string(e2.what()).find("buffer is null") != std::string::npos);

    const std::system_error & base = e2;
    CHECK(&base.code().category() == &error_category());
}

}

#include "clob/util.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

TEST_CASE("url_encode handles safe and unsafe characters") {
    using clob::url_encode;
    CHECK(url_encode("simple") == "simple");
    CHECK(url_encode("hello world") == "hello%20world");
    CHECK(url_encode("1+1=2") == "1%2B1%3D2");
    CHECK(url_encode("symbols-_.~") == "symbols-_.~");
    CHECK(url_encode("LTE=") == "LTE%3D");
}

TEST_CASE("filter_empty removes empty values") {
    using clob::filter_empty;
    clob::QueryParams params = {
        {"market", "0xabc"},
        {"next_cursor", ""},
        {"signature_type", "0"},
        {"flag", "false"}
    };

    const auto filtered = filter_empty(params);
    REQUIRE(filtered.size() == 3);
    CHECK(filtered[0].first == "market");
    CHECK(filtered[1].first == "signature_type");
    CHECK(filtered[2].first == "flag");
}

TEST_CASE("build_query_string preserves order and encodes values") {
    using clob::build_query_string;
    clob::QueryParams params = {
        {"user", "0xWallet"},
        {"market", "0xabc"},
        {"note", "space value"}
    };

    CHECK(build_query_string(params) == "user=0xWallet&market=0xabc&note=space%20value");
    CHECK(build_query_string({{"next_cursor", ""}}).empty());
}

TEST_CASE("to_upper_copy converts strings to uppercase") {
    using clob::to_upper_copy;
    CHECK(to_upper_copy("buy") == "BUY");
    CHECK(to_upper_copy("already upper") == "ALREADY UPPER");
}

TEST_CASE("base64 helpers match the standard alphabet") {
    CHECK(clob::base64_encode("hello world") == "aGVsbG8gd29ybGQ=");
    CHECK(clob::base64_encode("ab") == "YWI=");
    CHECK(clob::base64_encode("").empty());

    CHECK(clob::base64_decode("aGVsbG8gd29ybGQ=") == "hello world");
    CHECK(clob::base64_decode("YWI=") == "ab");
    CHECK_THROWS_AS(clob::base64_decode("abc"), std::invalid_argument);
}

TEST_CASE("url-safe base64 swaps alphabet and restores padding") {
    const std::string standard = clob::base64_encode("\xfb\xff\xfe");
    CHECK(standard == "+//+");
    CHECK(clob::to_url_safe_base64(standard) == "-__-");
    CHECK(clob::from_url_safe_base64("-__-") == "+//+");
    CHECK(clob::from_url_safe_base64("YWI") == "YWI=");
}

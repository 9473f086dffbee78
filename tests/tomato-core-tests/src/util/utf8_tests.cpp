#include <catch2/catch_test_macros.hpp>

#include <tomato/util/utf8.hpp>

#include <string>

namespace utf8 {

using tomato::util::TruncatedUTF8Length;

TEST_CASE("UTF-8 truncation keeps text that already fits", "[util][utf8]") {
    CHECK(TruncatedUTF8Length("", 0) == 0);
    CHECK(TruncatedUTF8Length("focus", 5) == 5);
    CHECK(TruncatedUTF8Length("番茄", 255) == 6);
}

TEST_CASE("UTF-8 truncation cuts ASCII at the limit", "[util][utf8]") {
    CHECK(TruncatedUTF8Length("write report", 5) == 5);
    CHECK(TruncatedUTF8Length("write report", 0) == 0);
}

TEST_CASE("UTF-8 truncation never splits a code point", "[util][utf8]") {
    // Each CJK character is three bytes
    const std::string task = "写报告";
    REQUIRE(task.size() == 9);

    CHECK(TruncatedUTF8Length(task, 8) == 6);
    CHECK(TruncatedUTF8Length(task, 7) == 6);
    CHECK(TruncatedUTF8Length(task, 6) == 6);
    CHECK(TruncatedUTF8Length(task, 2) == 0);

    // Four-byte sequence after an ASCII prefix
    const std::string emoji = "a\xF0\x9F\x8D\x85"; // a + tomato emoji
    CHECK(TruncatedUTF8Length(emoji, 4) == 1);
    CHECK(TruncatedUTF8Length(emoji, 5) == 5);
}

TEST_CASE("UTF-8 truncation of a long task fits a fixed buffer", "[util][utf8]") {
    std::string task{"x"};
    for (int i = 0; i < 100; i++) {
        task += "茄";
    }
    REQUIRE(task.size() == 301);

    // 255 bytes hold the prefix and 84 whole characters
    const size_t len = TruncatedUTF8Length(task, 255);
    CHECK(len == 253);
    CHECK((static_cast<unsigned char>(task[len]) & 0xC0) != 0x80);
}

} // namespace utf8

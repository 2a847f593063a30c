/*

test_percent.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE percent_test

#include <boost/test/unit_test.hpp>
#include <smtpuri/codec/percent.hpp>


using smtpuri::percent;


BOOST_AUTO_TEST_CASE(decode_escapes)
{
    BOOST_TEST(percent::decode("user%40gmail.com") == "user@gmail.com");
    BOOST_TEST(percent::decode("pass%2F") == "pass/");
    BOOST_TEST(percent::decode("pass%2f") == "pass/");
    BOOST_TEST(percent::decode("plain") == "plain");
}

BOOST_AUTO_TEST_CASE(decode_plus)
{
    auto form = percent::try_decode("a+b%21", true);
    BOOST_REQUIRE(form.has_value());
    BOOST_TEST(*form == "a b!");

    auto component = percent::try_decode("a+b");
    BOOST_REQUIRE(component.has_value());
    BOOST_TEST(*component == "a+b");
}

BOOST_AUTO_TEST_CASE(decode_bad_escape)
{
    auto truncated = percent::try_decode("abc%4");
    BOOST_REQUIRE(!truncated.has_value());
    BOOST_TEST(truncated.error().code == smtpuri::errc::codec_bad_escape);

    auto not_hex = percent::try_decode("%zz");
    BOOST_REQUIRE(!not_hex.has_value());
    BOOST_TEST(not_hex.error().detail == "invalid escape at offset 0");

    BOOST_CHECK_THROW(static_cast<void>(percent::decode("%")), smtpuri::codec_error);
}

BOOST_AUTO_TEST_CASE(encode_component)
{
    BOOST_TEST(percent::encode_component("user@gmail.com") == "user%40gmail.com");
    BOOST_TEST(percent::encode_component("a b/c", "/") == "a%20b/c");
    BOOST_TEST(percent::encode_component("\xC3\xA9") == "%C3%A9");
}

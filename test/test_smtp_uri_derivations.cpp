/*

test_smtp_uri_derivations.cpp
-----------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE smtp_uri_derivations_test

#include <optional>
#include <string>
#include <boost/test/unit_test.hpp>
#include <smtpuri/smtp/uri.hpp>


using smtpuri::errc;
using smtpuri::smtp::starttls_mode;
using smtpuri::smtp::uri;


namespace
{

uri parse(const std::string& text)
{
    auto parsed = uri::parse(text);
    BOOST_REQUIRE_MESSAGE(parsed.has_value(), text);
    return *parsed;
}

std::string auth_of(const std::string& text)
{
    return parse(text).auth().value_or("<none>");
}

} // namespace


BOOST_AUTO_TEST_CASE(port_defaults)
{
    BOOST_TEST(parse("smtp://localhost").port() == 25);
    BOOST_TEST(parse("smtp://127.0.0.1").port() == 25);
    BOOST_TEST(parse("smtp://127.0.0.1:1025").port() == 1025);
    BOOST_TEST(parse("smtp://foo").port() == 587);
    BOOST_TEST(parse("smtp://foo:123").port() == 123);
    BOOST_TEST(parse("smtps://foo").port() == 465);
    BOOST_TEST(parse("smtps://foo:123").port() == 123);
    BOOST_TEST(parse("smtps://localhost").port() == 25);
}

BOOST_AUTO_TEST_CASE(host_local_is_exact)
{
    BOOST_TEST(parse("smtp://localhost").host_local());
    BOOST_TEST(parse("smtp://127.0.0.1:2525").host_local());
    BOOST_TEST(!parse("smtp://LOCALHOST").host_local());
    BOOST_TEST(!parse("smtp://localhost.example").host_local());
    BOOST_TEST(!parse("smtp://127.0.0.2").host_local());
    BOOST_TEST(parse("smtp://LOCALHOST").port() == 587);
}

BOOST_AUTO_TEST_CASE(starttls_precedence)
{
    BOOST_TEST(parse("smtp+insecure://foo").starttls() == starttls_mode::off);
    BOOST_TEST(parse("smtp://localhost").starttls() == starttls_mode::off);
    BOOST_TEST(parse("smtp://127.0.0.1").starttls() == starttls_mode::off);
    BOOST_TEST(parse("smtp://foo").starttls() == starttls_mode::always);

    // query takes precedence
    BOOST_TEST(parse("smtp://foo?starttls=false").starttls() == starttls_mode::off);
    BOOST_TEST(parse("smtp+insecure://localhost?starttls=true").starttls() == starttls_mode::always);
    BOOST_TEST(parse("smtp+insecure://localhost?starttls=always").starttls() == starttls_mode::always);
    BOOST_TEST(parse("smtp+insecure://localhost?starttls=auto").starttls() == starttls_mode::automatic);
    BOOST_TEST(parse("smtp://foo?starttls=").starttls() == starttls_mode::always);
    BOOST_TEST(parse("smtp://localhost?starttls=").starttls() == starttls_mode::off);

    // smtps then always off
    BOOST_TEST(parse("smtps://foo").starttls() == starttls_mode::off);
    BOOST_TEST(parse("smtps://foo?starttls=true").starttls() == starttls_mode::off);
}

BOOST_AUTO_TEST_CASE(tls_and_insecure)
{
    BOOST_TEST(parse("smtps://foo").tls());
    BOOST_TEST(parse("smtps+login://foo").tls());
    BOOST_TEST(!parse("smtp://foo").tls());
    BOOST_TEST(parse("smtp+insecure://foo").insecure());
    BOOST_TEST(parse("smtp+login+insecure://foo").insecure());
    BOOST_TEST(!parse("smtp+login://foo").insecure());
}

BOOST_AUTO_TEST_CASE(auth_precedence)
{
    // no userinfo
    BOOST_TEST(auth_of("smtp://foo") == "<none>");
    BOOST_TEST(auth_of("smtp+login://foo") == "<none>");
    BOOST_TEST(auth_of("smtp://foo?auth=login") == "<none>");
    BOOST_TEST(auth_of("smtp://@foo") == "<none>");

    // default
    BOOST_TEST(auth_of("smtp://u:p@foo") == "plain");
    BOOST_TEST(auth_of("smtp://:token@foo") == "plain");
    BOOST_TEST(auth_of("smtp://token@foo") == "plain");

    // via scheme
    BOOST_TEST(auth_of("smtp+login://u:p@foo") == "login");
    BOOST_TEST(auth_of("smtp+insecure+login://u:p@foo") == "login");
    BOOST_TEST(auth_of("smtps+xoauth2://u:t@foo") == "xoauth2");

    // none nillifies auth
    BOOST_TEST(auth_of("smtp+none://u:p@foo") == "<none>");
    BOOST_TEST(auth_of("smtp://u:p@foo?auth=none") == "<none>");

    // query is leading
    BOOST_TEST(auth_of("smtp+none://u:p@foo?auth=login") == "login");
    BOOST_TEST(auth_of("smtp+login://u:p@foo?auth=none") == "<none>");
}

BOOST_AUTO_TEST_CASE(domain_sources)
{
    BOOST_TEST(*parse("smtps://foo#sender.org").domain() == "sender.org");
    BOOST_TEST(*parse("smtps://foo?domain=x.org#sender.org").domain() == "x.org");
    BOOST_TEST(*parse("smtps://foo?domain=#sender.org").domain() == "sender.org");
    BOOST_TEST(!parse("smtp://foo#").domain().has_value());
    BOOST_TEST(!parse("smtp://foo").domain().has_value());
}

BOOST_AUTO_TEST_CASE(timeouts)
{
    const auto u = parse("smtp://foo?read_timeout=10&open_timeout=5");
    BOOST_TEST(*u.read_timeout() == 10);
    BOOST_TEST(*u.open_timeout() == 5);
    BOOST_TEST(!parse("smtp://foo?read_timeout=").read_timeout().has_value());
    BOOST_TEST(!parse("smtp://foo").open_timeout().has_value());
}

BOOST_AUTO_TEST_CASE(missing_host)
{
    const auto u = parse("smtp://");
    BOOST_TEST(!u.host().has_value());
    BOOST_TEST(u.port() == 587);
    BOOST_TEST(u.starttls() == starttls_mode::always);
}

BOOST_AUTO_TEST_CASE(unsupported_scheme)
{
    auto parsed = uri::parse("smtpx://foo");
    BOOST_REQUIRE(!parsed.has_value());
    BOOST_TEST(parsed.error().code == errc::uri_unsupported_scheme);
    BOOST_TEST(!uri::parse("https://foo").has_value());
}

BOOST_AUTO_TEST_CASE(malformed_passes_through)
{
    auto direct = smtpuri::uri::generic_uri::parse("smtp://fo o");
    auto parsed = uri::parse("smtp://fo o");
    BOOST_REQUIRE(!direct.has_value());
    BOOST_REQUIRE(!parsed.has_value());
    BOOST_TEST(parsed.error().code == errc::uri_malformed);
    BOOST_TEST(parsed.error().message == direct.error().message);
    BOOST_TEST(parsed.error().detail == direct.error().detail);
}

BOOST_AUTO_TEST_CASE(accessors_are_stable)
{
    const auto u = parse("smtp+login://u%40x:p@foo?starttls=auto&domain=d.org#f.org");
    const auto copy = u;
    BOOST_TEST(u.port() == u.port());
    BOOST_TEST(u.starttls() == u.starttls());
    BOOST_TEST(*u.auth() == *u.auth());
    BOOST_TEST(*u.domain() == *u.domain());
    BOOST_TEST((u.to_config() == u.to_config()));
    BOOST_TEST((u == copy));
}

#include "SessionCfgState.h"
#include "host.h"
#include "doctest.h"

// the test driver opens a scratch ini file before any test runs

TEST_CASE("host: config values")
{
    REQUIRE(host::isInitialized());

    SUBCASE("strings")
    {
        host::configWriteStr("hosttest", "name", "display one");
        std::string val;
        CHECK(host::configReadStr("hosttest", "name", &val));
        CHECK_EQ(val, "display one");

        const std::string dflt("fallback");
        CHECK_FALSE(host::configReadStr("hosttest", "missing", &val, &dflt));
        CHECK_EQ(val, "fallback");
    }

    SUBCASE("integers")
    {
        host::configWriteInt("hosttest", "count", 27);
        int val = 0;
        CHECK(host::configReadInt("hosttest", "count", &val, 3));
        CHECK_EQ(val, 27);

        host::configWriteStr("hosttest", "hex", "0x1F");
        CHECK(host::configReadInt("hosttest", "hex", &val, 3));
        CHECK_EQ(val, 31);

        host::configWriteStr("hosttest", "junk", "twelve");
        CHECK_FALSE(host::configReadInt("hosttest", "junk", &val, 3));
        CHECK_EQ(val, 3);
    }

    SUBCASE("booleans")
    {
        host::configWriteBool("hosttest", "flag", true);
        bool val = false;
        host::configReadBool("hosttest", "flag", &val, false);
        CHECK(val);

        host::configWriteInt("hosttest", "badflag", 7);
        host::configReadBool("hosttest", "badflag", &val, false);
        CHECK_FALSE(val);
    }
}

TEST_CASE("SessionCfgState: defaults")
{
    SessionCfgState cfg;
    CHECK_FALSE(cfg.configOk(false));   // not set up yet

    cfg.setDefaults();
    CHECK(cfg.configOk(false));
    CHECK_EQ(cfg.getScreenSize(), SCREEN_24x80);
    CHECK_EQ(cfg.getResponseFormat(), RESPONSE_LONG);
    CHECK_EQ(cfg.getErrorLine(), 0);
    CHECK(cfg.getTypeAhead());
}

TEST_CASE("SessionCfgState: ini round trip")
{
    SessionCfgState cfg;
    cfg.setDefaults();
    cfg.setScreenSize(SCREEN_27x132);
    cfg.setResponseFormat(RESPONSE_STRUCTURED);
    cfg.setErrorLine(26);
    cfg.setTypeAhead(false);
    cfg.saveIni("roundtrip");

    SessionCfgState loaded;
    loaded.loadIni("roundtrip");
    CHECK(loaded == cfg);
    CHECK_FALSE(loaded != cfg);
    CHECK_EQ(loaded.getScreenSize(), SCREEN_27x132);
    CHECK_EQ(loaded.getResponseFormat(), RESPONSE_STRUCTURED);
    CHECK_EQ(loaded.getErrorLine(), 26);
    CHECK_FALSE(loaded.getTypeAhead());
}

TEST_CASE("SessionCfgState: missing and bad ini values")
{
    SessionCfgState empty;
    empty.loadIni("nothing-here");
    CHECK_EQ(empty.getScreenSize(), SCREEN_24x80);
    CHECK_EQ(empty.getResponseFormat(), RESPONSE_LONG);
    CHECK_EQ(empty.getErrorLine(), 0);
    CHECK(empty.getTypeAhead());

    host::configWriteStr("badvals", "screenSize", "40x100");
    host::configWriteStr("badvals", "responseFormat", "short");
    host::configWriteInt("badvals", "errorLine", 25);     // 24x80 has 24 rows
    SessionCfgState bad;
    bad.loadIni("badvals");
    CHECK_EQ(bad.getScreenSize(), SCREEN_24x80);
    CHECK_EQ(bad.getResponseFormat(), RESPONSE_LONG);
    CHECK_EQ(bad.getErrorLine(), 0);
    CHECK(bad.configOk(true));
}

TEST_CASE("SessionCfgState: copy, compare, validate")
{
    SessionCfgState a;
    a.setDefaults();
    SessionCfgState b(a);
    CHECK(a == b);

    b.setTypeAhead(false);
    CHECK(a != b);
    CHECK_FALSE(a.needsReset(b));

    b = a;
    CHECK(a == b);
    b.setScreenSize(SCREEN_27x132);
    CHECK(a.needsReset(b));

    a.setErrorLine(27);
    CHECK_FALSE(a.configOk(true));      // only 24 rows
    a.setScreenSize(SCREEN_27x132);
    CHECK(a.configOk(true));
    a.setErrorLine(-1);
    CHECK_FALSE(a.configOk(false));
}

// vim: ts=8:et:sw=4:smarttab

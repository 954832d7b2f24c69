#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "envbind/bind/bind.hh"
#include "envbind/bind/tests/mock-environment.hh"
#include "envbind/bind/tests/records.hh"

namespace envbind {

using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using testing::MockEnvironment;
using testing::Outer;
using testing::Struct;
using testing::SubStruct;

static const std::optional<std::string> unset;

/* ----------------------------------------------------------------------------
 * absence and scalars
 * --------------------------------------------------------------------------*/

TEST(bindWithPrefix, absenceIsANoOp)
{
    MapEnvironment env({{"UNRELATED", "1"}, {"TEST_PREFIX", "1"}, {"test_prefix_name", "lower"}});

    Struct s;
    s.name = "kept";
    s.sub.port = 7;
    s.array = {1, 2};
    s.subStructs = {SubStruct{.port = 3}};

    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.name, "kept");
    ASSERT_EQ(s.sub.port, 7);
    ASSERT_EQ(s.array, (std::vector<uint32_t>{1, 2}));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 3}}));
    ASSERT_EQ(s.optional, std::nullopt);
    ASSERT_EQ(s.optionalSub, std::nullopt);
    ASSERT_EQ(s.encoding, TextEncoding::Utf8);
    ASSERT_TRUE(s.path.empty());
}

TEST(bindWithPrefix, scalarOverride)
{
    MapEnvironment env(StringMap{{"PREFIX_PORT", "42"}});

    SubStruct s;
    ASSERT_TRUE(bindWithPrefix(s, "PREFIX_", env));
    ASSERT_EQ(s.port, 42);
}

TEST(bindWithPrefix, emptyPrefix)
{
    MapEnvironment env(StringMap{{"PORT", "42"}});

    SubStruct s;
    ASSERT_TRUE(bindWithPrefix(s, "", env));
    ASSERT_EQ(s.port, 42);
}

TEST(bind, usesSchemaPrefix)
{
    MapEnvironment env({
        {"TEST_PREFIX_NAME", "hello"},
        {"TEST_PREFIX_ENCODING", "latin1"},
        {"TEST_PREFIX_PATH", "/srv/data"},
    });

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.name, "hello");
    ASSERT_EQ(s.encoding, TextEncoding::Windows1252);
    ASSERT_EQ(s.path, std::filesystem::path("/srv/data"));
}

TEST(bind, oneFieldIsEnoughToBeFound)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_PATH", ""}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_TRUE(s.path.empty());
}

TEST(bindWithPrefix, prefixIsNotASeparator)
{
    MapEnvironment env({{"APP_PORT", "1"}, {"APPPORT", "2"}});

    SubStruct s;
    ASSERT_TRUE(bindWithPrefix(s, "APP", env));
    ASSERT_EQ(s.port, 2);
}

/* ----------------------------------------------------------------------------
 * nesting
 * --------------------------------------------------------------------------*/

TEST(bindWithPrefix, nestedColonForm)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_SUB:PORT", "9000"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.sub.port, 9000);
}

TEST(bindWithPrefix, nestedUnderscoreForm)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_SUB__PORT", "9000"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.sub.port, 9000);
}

TEST(bindWithPrefix, nestedUnderscoreFormWins)
{
    MapEnvironment env({{"TEST_PREFIX_SUB:PORT", "1"}, {"TEST_PREFIX_SUB__PORT", "2"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.sub.port, 2);
}

TEST(bindNested, bothFormsAreTried)
{
    MockEnvironment env;
    {
        InSequence seq;
        EXPECT_CALL(env, get("TEST_PREFIX_SUB:PORT")).WillOnce(Return(std::string("1")));
        EXPECT_CALL(env, get("TEST_PREFIX_SUB__PORT")).WillOnce(Return(std::string("2")));
    }

    SubStruct sub;
    ASSERT_TRUE(bindNested("TEST_PREFIX_SUB", true, [&](const std::string & prefix, bool clear) {
        return bindWithPrefix(sub, prefix, env, clear);
    }));
    ASSERT_EQ(sub.port, 2);
}

TEST(bindNested, onlyTheColonAttemptMayClear)
{
    std::vector<std::pair<std::string, bool>> attempts;
    auto record = [&](const std::string & prefix, bool clear) {
        attempts.emplace_back(prefix, clear);
        return false;
    };

    ASSERT_FALSE(bindNested("X", true, record));
    ASSERT_FALSE(bindNested("Y", false, record));

    ASSERT_EQ(
        attempts,
        (std::vector<std::pair<std::string, bool>>{{"X:", true}, {"X__", false}, {"Y:", false}, {"Y__", false}}));
}

TEST(bindWithPrefix, deepNestingMixesForms)
{
    MapEnvironment env({
        {"DEEP_LABEL", "outer"},
        {"DEEP_MIDDLE:INNER__VALUE", "-5"},
        {"DEEP_MIDDLE__INNER:FLAG", "yes"},
        {"DEEP_MIDDLE:ITEMS__0__VALUE", "1"},
        {"DEEP_MIDDLE:ITEMS__1__FLAG", "true"},
    });

    auto o = fromEnv<Outer>(env);

    ASSERT_EQ(o.label, "outer");
    ASSERT_EQ(o.middle.inner.value, -5);
    ASSERT_TRUE(o.middle.inner.flag);
    ASSERT_EQ(o.middle.items.size(), 2u);
    ASSERT_EQ(o.middle.items[0].value, 1);
    ASSERT_FALSE(o.middle.items[0].flag);
    ASSERT_EQ(o.middle.items[1].value, 0);
    ASSERT_TRUE(o.middle.items[1].flag);
}

TEST(bindWithPrefix, deepErrorsReachTheCallerUnchanged)
{
    MapEnvironment env(StringMap{{"DEEP_MIDDLE__ITEMS:0:FLAG", "maybe"}});

    Outer o;
    try {
        bind(o, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "DEEP_MIDDLE__ITEMS:0:FLAG");
        ASSERT_EQ(e.message(), "DEEP_MIDDLE__ITEMS:0:FLAG: 'maybe' is not a Boolean");
    }
}

/* ----------------------------------------------------------------------------
 * errors
 * --------------------------------------------------------------------------*/

TEST(bindWithPrefix, failFast)
{
    MockEnvironment env;
    EXPECT_CALL(env, get(_)).Times(0);
    {
        InSequence seq;
        EXPECT_CALL(env, get("TEST_PREFIX_NAME")).WillOnce(Return(std::string("first")));
        EXPECT_CALL(env, get("TEST_PREFIX_SUB:PORT")).WillOnce(Return(std::string("notanumber")));
    }

    Struct s;
    try {
        bind(s, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "TEST_PREFIX_SUB:PORT");
    }

    // Fields before the failure keep their new values.
    ASSERT_EQ(s.name, "first");
    ASSERT_EQ(s.sub.port, 0);
}

TEST(bindWithPrefix, failFastNamesTheVariable)
{
    MapEnvironment env(StringMap{{"PREFIX_PORT", "notanumber"}});

    SubStruct s;
    try {
        bindWithPrefix(s, "PREFIX_", env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "PREFIX_PORT");
        ASSERT_EQ(e.message(), "PREFIX_PORT: 'notanumber' is not a valid 16-bit unsigned integer");
    }
}

TEST(bindWithPrefix, notUnicodeInNestedRecord)
{
    MapEnvironment env({{"TEST_PREFIX_NAME", "ok"}, {"TEST_PREFIX_SUB__PORT", "\xff"}});

    Struct s;
    try {
        bind(s, env);
        FAIL() << "expected a NotUnicodeError";
    } catch (NotUnicodeError & e) {
        ASSERT_EQ(e.varName(), "TEST_PREFIX_SUB__PORT");
        ASSERT_EQ(e.raw(), "\xff");
    }
    ASSERT_EQ(s.name, "ok");
}

TEST(bindWithPrefix, unknownEncoding)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_ENCODING", "klingon"}});

    Struct s;
    try {
        bind(s, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.message(), "TEST_PREFIX_ENCODING: Unrecognized encoding");
    }
}

/* ----------------------------------------------------------------------------
 * traversal
 * --------------------------------------------------------------------------*/

TEST(bindWithPrefix, visitsFieldsInDeclarationOrder)
{
    MockEnvironment env;
    {
        InSequence seq;
        for (auto name : {
                 "TEST_PREFIX_NAME",
                 "TEST_PREFIX_SUB:PORT",
                 "TEST_PREFIX_SUB__PORT",
                 "TEST_PREFIX_ARRAY:0",
                 "TEST_PREFIX_ARRAY__0",
                 "TEST_PREFIX_ARRAY_STRINGS:0",
                 "TEST_PREFIX_ARRAY_STRINGS__0",
                 "TEST_PREFIX_SUB_STRUCTS:0:PORT",
                 "TEST_PREFIX_SUB_STRUCTS__0__PORT",
                 "TEST_PREFIX_OPTIONAL",
                 "TEST_PREFIX_OPTIONAL_SUB:PORT",
                 "TEST_PREFIX_OPTIONAL_SUB__PORT",
                 "TEST_PREFIX_ENCODING",
                 "TEST_PREFIX_PATH",
             })
            EXPECT_CALL(env, get(std::string(name))).WillOnce(Return(unset));
    }

    Struct s;
    ASSERT_FALSE(bind(s, env));
}

TEST(bindWithPrefix, ignoredFieldIsNeverConsulted)
{
    MockEnvironment env;
    EXPECT_CALL(env, get(_)).WillRepeatedly(Return(unset));
    EXPECT_CALL(env, get("TEST_PREFIX_IGNORED")).Times(0);

    Struct s;
    s.ignored.handle = 3;
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.ignored.handle, 3);
}

TEST(bindWithPrefix, ignoredFieldStaysUntouched)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_IGNORED", "whatever"}});

    Struct s;
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.ignored.handle, -1);
}

/* ----------------------------------------------------------------------------
 * convenience
 * --------------------------------------------------------------------------*/

TEST(fromEnv, startsFromDefaults)
{
    MapEnvironment env(StringMap{{"DEEP_MIDDLE__INNER__VALUE", "12"}});

    auto o = fromEnv<Outer>(env);
    ASSERT_EQ(o.label, "default");
    ASSERT_EQ(o.middle.inner.value, 12);
    ASSERT_FALSE(o.middle.inner.flag);
    ASSERT_TRUE(o.middle.items.empty());
}

TEST(fromEnv, propagatesErrors)
{
    MapEnvironment env(StringMap{{"DEEP_MIDDLE__INNER__VALUE", "twelve"}});

    ASSERT_THROW(fromEnv<Outer>(env), EnvParseError);
}

TEST(bind, idempotent)
{
    MapEnvironment env({
        {"TEST_PREFIX_NAME", "name"},
        {"TEST_PREFIX_SUB:PORT", "1"},
        {"TEST_PREFIX_SUB__PORT", "2"},
        {"TEST_PREFIX_ARRAY__0", "10"},
        {"TEST_PREFIX_ARRAY:1", "11"},
        {"TEST_PREFIX_ARRAY_STRINGS__0", "a"},
        {"TEST_PREFIX_SUB_STRUCTS__0__PORT", "20"},
        {"TEST_PREFIX_SUB_STRUCTS:1:PORT", "21"},
        {"TEST_PREFIX_OPTIONAL", "opt"},
        {"TEST_PREFIX_OPTIONAL_SUB__PORT", "30"},
        {"TEST_PREFIX_ENCODING", "sjis"},
    });

    Struct s;
    ASSERT_TRUE(bind(s, env));
    auto first = toJSON(s);

    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(toJSON(s), first);

    ASSERT_EQ(s.array, (std::vector<uint32_t>{10, 11}));
    ASSERT_EQ(s.subStructs, (std::vector<SubStruct>{{.port = 20}, {.port = 21}}));
}

TEST(bind, idempotentWhenNothingIsSet)
{
    MapEnvironment env;

    Struct s;
    ASSERT_FALSE(bind(s, env));
    auto first = toJSON(s);
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(toJSON(s), first);
}

} // namespace envbind

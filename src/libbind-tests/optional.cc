#include <gtest/gtest.h>

#include "envbind/bind/bind.hh"
#include "envbind/bind/tests/records.hh"

namespace envbind {

using testing::Struct;
using testing::SubStruct;

namespace {

struct Pair
{
    int32_t a = 0;
    int32_t b = 0;

    bool operator==(const Pair &) const = default;

    static const Schema<Pair> & envSchema()
    {
        static const Schema<Pair> schema{
            .fields =
                {
                    scalarField("A", &Pair::a),
                    scalarField("B", &Pair::b),
                },
        };
        return schema;
    }
};

struct WithOptionals
{
    std::optional<uint16_t> limit;
    std::optional<Pair> pair;

    static const Schema<WithOptionals> & envSchema()
    {
        static const Schema<WithOptionals> schema{
            .prefix = "OPT_",
            .fields =
                {
                    optionalField("LIMIT", &WithOptionals::limit),
                    optionalField("PAIR", &WithOptionals::pair),
                },
        };
        return schema;
    }
};

struct Leaf
{
    std::optional<std::string> opt;
    std::optional<Pair> pair;

    bool operator==(const Leaf &) const = default;

    static const Schema<Leaf> & envSchema()
    {
        static const Schema<Leaf> schema{
            .fields =
                {
                    optionalField("OPT", &Leaf::opt),
                    optionalField("PAIR", &Leaf::pair),
                },
        };
        return schema;
    }
};

struct Top
{
    Leaf sub;
    std::optional<Leaf> maybe;

    static const Schema<Top> & envSchema()
    {
        static const Schema<Top> schema{
            .prefix = "P_",
            .fields =
                {
                    nestedField("SUB", &Top::sub),
                    optionalField("MAYBE", &Top::maybe),
                },
        };
        return schema;
    }
};

} // namespace

TEST(optional, presentScalar)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_OPTIONAL", "value"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.optional, "value");
}

TEST(optional, emptyTextIsPresent)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_OPTIONAL", ""}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.optional, "");
}

TEST(optional, clearsOnAbsence)
{
    MapEnvironment env;

    Struct s;
    s.optional = "old";
    s.optionalSub = SubStruct{.port = 5};
    ASSERT_FALSE(bind(s, env));
    ASSERT_EQ(s.optional, std::nullopt);
    ASSERT_EQ(s.optionalSub, std::nullopt);
}

TEST(optional, nestedColonForm)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_OPTIONAL_SUB:PORT", "8"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.optionalSub, SubStruct{.port = 8});
}

TEST(optional, nestedUnderscoreFormWins)
{
    MapEnvironment env({{"TEST_PREFIX_OPTIONAL_SUB:PORT", "8"}, {"TEST_PREFIX_OPTIONAL_SUB__PORT", "9"}});

    Struct s;
    ASSERT_TRUE(bind(s, env));
    ASSERT_EQ(s.optionalSub, SubStruct{.port = 9});
}

TEST(optional, bindsIntoFreshDefault)
{
    MapEnvironment env(StringMap{{"OPT_PAIR__B", "3"}});

    WithOptionals w;
    w.pair = Pair{.a = 1, .b = 2};
    ASSERT_TRUE(bind(w, env));
    ASSERT_EQ(w.pair, (Pair{.a = 0, .b = 3}));
    ASSERT_EQ(w.limit, std::nullopt);
}

TEST(optional, fieldsMayComeFromBothForms)
{
    MapEnvironment env({{"OPT_PAIR:A", "1"}, {"OPT_PAIR__B", "2"}});

    auto w = fromEnv<WithOptionals>(env);
    ASSERT_EQ(w.pair, (Pair{.a = 1, .b = 2}));
}

TEST(optional, decodedScalar)
{
    MapEnvironment env(StringMap{{"OPT_LIMIT", "100"}});

    WithOptionals w;
    w.limit = 1;
    ASSERT_TRUE(bind(w, env));
    ASSERT_EQ(w.limit, 100);
}

TEST(optional, scalarFailureLeavesFieldAbsent)
{
    MapEnvironment env(StringMap{{"OPT_LIMIT", "lots"}});

    WithOptionals w;
    w.limit = 1;
    ASSERT_THROW(bind(w, env), EnvParseError);
    ASSERT_EQ(w.limit, std::nullopt);
}

TEST(optional, nestedFailureLeavesFieldAbsent)
{
    MapEnvironment env({{"OPT_PAIR:A", "1"}, {"OPT_PAIR__B", "two"}});

    WithOptionals w;
    try {
        bind(w, env);
        FAIL() << "expected an EnvParseError";
    } catch (EnvParseError & e) {
        ASSERT_EQ(e.varName(), "OPT_PAIR__B");
    }
    ASSERT_EQ(w.pair, std::nullopt);
}

TEST(optional, notUnicodeLeavesFieldAbsent)
{
    MapEnvironment env(StringMap{{"TEST_PREFIX_OPTIONAL", "\xff"}});

    Struct s;
    s.optional = "old";
    ASSERT_THROW(bind(s, env), NotUnicodeError);
    ASSERT_EQ(s.optional, std::nullopt);
}

/* ----------------------------------------------------------------------------
 * optionals inside nested records
 * --------------------------------------------------------------------------*/

TEST(optional, inNestedColonForm)
{
    MapEnvironment env(StringMap{{"P_SUB:OPT", "x"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.opt, "x");
    ASSERT_EQ(t.sub.pair, std::nullopt);
}

TEST(optional, inNestedUnderscoreForm)
{
    MapEnvironment env(StringMap{{"P_SUB__OPT", "y"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.opt, "y");
}

TEST(optional, inNestedUnderscoreFormWins)
{
    MapEnvironment env({{"P_SUB:OPT", "x"}, {"P_SUB__OPT", "y"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.opt, "y");
}

TEST(optional, inNestedReplacesOldValue)
{
    MapEnvironment env(StringMap{{"P_SUB:OPT", "x"}});

    Top t;
    t.sub.opt = "old";
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.opt, "x");
}

TEST(optional, inNestedClearsOnAbsence)
{
    MapEnvironment env(StringMap{{"P_SUB:PAIR:A", "1"}});

    Top t;
    t.sub.opt = "old";
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.opt, std::nullopt);
    ASSERT_EQ(t.sub.pair, (Pair{.a = 1, .b = 0}));
}

TEST(optional, recordInNestedColonForm)
{
    MapEnvironment env({{"P_SUB:PAIR:A", "1"}, {"P_SUB:PAIR__B", "2"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.pair, (Pair{.a = 1, .b = 2}));
}

TEST(optional, recordInNestedUnderscoreForm)
{
    MapEnvironment env(StringMap{{"P_SUB__PAIR__A", "3"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.pair, (Pair{.a = 3, .b = 0}));
}

TEST(optional, recordInNestedFromBothForms)
{
    MapEnvironment env({{"P_SUB:PAIR:A", "1"}, {"P_SUB:PAIR:B", "2"}, {"P_SUB__PAIR:B", "5"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.sub.pair, (Pair{.a = 1, .b = 5}));
}

TEST(optional, inOptionalRecordColonForm)
{
    MapEnvironment env(StringMap{{"P_MAYBE:OPT", "x"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.maybe, (Leaf{.opt = "x"}));
}

TEST(optional, inOptionalRecordUnderscoreForm)
{
    MapEnvironment env(StringMap{{"P_MAYBE__OPT", "y"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.maybe, (Leaf{.opt = "y"}));
}

TEST(optional, inOptionalRecordUnderscoreFormWins)
{
    MapEnvironment env({{"P_MAYBE:OPT", "x"}, {"P_MAYBE__OPT", "y"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.maybe, (Leaf{.opt = "y"}));
}

TEST(optional, inOptionalRecordFieldsFromBothForms)
{
    MapEnvironment env({{"P_MAYBE:OPT", "x"}, {"P_MAYBE__PAIR:B", "2"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.maybe, (Leaf{.opt = "x", .pair = Pair{.a = 0, .b = 2}}));
}

TEST(optional, recordInOptionalRecordColonForm)
{
    MapEnvironment env(StringMap{{"P_MAYBE:PAIR:A", "4"}});

    Top t;
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(t.maybe, (Leaf{.pair = Pair{.a = 4, .b = 0}}));
}

TEST(optional, inOptionalRecordClearsOnAbsence)
{
    MapEnvironment env;

    Top t;
    t.maybe = Leaf{.opt = "old"};
    t.sub.opt = "old";
    ASSERT_FALSE(bind(t, env));
    ASSERT_EQ(t.maybe, std::nullopt);
    ASSERT_EQ(t.sub.opt, std::nullopt);
}

TEST(optional, nestedBindingIsIdempotent)
{
    MapEnvironment env({
        {"P_SUB:OPT", "x"},
        {"P_SUB__PAIR:A", "1"},
        {"P_MAYBE:OPT", "y"},
        {"P_MAYBE:PAIR__B", "2"},
    });

    Top t;
    ASSERT_TRUE(bind(t, env));
    auto once = toJSON(t);
    ASSERT_TRUE(bind(t, env));
    ASSERT_EQ(toJSON(t), once);

    ASSERT_EQ(t.sub, (Leaf{.opt = "x", .pair = Pair{.a = 1, .b = 0}}));
    ASSERT_EQ(t.maybe, (Leaf{.opt = "y", .pair = Pair{.a = 0, .b = 2}}));
}

TEST(optional, formsAreInterchangeableInNestedRecords)
{
    auto colon = fromEnv<Top>(MapEnvironment({{"P_SUB:OPT", "x"}, {"P_MAYBE:PAIR:A", "1"}}));
    auto underscore = fromEnv<Top>(MapEnvironment({{"P_SUB__OPT", "x"}, {"P_MAYBE__PAIR__A", "1"}}));

    ASSERT_EQ(toJSON(colon), toJSON(underscore));
    ASSERT_EQ(colon.sub.opt, "x");
}

TEST(bindOptional, resetsWhenNothingFound)
{
    std::optional<int> value = 3;

    auto found =
        bindOptional(true, true, [&]() { value.emplace(); }, [&]() { value.reset(); }, [&]() { return false; });

    ASSERT_FALSE(found);
    ASSERT_EQ(value, std::nullopt);
}

TEST(bindOptional, keepsFreshValueWhenFound)
{
    std::optional<int> value = 3;

    auto found =
        bindOptional(true, true, [&]() { value.emplace(); }, [&]() { value.reset(); }, [&]() { return true; });

    ASSERT_TRUE(found);
    ASSERT_EQ(value, 0);
}

TEST(bindOptional, bindsPresentValueInPlaceWithoutClearing)
{
    std::optional<int> value = 3;

    auto found =
        bindOptional(true, false, [&]() { value.emplace(); }, [&]() { value.reset(); }, [&]() { return false; });

    ASSERT_FALSE(found);
    ASSERT_EQ(value, 3);
}

TEST(bindOptional, absentValueStaysAbsentWithoutClearing)
{
    std::optional<int> value;

    auto found =
        bindOptional(false, false, [&]() { value.emplace(); }, [&]() { value.reset(); }, [&]() { return false; });

    ASSERT_FALSE(found);
    ASSERT_EQ(value, std::nullopt);
}

TEST(bindOptional, rethrowsAfterReset)
{
    std::optional<int> value = 3;

    ASSERT_THROW(
        bindOptional(
            true,
            false,
            [&]() { value.emplace(); },
            [&]() { value.reset(); },
            [&]() -> bool { throw EnvParseError("X", "bad"); }),
        EnvParseError);
    ASSERT_EQ(value, std::nullopt);
}

} // namespace envbind

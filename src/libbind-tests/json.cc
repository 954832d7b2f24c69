#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "envbind/bind/bind.hh"
#include "envbind/bind/tests/records.hh"

namespace envbind {

using testing::Outer;
using testing::Struct;
using testing::SubStruct;

TEST(toJSON, defaults)
{
    Struct s;

    ASSERT_EQ(toJSON(s), R"({
        "NAME": "",
        "SUB": { "PORT": 0 },
        "ARRAY": [],
        "ARRAY_STRINGS": [],
        "SUB_STRUCTS": [],
        "OPTIONAL": null,
        "OPTIONAL_SUB": null,
        "ENCODING": "UTF-8",
        "PATH": ""
    })"_json);
}

TEST(toJSON, leavesOutIgnoredFields)
{
    ASSERT_FALSE(toJSON(Struct{}).contains("IGNORED"));
}

TEST(toJSON, boundValues)
{
    MapEnvironment env({
        {"TEST_PREFIX_NAME", "svc"},
        {"TEST_PREFIX_SUB__PORT", "80"},
        {"TEST_PREFIX_ARRAY__0", "1"},
        {"TEST_PREFIX_ARRAY_STRINGS:0", "x"},
        {"TEST_PREFIX_SUB_STRUCTS__0__PORT", "2"},
        {"TEST_PREFIX_OPTIONAL", "o"},
        {"TEST_PREFIX_OPTIONAL_SUB:PORT", "3"},
        {"TEST_PREFIX_ENCODING", "ms_kanji"},
        {"TEST_PREFIX_PATH", "/tmp/x"},
    });

    auto s = fromEnv<Struct>(env);

    ASSERT_EQ(toJSON(s), R"({
        "NAME": "svc",
        "SUB": { "PORT": 80 },
        "ARRAY": [1],
        "ARRAY_STRINGS": ["x"],
        "SUB_STRUCTS": [{ "PORT": 2 }],
        "OPTIONAL": "o",
        "OPTIONAL_SUB": { "PORT": 3 },
        "ENCODING": "Shift_JIS",
        "PATH": "/tmp/x"
    })"_json);
}

TEST(toJSON, nestedRecords)
{
    Outer o;
    o.middle.items.resize(1);
    o.middle.items[0].flag = true;

    ASSERT_EQ(toJSON(o), R"({
        "LABEL": "default",
        "MIDDLE": {
            "INNER": { "VALUE": 0, "FLAG": false },
            "ITEMS": [{ "VALUE": 0, "FLAG": true }]
        }
    })"_json);
}

} // namespace envbind

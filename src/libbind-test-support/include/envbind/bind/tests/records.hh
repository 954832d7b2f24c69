#pragma once
///@file

#include "envbind/bind/bind.hh"
#include "envbind/bind/text-encoding.hh"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace envbind::testing {

/**
 * A type that cannot be decoded from text.
 */
struct Unparsable
{
    int handle = -1;
};

struct SubStruct
{
    uint16_t port = 0;

    bool operator==(const SubStruct &) const = default;

    static const Schema<SubStruct> & envSchema();
};

/**
 * A record with a field of every kind, bound under `TEST_PREFIX_`.
 */
struct Struct
{
    std::string name;
    Unparsable ignored;
    SubStruct sub;
    std::vector<uint32_t> array;
    std::vector<std::string> arrayStrings;
    std::vector<SubStruct> subStructs;
    std::optional<std::string> optional;
    std::optional<SubStruct> optionalSub;
    TextEncoding encoding = TextEncoding::Utf8;
    std::filesystem::path path;

    static const Schema<Struct> & envSchema();
};

struct Inner
{
    int32_t value = 0;
    bool flag = false;

    static const Schema<Inner> & envSchema();
};

struct Middle
{
    Inner inner;
    std::vector<Inner> items;

    static const Schema<Middle> & envSchema();
};

/**
 * Three levels of nesting, bound under `DEEP_`.
 */
struct Outer
{
    std::string label = "default";
    Middle middle;

    static const Schema<Outer> & envSchema();
};

} // namespace envbind::testing

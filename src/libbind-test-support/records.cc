#include "envbind/bind/tests/records.hh"

namespace envbind::testing {

const Schema<SubStruct> & SubStruct::envSchema()
{
    static const Schema<SubStruct> schema{
        .fields =
            {
                scalarField("PORT", &SubStruct::port),
            },
    };
    return schema;
}

const Schema<Struct> & Struct::envSchema()
{
    static const Schema<Struct> schema{
        .prefix = "TEST_PREFIX_",
        .fields =
            {
                scalarField("NAME", &Struct::name),
                ignoredField<Struct>("IGNORED"),
                nestedField("SUB", &Struct::sub),
                sequenceField("ARRAY", &Struct::array),
                sequenceField("ARRAY_STRINGS", &Struct::arrayStrings),
                nestedSequenceField("SUB_STRUCTS", &Struct::subStructs),
                optionalField("OPTIONAL", &Struct::optional),
                optionalField("OPTIONAL_SUB", &Struct::optionalSub),
                scalarField("ENCODING", &Struct::encoding),
                scalarField("PATH", &Struct::path),
            },
    };
    return schema;
}

const Schema<Inner> & Inner::envSchema()
{
    static const Schema<Inner> schema{
        .fields =
            {
                scalarField("VALUE", &Inner::value),
                scalarField("FLAG", &Inner::flag),
            },
    };
    return schema;
}

const Schema<Middle> & Middle::envSchema()
{
    static const Schema<Middle> schema{
        .fields =
            {
                nestedField("INNER", &Middle::inner),
                nestedSequenceField("ITEMS", &Middle::items),
            },
    };
    return schema;
}

const Schema<Outer> & Outer::envSchema()
{
    static const Schema<Outer> schema{
        .prefix = "DEEP_",
        .fields =
            {
                scalarField("LABEL", &Outer::label),
                nestedField("MIDDLE", &Outer::middle),
            },
    };
    return schema;
}

} // namespace envbind::testing

#pragma once
/**
 * @file
 *
 * Field descriptor tables describing the shape of a record.
 *
 * A record type `R` is made bindable by giving it a static member
 * function
 *
 * ```
 * static const envbind::Schema<R> & envSchema();
 * ```
 *
 * that returns its default prefix and one `Field<R>` per member. The
 * descriptors are normally created with the helpers in `bind.hh`
 * (`scalarField()`, `nestedField()`, ...), e.g.
 *
 * ```
 * struct Server
 * {
 *     uint16_t port = 80;
 *     std::vector<std::string> hosts;
 *
 *     static const Schema<Server> & envSchema()
 *     {
 *         static const Schema<Server> schema{
 *             .prefix = "SERVER_",
 *             .fields = {
 *                 scalarField("PORT", &Server::port),
 *                 sequenceField("HOSTS", &Server::hosts),
 *             },
 *         };
 *         return schema;
 *     }
 * };
 * ```
 */

#include "envbind/bind/environment.hh"

#include <concepts>
#include <functional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace envbind {

/**
 * One member of a record, identified by the fragment of the
 * environment variable name derived from it, and tagged with the way
 * it is bound.
 *
 * The per-kind operations close over the member they access; the
 * variable names are composed by the traversal in `bindWithPrefix()`.
 */
template<typename R>
struct Field
{
    /**
     * A decodable value bound from the variable `<prefix><fragment>`.
     */
    struct Scalar
    {
        std::function<bool(R &, const Environment &, const std::string & name)> bind;
    };

    /**
     * A `std::optional` around a decodable value or around a record.
     * The member is present after binding iff something was found for
     * it by any of the attempts of that pass.
     */
    struct Optional
    {
        /**
         * Whether the wrapped type is itself a record, in which case
         * `bindInner` takes a prefix rather than a variable name.
         */
        bool composite;
        std::function<bool(const R &)> present;
        std::function<void(R &)> emplace;
        std::function<void(R &)> reset;

        /**
         * The last argument is passed on as `clearAbsentOptionals` to
         * `bindWithPrefix()` when the wrapped type is a record.
         */
        std::function<bool(R &, const Environment &, const std::string & nameOrPrefix, bool clearAbsentOptionals)>
            bindInner;
    };

    /**
     * A record bound from `<prefix><fragment>:...` and
     * `<prefix><fragment>__...`.
     */
    struct Nested
    {
        std::function<bool(R &, const Environment &, const std::string & prefix, bool clearAbsentOptionals)> bind;
    };

    /**
     * A `std::vector` of decodable values, one per index.
     */
    struct Sequence
    {
        /**
         * Append the decoded value of `name` if that variable is set.
         */
        std::function<bool(R &, const Environment &, const std::string & name)> tryAppend;

        /**
         * Remove every element but the last one.
         */
        std::function<void(R &)> keepLast;
    };

    /**
     * A `std::vector` of records, one per index.
     */
    struct NestedSequence
    {
        std::function<void(R &)> appendDefault;
        std::function<bool(R &, const Environment &, const std::string & prefix)> bindLast;
        std::function<void(R &)> popLast;
        std::function<void(R &)> keepLast;
    };

    using Kind = std::variant<Scalar, Optional, Nested, Sequence, NestedSequence>;

    std::string fragment;

    /**
     * Ignored fields are skipped by binding and rendering.
     */
    bool ignored = false;

    Kind kind;

    std::function<nlohmann::json(const R &)> toJSON;
};

template<typename R>
struct Schema
{
    /**
     * The prefix used by `bind()` and `fromEnv()`.
     */
    std::string prefix;

    std::vector<Field<R>> fields;
};

/**
 * A record type with a field descriptor table.
 */
template<typename T>
concept Composite = requires {
    { T::envSchema() } -> std::same_as<const Schema<T> &>;
};

} // namespace envbind

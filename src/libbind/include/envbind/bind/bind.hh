#pragma once
/**
 * @file
 *
 * Binding records to environment variables.
 *
 * Naming, for a field with fragment `V` bound under prefix `P`:
 *
 * - scalar and optional: `PV`
 * - nested record: `PV:` and `PV__` as the prefix of its own fields,
 *   both of them tried
 * - sequence element `i`: `PV:i`, else `PV__i`
 * - nested sequence element `i`: `PV:i:`, else `PV__i__` as the prefix
 *   of its fields
 *
 * Sequences have no declared length. Indices are probed from 0 until
 * one is found for which neither form is set; a gap therefore ends the
 * sequence. A sequence that has at least one element in the
 * environment replaces the previous contents of its member; one that
 * has none leaves the member alone.
 */

#include "envbind/bind/schema.hh"
#include "envbind/bind/scalar.hh"
#include "envbind/util/util.hh"

#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

namespace envbind {

template<typename T>
concept Bindable = Decodable<T> || Composite<T>;

template<Composite R>
bool bindWithPrefix(
    R & record,
    std::string_view prefix,
    const Environment & env = processEnvironment(),
    bool clearAbsentOptionals = true);

template<Composite R>
nlohmann::json toJSON(const R & record);

/**
 * Bind a nested record under both `base + ":"` and `base + "__"`, in
 * that order. Both are always attempted.
 *
 * The colon attempt gets `clearAbsentOptionals` as passed in, the
 * underscore attempt always gets `false`, so that it cannot clear an
 * optional the colon attempt has just set.
 *
 * @return whether either attempt found anything.
 */
bool bindNested(
    const std::string & base,
    bool clearAbsentOptionals,
    const std::function<bool(const std::string & prefix, bool clearAbsentOptionals)> & bind);

/**
 * Probe the elements `base:0`/`base__0`, `base:1`/`base__1`, ... of a
 * sequence, calling `tryAppend` for the colon form and then, if that
 * was not set, for the underscore form, until an index is found for
 * which neither is set.
 *
 * Once element 0 has been appended, `keepLast` is called to drop the
 * elements the sequence held before.
 *
 * @return whether any element was appended.
 */
bool expandSequence(
    const std::string & base,
    const std::function<bool(const std::string & name)> & tryAppend,
    const std::function<void()> & keepLast);

/**
 * Like `expandSequence()`, but for sequences of records. For each
 * index a default element is appended and bound under `base:i:`, else
 * under `base__i__`. If neither finds anything the element is removed
 * again and probing stops.
 *
 * If binding an element throws, that element is left in place.
 *
 * As with `expandSequence()`, `keepLast` drops the previous contents
 * once element 0 has been kept.
 *
 * @return whether any element was kept.
 */
bool expandNestedSequence(
    const std::string & base,
    const std::function<void()> & appendDefault,
    const std::function<bool(const std::string & prefix)> & bindLast,
    const std::function<void()> & popLast,
    const std::function<void()> & keepLast);

/**
 * Bind an optional member: `emplace` a default value, bind into it,
 * and `reset` the member again unless something was found. The member
 * is also reset if binding throws.
 *
 * If `clearAbsent` is false and the member is already `present`, it is
 * bound in place instead and left as it is when nothing is found.
 *
 * @return whether anything was found.
 */
bool bindOptional(
    bool present,
    bool clearAbsent,
    const std::function<void()> & emplace,
    const std::function<void()> & reset,
    const std::function<bool()> & bindInner);

/**
 * Render a single value of a field.
 */
template<typename T>
nlohmann::json valueToJSON(const T & value)
{
    if constexpr (Composite<T>)
        return toJSON(value);
    else if constexpr (std::is_same_v<T, std::filesystem::path>)
        return value.string();
    else
        return value;
}

template<typename T>
void keepLastElement(std::vector<T> & v)
{
    if (v.size() > 1)
        v.erase(v.begin(), v.end() - 1);
}

template<typename R, Decodable T>
Field<R> scalarField(std::string fragment, T R::*member)
{
    return {
        .fragment = std::move(fragment),
        .kind = typename Field<R>::Scalar{
            .bind = [member](R & r, const Environment & env, const std::string & name) {
                return bindScalar(r.*member, env, name);
            },
        },
        .toJSON = [member](const R & r) { return valueToJSON(r.*member); },
    };
}

template<typename R, Bindable T>
Field<R> optionalField(std::string fragment, std::optional<T> R::*member)
{
    return {
        .fragment = std::move(fragment),
        .kind = typename Field<R>::Optional{
            .composite = Composite<T>,
            .present = [member](const R & r) { return (r.*member).has_value(); },
            .emplace = [member](R & r) { (r.*member).emplace(); },
            .reset = [member](R & r) { (r.*member).reset(); },
            .bindInner =
                [member](R & r, const Environment & env, const std::string & nameOrPrefix, bool clearAbsentOptionals) {
                    if constexpr (Composite<T>)
                        return bindWithPrefix(*(r.*member), nameOrPrefix, env, clearAbsentOptionals);
                    else
                        return bindScalar(*(r.*member), env, nameOrPrefix);
                },
        },
        .toJSON = [member](const R & r) -> nlohmann::json {
            if (auto & value = r.*member)
                return valueToJSON(*value);
            return nullptr;
        },
    };
}

template<typename R, Composite T>
Field<R> nestedField(std::string fragment, T R::*member)
{
    return {
        .fragment = std::move(fragment),
        .kind = typename Field<R>::Nested{
            .bind = [member](R & r, const Environment & env, const std::string & prefix, bool clearAbsentOptionals) {
                return bindWithPrefix(r.*member, prefix, env, clearAbsentOptionals);
            },
        },
        .toJSON = [member](const R & r) { return toJSON(r.*member); },
    };
}

template<typename R, Decodable T>
Field<R> sequenceField(std::string fragment, std::vector<T> R::*member)
{
    return {
        .fragment = std::move(fragment),
        .kind = typename Field<R>::Sequence{
            .tryAppend = [member](R & r, const Environment & env, const std::string & name) {
                T value{};
                if (!bindScalar(value, env, name))
                    return false;
                (r.*member).push_back(std::move(value));
                return true;
            },
            .keepLast = [member](R & r) { keepLastElement(r.*member); },
        },
        .toJSON = [member](const R & r) {
            auto res = nlohmann::json::array();
            for (auto & value : r.*member)
                res.push_back(valueToJSON(value));
            return res;
        },
    };
}

template<typename R, Composite T>
Field<R> nestedSequenceField(std::string fragment, std::vector<T> R::*member)
{
    return {
        .fragment = std::move(fragment),
        .kind = typename Field<R>::NestedSequence{
            .appendDefault = [member](R & r) { (r.*member).emplace_back(); },
            .bindLast = [member](R & r, const Environment & env, const std::string & prefix) {
                return bindWithPrefix((r.*member).back(), prefix, env);
            },
            .popLast = [member](R & r) { (r.*member).pop_back(); },
            .keepLast = [member](R & r) { keepLastElement(r.*member); },
        },
        .toJSON = [member](const R & r) {
            auto res = nlohmann::json::array();
            for (auto & value : r.*member)
                res.push_back(toJSON(value));
            return res;
        },
    };
}

/**
 * A member that binding does not touch, e.g. because its type cannot
 * be decoded from text.
 */
template<typename R>
Field<R> ignoredField(std::string fragment)
{
    return {
        .fragment = std::move(fragment),
        .ignored = true,
    };
}

/**
 * Override the fields of `record` from the variables under `prefix`.
 *
 * Fields whose variables are not set keep their values, except that
 * optionals are cleared unless `clearAbsentOptionals` is false. It is
 * false for the second attempt at a nested record, which must not undo
 * what the first one bound. Traversal stops at the first variable that
 * cannot be used; fields bound before it keep their new values.
 *
 * @return whether any variable was used.
 *
 * @throws EnvVarError (`NotUnicodeError` or `EnvParseError`) naming
 * the first variable that could not be used.
 */
template<Composite R>
bool bindWithPrefix(R & record, std::string_view prefix, const Environment & env, bool clearAbsentOptionals)
{
    using F = Field<R>;

    bool found = false;

    for (auto & field : R::envSchema().fields) {
        if (field.ignored)
            continue;

        auto base = std::string(prefix) + field.fragment;

        bool foundField = std::visit(
            overloaded{
                [&](const typename F::Scalar & k) { return k.bind(record, env, base); },
                [&](const typename F::Optional & k) {
                    return bindOptional(
                        k.present(record),
                        clearAbsentOptionals,
                        [&]() { k.emplace(record); },
                        [&]() { k.reset(record); },
                        [&]() {
                            if (k.composite)
                                return bindNested(
                                    base, clearAbsentOptionals, [&](const std::string & p, bool clear) {
                                        return k.bindInner(record, env, p, clear);
                                    });
                            return k.bindInner(record, env, base, clearAbsentOptionals);
                        });
                },
                [&](const typename F::Nested & k) {
                    return bindNested(base, clearAbsentOptionals, [&](const std::string & p, bool clear) {
                        return k.bind(record, env, p, clear);
                    });
                },
                [&](const typename F::Sequence & k) {
                    return expandSequence(
                        base,
                        [&](const std::string & name) { return k.tryAppend(record, env, name); },
                        [&]() { k.keepLast(record); });
                },
                [&](const typename F::NestedSequence & k) {
                    return expandNestedSequence(
                        base,
                        [&]() { k.appendDefault(record); },
                        [&](const std::string & p) { return k.bindLast(record, env, p); },
                        [&]() { k.popLast(record); },
                        [&]() { k.keepLast(record); });
                },
            },
            field.kind);

        found = found || foundField;
    }

    return found;
}

/**
 * Like `bindWithPrefix()`, using the prefix of the record's schema.
 */
template<Composite R>
bool bind(R & record, const Environment & env = processEnvironment())
{
    return bindWithPrefix(record, R::envSchema().prefix, env);
}

/**
 * @return a default-constructed record with `bind()` applied.
 */
template<Composite R>
R fromEnv(const Environment & env = processEnvironment())
{
    R record{};
    bind(record, env);
    return record;
}

/**
 * Render a record as a JSON object keyed by field fragment. Ignored
 * fields are left out, absent optionals are `null`.
 */
template<Composite R>
nlohmann::json toJSON(const R & record)
{
    auto res = nlohmann::json::object();
    for (auto & field : R::envSchema().fields)
        if (!field.ignored)
            res.emplace(field.fragment, field.toJSON(record));
    return res;
}

} // namespace envbind

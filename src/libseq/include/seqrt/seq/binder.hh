#pragma once
///@file

#include <initializer_list>
#include <memory>

#include "seqrt/seq/iterator.hh"
#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * The operands supplied to a slot that conceptually takes "the list":
 * a constructor, an iteration target, the arguments of push/unshift.
 *
 * `commaBuilt` records whether the operands were separated by a comma
 * at the call site. A brace-initialized `Operands{a, b}` (and
 * `Operands{a}`, which stands for `a,`) is comma-built;
 * `Operands::single(a)` is one operand written on its own.
 */
struct Operands
{
    ValueVector items;
    bool commaBuilt = true;

    Operands() = default;

    Operands(std::initializer_list<Value> items)
        : items(items)
    {
    }

    static Operands single(Value v)
    {
        Operands ops;
        ops.items.push_back(std::move(v));
        ops.commaBuilt = false;
        return ops;
    }

    static Operands comma(ValueVector items)
    {
        Operands ops;
        ops.items = std::move(items);
        return ops;
    }
};

/**
 * Which rule of the single argument rule applies to a set of operands.
 */
enum class ArgumentRule {
    /**
     * A single Container or a single non-iterable value: one argument.
     */
    Single,
    /**
     * A single bare List, Array, Slip or sequence: its elements.
     */
    Elements,
    /**
     * A comma-built operand list: one argument per operand, with bare
     * Slips exploded.
     */
    CommaList,
};

ArgumentRule classifyArguments(const Operands & ops);

/**
 * The elements of a single value: the elements of a bare iterable
 * (consuming a sequence), or the value itself otherwise.
 */
std::unique_ptr<Iterator> iterateValue(const Value & v);

/**
 * The effective arguments of `ops`, as a producer. Sequences among
 * the operands are consumed by the returned iterator, not before.
 */
std::unique_ptr<Iterator> iterationTarget(const Operands & ops);

/**
 * @throws InfiniteLength if the arguments come from a lazy producer.
 */
ValueVector effectiveArguments(const Operands & ops);

size_t effectiveArgumentCount(const Operands & ops);

enum class BindContext {
    /**
     * Binding to a plain variable.
     */
    Variable,
    /**
     * Binding an argument of a call to a parameter.
     */
    Parameter,
};

struct BindOptions
{
    BindContext context = BindContext::Parameter;

    /**
     * Bind the cached List of a sequence instead of failing. Only
     * honoured for `BindContext::Parameter`.
     */
    bool cacheFallback = false;
};

/**
 * Bind `v` to an Array-style reference. Lists, Arrays and Slips bind
 * as themselves; a Container holding one binds its content.
 *
 * @throws NotPositional for sequences (unless cache fallback applies)
 * and for anything that is not positional.
 */
Value bindToArrayParam(const Value & v, const BindOptions & options = {});

} // namespace seqrt

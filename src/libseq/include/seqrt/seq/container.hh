#pragma once
///@file

#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * A single assignable slot. Containers are the only mutation surface
 * of the runtime: Lists and Arrays never change an element in place,
 * they hand out the Container stored in the slot instead.
 *
 * A Container never holds another Container; storing one stores its
 * current value.
 */
class Container
{
    Value value;
    bool rw;

public:

    explicit Container(Value initial = Value::vNothing, bool rw = true);

    const Value & get() const
    {
        return value;
    }

    /**
     * @throws ImmutableAssignment if the Container is read-only.
     */
    void set(Value v);

    bool isMutable() const
    {
        return rw;
    }
};

/**
 * Put `v` into a fresh Container. This is the only way a value
 * becomes boxed, and the boxing boundary of the single argument rule.
 */
Value box(Value v, bool rw = true);

/**
 * Assign through an element reference obtained from a positional.
 *
 * @throws ImmutableAssignment if `elem` is a bare value.
 */
void assignElement(const Value & elem, Value v);

} // namespace seqrt

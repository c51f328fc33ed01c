#pragma once
///@file

#include "seqrt/seq/binder.hh"

namespace seqrt {

/**
 * The comma constructor: one element per effective argument of `ops`.
 * Bare Slips are spliced; a Container contributes one element whatever
 * it holds.
 */
Value makeList(const Operands & ops);

/**
 * An empty Array, assigned from `ops`.
 */
Value makeArray(const Operands & ops);

/**
 * A Slip over the elements of `v`. Containers are looked through;
 * sequences are consumed; a non-iterable value gives a Slip of one
 * element.
 */
Value toSlip(const Value & v);

} // namespace seqrt

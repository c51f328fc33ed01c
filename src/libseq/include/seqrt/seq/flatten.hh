#pragma once
///@file

#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * A Seq over the leaves of `v`. Bare iterables are descended into
 * (sequences are consumed on the way); Containers are produced as
 * they are, even when they hold a List or an Array.
 *
 * Every element of an Array is a Container, so an Array is produced
 * element by element without looking at the elements.
 */
Value flatten(const Value & v);

} // namespace seqrt

#pragma once
///@file

#include <iosfwd>
#include <set>

#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * Print a value without forcing anything: lazy Lists show the elements
 * reified so far followed by `...`, and sequences only show their
 * state. Containers are transparent.
 *
 * Positionals already on `seen` are printed as `«repeated»`.
 */
void printValue(const Value & v, std::ostream & str, std::set<const void *> * seen = nullptr, size_t depth = 0);

} // namespace seqrt

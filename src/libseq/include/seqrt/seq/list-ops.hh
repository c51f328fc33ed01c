#pragma once
///@file

#include <functional>
#include <vector>

#include "seqrt/seq/binder.hh"
#include "seqrt/seq/iterator.hh"

namespace seqrt {

/**
 * List-processing operations. All of them return a fresh Seq; sources
 * are taken through the single argument rule and consumed lazily, when
 * the result is pulled.
 */

Value fromValues(ValueVector values);

/**
 * Integers from `from` to `to` inclusive.
 */
Value range(SeqInt from, SeqInt to);

/**
 * Integers from `from` onwards. Lazy.
 */
Value infiniteRange(SeqInt from);

Value generate(GeneratorIterator::Producer producer, bool lazy);

/**
 * The effective arguments of `source`, declared lazy: an Array
 * assigned from it reifies on demand.
 */
Value lazy(const Operands & source);

/**
 * `fn` applied to each argument. Slips returned by `fn` are spliced,
 * so returning `emptySlip()` drops the element.
 */
Value map(const Operands & source, std::function<Value(const Value &)> fn);

Value grep(const Operands & source, std::function<bool(const Value &)> pred);

Value head(const Operands & source, size_t n);

Value skip(const Operands & source, size_t n);

/**
 * Lists of the n-th arguments of every source, up to the shortest
 * source.
 */
Value zip(const std::vector<Operands> & sources);

} // namespace seqrt

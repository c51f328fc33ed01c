#pragma once
///@file

#include "seqrt/seq/binder.hh"
#include "seqrt/seq/list.hh"

namespace seqrt {

/**
 * Mutable view of a positional of kind `ListKind::Array`. Every slot
 * holds a Container allocated by the Array itself, so values pushed,
 * spliced or assigned in are always copied into fresh Containers.
 *
 * Arrays with a pending lazy producer reify only as far as an
 * operation needs; operations at the far end fail with
 * `InfiniteLength`.
 */
class Array
{
    ref<List> storage;

    explicit Array(ref<List> storage)
        : storage(std::move(storage))
    {
    }

    static ValueVector boxAll(const Operands & values);

public:

    static Array make();

    /**
     * @throws TypeError unless `v` (deconted) is an Array.
     */
    static Array fromValue(const Value & v);

    Value toValue() const
    {
        return storage->toValue();
    }

    const ref<List> & list() const
    {
        return storage;
    }

    bool isLazy() const
    {
        return storage->isLazy();
    }

    size_t elems()
    {
        return storage->elems();
    }

    /**
     * The Container stored at `i`.
     */
    Value at(size_t i)
    {
        return storage->at(i);
    }

    /**
     * The current value stored at `i`.
     */
    Value get(size_t i)
    {
        return at(i).decont();
    }

    /**
     * Store `v` at `i`, growing the Array if `i` is past the end. Gap
     * slots get empty Containers.
     */
    void assignAt(size_t i, Value v);

    /**
     * Append the effective arguments of `values`, each boxed.
     * @throws InfiniteLength if the Array is lazy.
     */
    void push(const Operands & values);

    void push(Value v)
    {
        push(Operands::single(std::move(v)));
    }

    void unshift(const Operands & values);

    void unshift(Value v)
    {
        unshift(Operands::single(std::move(v)));
    }

    /**
     * Remove the last element and return its value.
     * @throws EmptyCollection
     * @throws InfiniteLength if the Array is lazy.
     */
    Value pop();

    Value shift();

    /**
     * Remove `count` elements from `start` (clipped to the elements
     * available) and insert `replacement` in their place.
     *
     * @return the removed values, in a new Array.
     * @throws IndexOutOfRange if `start` is past the end.
     */
    Value splice(size_t start, size_t count, const Operands & replacement = {});

    /**
     * Replace the whole contents with the effective arguments of
     * `source`. Eager unless the producer is lazy, in which case it is
     * kept for on-demand reification.
     */
    void assign(const Operands & source);

    void clear();
};

} // namespace seqrt

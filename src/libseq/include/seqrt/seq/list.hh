#pragma once
///@file

#include <memory>

#include "seqrt/seq/iterator.hh"
#include "seqrt/seq/value.hh"

namespace seqrt {

/**
 * The three positional variants. They share one storage type and
 * differ only in the tag:
 *
 * - `List`: immutable; elements are bare values or Containers.
 * - `Array`: every element is a Container owned by the Array.
 * - `Slip`: a List that is spliced into whatever is being built from
 *   it.
 */
enum class ListKind { List, Array, Slip };

std::string_view showListKind(ListKind kind);

/**
 * Storage of a positional. Elements that have been produced are kept
 * in `reified`; a lazy producer that has not been exhausted yet is
 * kept in `todo` and reified on demand, so a List can be infinite.
 *
 * A List never changes the identity of an element once it has been
 * reified. Only `Array` (see array.hh) restructures the storage.
 */
class List : public std::enable_shared_from_this<List>
{
    friend class Array;

    ListKind kind;

    ValueVector reified;

    /**
     * Pending lazy producer, or null once the List is fully reified.
     */
    std::unique_ptr<Iterator> todo;

    /**
     * Make the element stored for a produced value: Arrays box every
     * element into a fresh Container.
     */
    Value adopt(const Value & v) const;

    /**
     * Reify until index `i` exists or the producer is exhausted.
     * @return whether index `i` exists.
     */
    bool reifyUntil(size_t i);

    void requireFinite();

    void finishReification();

public:

    List(ListKind kind, ValueVector elems);

    List(ListKind kind, ValueVector reified, std::unique_ptr<Iterator> todo);

    ~List();

    /**
     * Build a positional from a producer. Bare Slips are spliced. A
     * lazy producer is stored as `todo`; anything else is drained
     * immediately.
     */
    static ref<List> fromIterator(ListKind kind, std::unique_ptr<Iterator> it);

    ListKind getKind() const
    {
        return kind;
    }

    bool isLazy() const
    {
        return todo != nullptr;
    }

    /**
     * @throws InfiniteLength if the List is lazy.
     */
    size_t elems();

    /**
     * The element stored at `i`, reifying up to `i` if needed.
     * @throws IndexOutOfRange
     */
    Value at(size_t i);

    bool existsAt(size_t i);

    /**
     * Assign through the Container stored at `i`.
     * @throws ImmutableAssignment if the element is bare.
     */
    void assignAt(size_t i, Value v);

    ref<List> reverse();

    /**
     * Rotate left by `n` (right if negative), modulo the length.
     */
    ref<List> rotate(long n);

    std::unique_ptr<Iterator> iterator();

    size_t reifiedCount() const
    {
        return reified.size();
    }

    const ValueVector & reifiedElems() const
    {
        return reified;
    }

    Value toValue();
};

/**
 * The canonical empty Slip.
 */
Value emptySlip();

} // namespace seqrt

#pragma once
///@file

#include <cassert>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "seqrt/util/error.hh"
#include "seqrt/util/ref.hh"

namespace seqrt {

class Container;
class List;
class Seq;
class HyperSeq;

typedef enum {
    tUninitialized = 0,
    tNothing,
    tBool,
    tInt,
    tFloat,
    tString,
    tContainer,
    tList,
    tArray,
    tSlip,
    tSeq,
    tHyperSeq,
} InternalType;

/**
 * This type abstracts over all actual value types in the runtime,
 * grouping together the three variants of positional storage (List,
 * Array, Slip share one `List` object and differ only by kind) and the
 * two one-shot producers.
 */
typedef enum {
    nNothing,
    nBool,
    nInt,
    nFloat,
    nString,
    nContainer,
    nList,
    nArray,
    nSlip,
    nSeq,
    nHyperSeq,
} ValueType;

using SeqInt = int64_t;
using SeqFloat = double;

struct Value
{
private:
    InternalType internalType = tUninitialized;

    using Payload = std::variant<
        std::monostate,
        bool,
        SeqInt,
        SeqFloat,
        std::string,
        ref<Container>,
        ref<List>,
        ref<Seq>,
        ref<HyperSeq>>;

    Payload payload;

    template<typename T>
    inline const T & getStorage() const
    {
        return std::get<T>(payload);
    }

    template<typename T>
    inline void setStorage(InternalType type, T && storage)
    {
        internalType = type;
        payload.template emplace<std::decay_t<T>>(std::forward<T>(storage));
    }

public:

    static Value vNothing;
    static Value vTrue;
    static Value vFalse;

    /**
     * A value becomes valid when it is initialized. Element slots of
     * positionals are always valid; only default-constructed locals are
     * not.
     */
    inline bool isValid() const
    {
        return internalType != tUninitialized;
    }

    template<InternalType type>
    inline bool isa() const
    {
        return internalType == type;
    }

    /**
     * Returns the normal type of a Value. Containers are reported as
     * `nContainer`; use `decont()` to look through them.
     */
    inline ValueType type() const
    {
        switch (internalType) {
        case tUninitialized:
            break;
        case tNothing:
            return nNothing;
        case tBool:
            return nBool;
        case tInt:
            return nInt;
        case tFloat:
            return nFloat;
        case tString:
            return nString;
        case tContainer:
            return nContainer;
        case tList:
            return nList;
        case tArray:
            return nArray;
        case tSlip:
            return nSlip;
        case tSeq:
            return nSeq;
        case tHyperSeq:
            return nHyperSeq;
        }
        unreachable();
    }

    inline bool isContainer() const
    {
        return internalType == tContainer;
    }

    /**
     * List, Array or Slip: anything with indexable storage.
     */
    inline bool isPositional() const
    {
        return internalType == tList || internalType == tArray || internalType == tSlip;
    }

    /**
     * Anything that produces elements when iterated: positionals and
     * the one-shot producers.
     */
    inline bool isIterable() const
    {
        return isPositional() || internalType == tSeq || internalType == tHyperSeq;
    }

    /**
     * Whether iterating this value may not terminate (or is at least
     * declared lazy by its producer).
     */
    bool isLazy() const;

    inline void mkNothing()
    {
        setStorage(tNothing, std::monostate{});
    }

    inline void mkBool(bool b)
    {
        setStorage(tBool, b);
    }

    inline void mkInt(SeqInt n)
    {
        setStorage(tInt, n);
    }

    inline void mkFloat(SeqFloat n)
    {
        setStorage(tFloat, n);
    }

    inline void mkString(std::string_view s)
    {
        setStorage(tString, std::string(s));
    }

    inline void mkContainer(ref<Container> c)
    {
        setStorage(tContainer, std::move(c));
    }

    /**
     * The internal type is taken from the kind of the list (List, Array
     * or Slip).
     */
    void mkList(ref<List> l);

    inline void mkSeq(ref<Seq> s)
    {
        setStorage(tSeq, std::move(s));
    }

    inline void mkHyperSeq(ref<HyperSeq> s)
    {
        setStorage(tHyperSeq, std::move(s));
    }

    static Value fromBool(bool b)
    {
        return b ? vTrue : vFalse;
    }

    static Value fromInt(SeqInt n)
    {
        Value v;
        v.mkInt(n);
        return v;
    }

    static Value fromFloat(SeqFloat n)
    {
        Value v;
        v.mkFloat(n);
        return v;
    }

    static Value fromString(std::string_view s)
    {
        Value v;
        v.mkString(s);
        return v;
    }

    inline bool boolean() const
    {
        assert(internalType == tBool);
        return getStorage<bool>();
    }

    inline SeqInt integer() const
    {
        assert(internalType == tInt);
        return getStorage<SeqInt>();
    }

    inline SeqFloat fpoint() const
    {
        assert(internalType == tFloat);
        return getStorage<SeqFloat>();
    }

    inline std::string_view string_view() const
    {
        assert(internalType == tString);
        return getStorage<std::string>();
    }

    inline const ref<Container> & container() const
    {
        assert(internalType == tContainer);
        return getStorage<ref<Container>>();
    }

    inline const ref<List> & list() const
    {
        assert(isPositional());
        return getStorage<ref<List>>();
    }

    inline const ref<Seq> & seq() const
    {
        assert(internalType == tSeq);
        return getStorage<ref<Seq>>();
    }

    inline const ref<HyperSeq> & hyperSeq() const
    {
        assert(internalType == tHyperSeq);
        return getStorage<ref<HyperSeq>>();
    }

    /**
     * The value held by this Container, or the value itself if it is
     * not a Container.
     */
    Value decont() const;

    /**
     * Whether both values refer to the same heap object (Container,
     * positional or producer). Scalars never share identity.
     */
    bool sameObject(const Value & other) const;
};

typedef std::vector<Value> ValueVector;

std::string_view showType(ValueType type);

std::string_view showType(const Value & v);

/**
 * Structural equality. Both sides are deconted; positionals of any kind
 * compare element-wise, so a List and an Array with equal elements are
 * equal. Lazy positionals and producers only compare equal to the same
 * object, since comparing them would consume or reify them.
 */
bool valueEquals(const Value & a, const Value & b);

std::ostream & operator<<(std::ostream & str, const Value & v);

} // namespace seqrt

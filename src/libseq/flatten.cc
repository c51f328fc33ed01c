#include <boost/container/small_vector.hpp>

#include "seqrt/seq/binder.hh"
#include "seqrt/seq/flatten.hh"
#include "seqrt/seq/iterator.hh"
#include "seqrt/seq/list.hh"
#include "seqrt/seq/sequence.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

namespace {

class FlattenIterator : public Iterator
{
    struct Frame
    {
        std::unique_ptr<Iterator> it;

        /**
         * The frame iterates an Array, whose elements are all
         * Containers and are produced without inspection.
         */
        bool array;
    };

    boost::container::small_vector<Frame, 8> stack;

public:
    explicit FlattenIterator(std::unique_ptr<Iterator> root)
    {
        stack.push_back(Frame{std::move(root), false});
    }

    std::optional<Value> pull() override
    {
        while (!stack.empty()) {
            auto & top = stack.back();
            auto v = top.it->pull();
            if (!v) {
                stack.pop_back();
                continue;
            }
            if (top.array)
                return v;
            if (v->isa<tArray>()) {
                vomit("flatten: Array fast path");
                seqStats.nrFlattenArrayFastPaths++;
                stack.push_back(Frame{v->list()->iterator(), true});
                continue;
            }
            if (v->isIterable()) {
                stack.push_back(Frame{iterateValue(*v), false});
                continue;
            }
            return v;
        }
        return std::nullopt;
    }

    bool isLazy() const override
    {
        for (auto & frame : stack)
            if (frame.it->isLazy())
                return true;
        return false;
    }
};

} // namespace

Value flatten(const Value & v)
{
    seqStats.nrFlattens++;

    if (v.isa<tArray>()) {
        vomit("flatten: Array fast path");
        seqStats.nrFlattenArrayFastPaths++;
        return toSequence(v.list()->iterator());
    }

    if (v.isIterable())
        return toSequence(std::make_unique<FlattenIterator>(iterateValue(v)));

    return toSequence(std::make_unique<ValuesIterator>(ValueVector{v}));
}

} // namespace seqrt

#include "seqrt/seq/sequence.hh"
#include "seqrt/seq/seq-error.hh"
#include "seqrt/seq/stats.hh"
#include "seqrt/util/logging.hh"

namespace seqrt {

std::string_view showState(Seq::State state)
{
    switch (state) {
    case Seq::State::Fresh:
        return "fresh";
    case Seq::State::Consuming:
        return "consuming";
    case Seq::State::Cached:
        return "cached";
    case Seq::State::Consumed:
        return "consumed";
    }
    unreachable();
}

Seq::Seq(std::unique_ptr<Iterator> source)
    : source(std::make_unique<SpliceIterator>(std::move(source)))
{
    seqStats.nrSeqs++;
}

Seq::~Seq() = default;

void Seq::alreadyConsumed(std::string_view operation) const
{
    throw AlreadyConsumed("cannot %s a Seq that is %s", operation, showState(state));
}

std::optional<Value> Seq::pull()
{
    switch (state) {
    case State::Fresh:
        state = State::Consuming;
        break;
    case State::Consuming:
        break;
    case State::Cached:
    case State::Consumed:
        alreadyConsumed("pull from");
    }

    auto v = source->pull();
    if (!v) {
        state = State::Consumed;
        source.reset();
    }
    return v;
}

ref<List> Seq::cache()
{
    switch (state) {
    case State::Fresh:
        break;
    case State::Cached:
        return ref<List>(cached);
    case State::Consuming:
    case State::Consumed:
        alreadyConsumed("cache");
    }

    debug("caching a %s Seq", source->isLazy() ? "lazy" : "finite");
    auto list = List::fromIterator(ListKind::List, std::move(source));
    cached = list.get_ptr();
    state = State::Cached;
    seqStats.nrSeqsCached++;
    return list;
}

std::unique_ptr<Iterator> Seq::takeIterator()
{
    if (state != State::Fresh)
        alreadyConsumed("iterate");
    debug("transferring the producer out of a Seq");
    state = State::Consumed;
    seqStats.nrIteratorsTaken++;
    return std::move(source);
}

bool Seq::isLazy() const
{
    switch (state) {
    case State::Fresh:
    case State::Consuming:
        return source->isLazy();
    case State::Cached:
        return cached->isLazy();
    case State::Consumed:
        return false;
    }
    unreachable();
}

Value Seq::toValue()
{
    Value v;
    v.mkSeq(ref<Seq>(shared_from_this()));
    return v;
}

Value toSequence(std::unique_ptr<Iterator> it)
{
    return make_ref<Seq>(std::move(it))->toValue();
}

} // namespace seqrt

#include <iterator>
#include <stdexcept>
#include <utility>
#include <variant>

#include "proto/reassembler.hpp"
#include "util/log.hpp"

namespace frag
{

namespace
{

ReceiveResult pending()
{
    return ReceiveResult{};
}

ReceiveResult complete(Bytes data)
{
    ReceiveResult r;
    r.status = ReceiveStatus::Complete;
    r.data   = std::move(data);
    return r;
}

ReceiveResult failed(ReceiveError err)
{
    ReceiveResult r;
    r.status = ReceiveStatus::Error;
    r.error  = std::move(err);
    return r;
}

ReceiveResult parse_failure(std::string detail)
{
    ReceiveError e;
    e.type   = ReceiveErrorType::ParseError;
    e.detail = std::move(detail);
    return failed(std::move(e));
}

}  // namespace

const char *to_string(ReceiveStatus status)
{
    switch (status)
    {
        case ReceiveStatus::Complete:
            return "complete";
        case ReceiveStatus::Pending:
            return "pending";
        case ReceiveStatus::Error:
            return "error";
    }
    return "?";
}

const char *to_string(ReceiveErrorType type)
{
    switch (type)
    {
        case ReceiveErrorType::DuplicateFragment:
            return "duplicate_fragment";
        case ReceiveErrorType::InvalidIndex:
            return "invalid_index";
        case ReceiveErrorType::ParseError:
            return "parse_error";
        case ReceiveErrorType::SizeMismatch:
            return "size_mismatch";
        case ReceiveErrorType::Evicted:
            return "evicted";
        case ReceiveErrorType::ReassembleFailed:
            return "reassemble_failed";
    }
    return "?";
}

Reassembler::Reassembler(ReassemblerConfig cfg, util::TimerApi timers) : cfg_(std::move(cfg))
{
    if (cfg_.timeout_ms == 0)
        throw std::invalid_argument("timeout_ms must be positive");
    if (cfg_.max_concurrent_batches == 0)
        throw std::invalid_argument("max_concurrent_batches must be positive");

    if (timers)
    {
        timers_ = std::move(timers);
    }
    else
    {
        own_timers_ = std::make_unique<util::TimerQueue>();
        timers_     = own_timers_->api();
    }
}

Reassembler::~Reassembler()
{
    dispose();
}

ReceiveResult Reassembler::receive(const TransportPayload &payload)
{
    if (disposed_)
        return parse_failure("reassembler has been disposed");
    poll_timers();

    struct Visitor
    {
        Reassembler &self;
        ReceiveResult operator()(const CompleteMessage &m) const { return complete(m.data); }
        ReceiveResult operator()(const FragmentHeader &h) const { return self.on_header(h); }
        ReceiveResult operator()(const FragmentData &d) const { return self.on_data(d); }
    };
    return std::visit(Visitor{*this}, payload);
}

ReceiveResult Reassembler::receive_raw(const Bytes &bytes)
{
    if (disposed_)
        return parse_failure("reassembler has been disposed");

    ParseError err;
    auto       payload = parse_transport_payload(bytes, &err);
    if (!payload)
    {
        LOG_DEBUG("receive_raw: %s (%s)", to_string(err.code), err.detail.c_str());
        return parse_failure(std::string(to_string(err.code)) + ": " + err.detail);
    }
    return receive(*payload);
}

std::size_t Reassembler::poll_timers()
{
    if (!own_timers_ || disposed_)
        return 0;
    return own_timers_->poll();
}

void Reassembler::dispose()
{
    if (disposed_)
        return;
    disposed_ = true;

    for (const auto &b : batches_)
    {
        if (b.timer)
            timers_.cancel(b.timer);
    }
    index_.clear();
    batches_.clear();
    total_bytes_    = 0;
    charged_bytes_  = 0;
    fragment_count_ = 0;
}

ReceiveResult Reassembler::on_header(const FragmentHeader &h)
{
    std::string key = batch_id_to_key(h.batch_id);
    auto        found = index_.find(key);
    if (found == index_.end())
    {
        auto it         = open_batch(h.batch_id, std::move(key), false);
        it->have_header = true;
        it->count       = h.count;
        it->total_size  = h.total_size;
        LOG_DEBUG("batch %s opened: count=%u total=%u", it->key.c_str(), h.count, h.total_size);
        return pending();
    }

    auto        it = found->second;
    BatchState &b  = *it;
    if (b.have_header)
    {
        // first header wins
        if (b.count != h.count || b.total_size != h.total_size)
        {
            LOG_WARN("batch %s: conflicting header ignored (count %u/%u, total %u/%u)",
                     b.key.c_str(), h.count, b.count, h.total_size, b.total_size);
        }
        return pending();
    }

    // provisional batch: merge metadata, keep what is in range
    b.have_header = true;
    b.count       = h.count;
    b.total_size  = h.total_size;

    std::uint32_t first_bad = 0;
    std::size_t   purged    = 0;
    for (auto p = b.parts.lower_bound(h.count); p != b.parts.end();)
    {
        if (purged++ == 0)
            first_bad = p->first;
        b.bytes -= p->second.size();
        total_bytes_ -= p->second.size();
        charged_bytes_ -= p->second.size() + FRAGMENT_BOOKKEEPING_BYTES;
        --fragment_count_;
        p = b.parts.erase(p);
    }
    if (purged)
    {
        LOG_WARN("batch %s: dropped %zu buffered fragments beyond count %u", b.key.c_str(), purged,
                 h.count);
    }

    if (b.parts.size() == b.count)
        return complete_batch(it);

    if (purged)
    {
        ReceiveError e;
        e.type     = ReceiveErrorType::InvalidIndex;
        e.batch_id = b.id;
        e.index    = first_bad;
        e.count    = b.count;
        e.detail   = "buffered fragment index out of range";
        return failed(std::move(e));
    }
    return pending();
}

ReceiveResult Reassembler::on_data(const FragmentData &d)
{
    std::string key   = batch_id_to_key(d.batch_id);
    auto        found = index_.find(key);
    BatchList::iterator it;
    if (found != index_.end())
    {
        it = found->second;
    }
    else if (cfg_.orphan_policy == OrphanPolicy::Drop)
    {
        LOG_DEBUG("batch %s: orphan fragment %u dropped", key.c_str(), d.index);
        return pending();
    }
    else
    {
        const std::size_t need = d.data.size() + FRAGMENT_BOOKKEEPING_BYTES;
        if (need > cfg_.max_total_reassembly_bytes)
        {
            LOG_WARN("batch %s: orphan fragment of %zu bytes exceeds the %zu byte limit",
                     key.c_str(), d.data.size(), cfg_.max_total_reassembly_bytes);
            ReceiveError e;
            e.type     = ReceiveErrorType::Evicted;
            e.batch_id = d.batch_id;
            e.index    = d.index;
            e.detail   = "fragment exceeds the reassembly byte limit";
            return failed(std::move(e));
        }
        // confirmed batches alone must leave room, they are never displaced by an orphan
        if (charged_bytes_ - provisional_charge() + need > cfg_.max_total_reassembly_bytes)
        {
            LOG_DEBUG("batch %s: orphan fragment %u dropped, no byte budget", key.c_str(),
                      d.index);
            return pending();
        }
        it = open_batch(d.batch_id, std::move(key), true);
        if (it == batches_.end())
        {
            LOG_DEBUG("batch %s: orphan fragment %u dropped, table full",
                      batch_id_to_key(d.batch_id).c_str(), d.index);
            return pending();
        }
        LOG_DEBUG("batch %s opened by fragment %u", it->key.c_str(), d.index);
    }

    BatchState &b = *it;
    if (b.have_header && d.index >= b.count)
    {
        LOG_WARN("batch %s: fragment index %u out of range (count %u)", b.key.c_str(), d.index,
                 b.count);
        ReceiveError e;
        e.type     = ReceiveErrorType::InvalidIndex;
        e.batch_id = d.batch_id;
        e.index    = d.index;
        e.count    = b.count;
        return failed(std::move(e));
    }
    if (b.parts.count(d.index))
    {
        LOG_WARN("batch %s: duplicate fragment %u", b.key.c_str(), d.index);
        ReceiveError e;
        e.type     = ReceiveErrorType::DuplicateFragment;
        e.batch_id = d.batch_id;
        e.index    = d.index;
        return failed(std::move(e));
    }

    if (!admit(d.data.size(), it))
    {
        ReceiveError e;
        e.type     = ReceiveErrorType::Evicted;
        e.batch_id = d.batch_id;
        e.index    = d.index;
        e.detail   = "batch evicted to stay within the reassembly byte limit";
        return failed(std::move(e));
    }

    b.parts.emplace(d.index, d.data);
    b.bytes += d.data.size();
    total_bytes_ += d.data.size();
    charged_bytes_ += d.data.size() + FRAGMENT_BOOKKEEPING_BYTES;
    ++fragment_count_;

    if (b.have_header && b.parts.size() == b.count)
        return complete_batch(it);
    return pending();
}

Reassembler::BatchList::iterator Reassembler::open_batch(const BatchId &id, std::string key,
                                                           bool provisional)
{
    while (index_.size() >= cfg_.max_concurrent_batches && !batches_.empty())
    {
        auto victim = oldest(provisional);
        if (victim == batches_.end())
            return batches_.end();
        evict(victim);
    }

    BatchState b;
    b.id      = id;
    b.key     = std::move(key);
    b.created = std::chrono::steady_clock::now();
    batches_.push_back(std::move(b));

    auto it = std::prev(batches_.end());
    index_.emplace(it->key, it);
    it->timer = timers_.schedule([this, k = it->key] { on_timer(k); }, cfg_.timeout_ms);
    return it;
}

Reassembler::BatchList::iterator Reassembler::oldest(bool provisional_only)
{
    if (!provisional_only)
        return batches_.begin();
    for (auto it = batches_.begin(); it != batches_.end(); ++it)
    {
        if (!it->have_header)
            return it;
    }
    return batches_.end();
}

std::size_t Reassembler::provisional_charge() const
{
    std::size_t sum = 0;
    for (const auto &b : batches_)
    {
        if (!b.have_header)
            sum += b.bytes + b.parts.size() * FRAGMENT_BOOKKEEPING_BYTES;
    }
    return sum;
}

// false: the batch `it` had to go
bool Reassembler::admit(std::size_t n, BatchList::iterator it)
{
    const std::size_t need = n + FRAGMENT_BOOKKEEPING_BYTES;
    if (need > cfg_.max_total_reassembly_bytes)
    {
        LOG_WARN("batch %s: fragment of %zu bytes exceeds the %zu byte limit", it->key.c_str(), n,
                 cfg_.max_total_reassembly_bytes);
        evict(it);
        return false;
    }

    const bool provisional = !it->have_header;
    while (charged_bytes_ + need > cfg_.max_total_reassembly_bytes)
    {
        auto victim = oldest(provisional);
        if (victim == batches_.end())
            return false;
        const bool own = victim == it;
        evict(victim);
        if (own)
            return false;
    }
    return true;
}

ReceiveResult Reassembler::complete_batch(BatchList::iterator it)
{
    if (it->timer)
        timers_.cancel(it->timer);
    BatchState b = remove(it);

    FragmentHeader h;
    h.batch_id   = b.id;
    h.count      = b.count;
    h.total_size = b.total_size;

    ReassembleError err;
    auto            out = reassemble_fragments(h, b.parts, &err);
    if (out)
    {
        LOG_INFO("batch %s complete: %zu bytes in %u fragments", b.key.c_str(), out->size(),
                 b.count);
        return complete(std::move(*out));
    }

    LOG_WARN("batch %s failed: %s", b.key.c_str(), err.detail.c_str());
    ReceiveError e;
    e.batch_id = b.id;
    e.detail   = err.detail;
    if (err.code == ReassembleErrorCode::SizeMismatch)
    {
        e.type     = ReceiveErrorType::SizeMismatch;
        e.expected = err.expected;
        e.actual   = err.actual;
    }
    else
    {
        e.type = ReceiveErrorType::ReassembleFailed;
    }
    return failed(std::move(e));
}

void Reassembler::evict(BatchList::iterator it)
{
    if (it->timer)
        timers_.cancel(it->timer);
    BatchState b   = remove(it);
    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - b.created);
    LOG_INFO("batch %s evicted after %lld ms (%zu bytes, %zu fragments)", b.key.c_str(),
             static_cast<long long>(age.count()), b.bytes, b.parts.size());
    if (cfg_.on_evicted)
        cfg_.on_evicted(b.id);
}

void Reassembler::on_timer(const std::string &key)
{
    if (disposed_)
        return;
    auto found = index_.find(key);
    if (found == index_.end())
        return;

    BatchState b = remove(found->second);
    LOG_INFO("batch %s timed out after %u ms (%zu fragments buffered)", b.key.c_str(),
             cfg_.timeout_ms, b.parts.size());
    if (cfg_.on_timeout)
        cfg_.on_timeout(b.id);
}

Reassembler::BatchState Reassembler::remove(BatchList::iterator it)
{
    index_.erase(it->key);
    total_bytes_ -= it->bytes;
    charged_bytes_ -= it->bytes + it->parts.size() * FRAGMENT_BOOKKEEPING_BYTES;
    fragment_count_ -= it->parts.size();
    BatchState b = std::move(*it);
    batches_.erase(it);
    return b;
}

}  // namespace frag

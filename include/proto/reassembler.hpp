#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "proto/batch_id.hpp"
#include "proto/frag.hpp"
#include "util/constants.hpp"
#include "util/timer_queue.hpp"

namespace frag
{

// What to do with a data fragment whose batch has not been seen yet.
enum class OrphanPolicy
{
    Buffer,  // open a provisional batch, range-check once the header arrives
    Drop,    // report pending, keep no state
};

// Charged per stored fragment against max_total_reassembly_bytes on top of its data,
// so empty fragments still count.
inline constexpr std::size_t FRAGMENT_BOOKKEEPING_BYTES = 24;

struct ReassemblerConfig
{
    std::uint32_t                          timeout_ms             = constants::DEFAULT_TIMEOUT_MS;
    std::size_t                            max_concurrent_batches = constants::DEFAULT_MAX_CONCURRENT_BATCHES;
    std::size_t                            max_total_reassembly_bytes =
        constants::DEFAULT_MAX_TOTAL_REASSEMBLY_BYTES;
    OrphanPolicy                           orphan_policy = OrphanPolicy::Buffer;
    std::function<void(const BatchId &)>   on_timeout;
    std::function<void(const BatchId &)>   on_evicted;
};

enum class ReceiveStatus
{
    Complete,
    Pending,
    Error,
};

enum class ReceiveErrorType
{
    DuplicateFragment,
    InvalidIndex,
    ParseError,
    SizeMismatch,
    Evicted,
    ReassembleFailed,
};

struct ReceiveError
{
    ReceiveErrorType       type{ReceiveErrorType::ParseError};
    std::optional<BatchId> batch_id;
    std::uint32_t          index{0};     // DuplicateFragment, InvalidIndex
    std::uint32_t          count{0};     // InvalidIndex
    std::uint64_t          expected{0};  // SizeMismatch
    std::uint64_t          actual{0};    // SizeMismatch
    std::string            detail;
};

struct ReceiveResult
{
    ReceiveStatus status{ReceiveStatus::Pending};
    Bytes         data;   // Complete only
    ReceiveError  error;  // Error only
};

const char *to_string(ReceiveStatus status);
const char *to_string(ReceiveErrorType type);

/*
Per batch: Unseen -> Awaiting -> Complete | TimedOut | Evicted
A rejected fragment (duplicate, out of range) leaves the batch untouched.

Limits are enforced before state grows: a new batch evicts the oldest one when the
table is full, and fragment bytes evict oldest batches (creation order) until they fit.
A provisional batch (data seen, no header yet) only ever displaces other provisional
batches; when confirmed batches leave no room the orphan fragment is dropped.
Single-threaded: confine an instance to one thread, timers included.
*/
class Reassembler
{
  public:
    // Without a TimerApi the reassembler runs its own TimerQueue; due timers then fire
    // at the start of receive()/receive_raw() and from poll_timers().
    // Throws std::invalid_argument on a zero timeout or a zero batch limit.
    explicit Reassembler(ReassemblerConfig cfg = {}, util::TimerApi timers = {});
    ~Reassembler();

    Reassembler(const Reassembler &)            = delete;
    Reassembler &operator=(const Reassembler &) = delete;

    ReceiveResult receive(const TransportPayload &payload);
    ReceiveResult receive_raw(const Bytes &bytes);

    // Fires due timers of the internal queue; no-op with injected timers.
    std::size_t poll_timers();

    // Cancels every timer and drops all batches. Later receives return parse_error.
    void dispose();

    std::size_t pending_batch_count() const { return index_.size(); }
    std::size_t pending_bytes() const { return total_bytes_; }
    std::size_t pending_fragment_count() const { return fragment_count_; }
    bool        disposed() const { return disposed_; }

  private:
    struct BatchState
    {
        BatchId                        id{};
        std::string                    key;
        bool                           have_header = false;
        std::uint32_t                  count       = 0;
        std::uint32_t                  total_size  = 0;
        std::map<std::uint32_t, Bytes> parts;  // index -> bytes
        std::size_t                    bytes = 0;
        std::chrono::steady_clock::time_point created;
        util::TimerId                  timer = 0;
    };
    // creation order; front is the oldest
    using BatchList = std::list<BatchState>;

    ReceiveResult on_header(const FragmentHeader &h);
    ReceiveResult on_data(const FragmentData &d);

    // end() when a provisional batch finds no room
    BatchList::iterator open_batch(const BatchId &id, std::string key, bool provisional);
    BatchList::iterator oldest(bool provisional_only);
    std::size_t         provisional_charge() const;
    bool                admit(std::size_t n, BatchList::iterator it);
    ReceiveResult       complete_batch(BatchList::iterator it);
    void                evict(BatchList::iterator it);
    void                on_timer(const std::string &key);
    BatchState          remove(BatchList::iterator it);

    ReassemblerConfig                                   cfg_;
    std::unique_ptr<util::TimerQueue>                   own_timers_;
    util::TimerApi                                      timers_;
    BatchList                                           batches_;
    std::unordered_map<std::string, BatchList::iterator> index_;
    std::size_t                                         total_bytes_    = 0;  // data only
    std::size_t                                         charged_bytes_  = 0;  // data + bookkeeping
    std::size_t                                         fragment_count_ = 0;
    bool                                                disposed_    = false;
};

}  // namespace frag

/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_CHANNEL_h
#define QNET_CHANNEL_h

#include "qnet/qubit.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace qnet
{

class CHANNEL;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

using classical_bits_type = std::vector<uint8_t>;

/*
 * A single-qubit state in flight. The sender gives up the qubit; the
 * receiver installs `state` wherever it needs it.
 * */
struct QUANTUM_PAYLOAD
{
    QUBIT_STATE state{};
    double      fidelity{1.0};
};

using payload_type = std::variant<classical_bits_type, QUANTUM_PAYLOAD>;

struct MESSAGE
{
    payload_type payload;
    node_id_type source;
    node_id_type destination;
    uint64_t     sequence{0};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class SEND_STATUS { ACCEPTED, CAPACITY_EXCEEDED };
enum class RECEIVE_STATUS { RECEIVED, TIMED_OUT, CANCELLED };

struct RECEIVE_RESULT
{
    RECEIVE_STATUS         status;
    std::optional<MESSAGE> message{};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Cancels pending receives. A token may be shared by any number of
 * receivers on any number of channels. Once cancelled it stays cancelled.
 * */
class CANCEL_TOKEN
{
private:
    std::atomic<bool> cancelled_{false};

    std::mutex            mtx_;
    std::vector<CHANNEL*> waiting_;
public:
    CANCEL_TOKEN() =default;
    CANCEL_TOKEN(const CANCEL_TOKEN&) =delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }
private:
    void attach(CHANNEL*);
    void detach(CHANNEL*);

    friend class CHANNEL;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * A bounded FIFO of messages. `send` never blocks; `receive` blocks on a
 * condition variable until a message arrives, the timeout expires, or its
 * cancel token fires.
 * */
class CHANNEL
{
public:
    const std::string id;
    const size_t      capacity;
    const double      fidelity;
    const double      bandwidth;
private:
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<MESSAGE>     queue_;

    std::atomic<bool> busy_{false};

    std::atomic<uint64_t> s_sent_{0};
    std::atomic<uint64_t> s_received_{0};
    std::atomic<uint64_t> s_rejected_{0};
    std::atomic<uint64_t> s_dropped_{0};
    uint64_t              sequence_{0};
public:
    CHANNEL(std::string id, size_t capacity, double fidelity, double bandwidth);
    CHANNEL(const CHANNEL&) =delete;

    SEND_STATUS    send(payload_type, const node_id_type& destination, const node_id_type& source="");

    /*
     * A timeout of 0 returns immediately. Cancellation never removes a
     * message from the queue.
     * */
    RECEIVE_RESULT receive(std::chrono::milliseconds timeout, CANCEL_TOKEN* token=nullptr);

    /*
     * The busy flag marks a channel as claimed by one protocol run. It
     * does not gate `send` or `receive`.
     * */
    bool try_claim();
    void release();
    bool busy() const { return busy_.load(); }

    /*
     * Discards every queued message and returns how many were dropped.
     * */
    size_t drain();

    size_t size() const;

    uint64_t messages_sent() const { return s_sent_.load(); }
    uint64_t messages_received() const { return s_received_.load(); }
    uint64_t messages_rejected() const { return s_rejected_.load(); }
    uint64_t messages_dropped() const { return s_dropped_.load(); }
private:
    void wake();

    friend class CANCEL_TOKEN;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * With probability `loss_rate`, applies a uniformly chosen X, Y, or Z to
 * `q`. Returns true if an error was applied.
 * */
bool apply_link_noise(QUBIT_STATE& q, double loss_rate, rng_type&);

/*
 * Same as above but returns the error instead of applying it (`PAULI::I`
 * if none). Used for qubits that live in a joint state.
 * */
PAULI sample_link_noise(double loss_rate, rng_type&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_CHANNEL_h

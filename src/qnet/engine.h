/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_ENGINE_h
#define QNET_ENGINE_h

#include "qnet/config.h"
#include "qnet/network.h"
#include "qnet/protocol.h"
#include "qnet/resource.h"
#include "qnet/routing.h"

#include <array>
#include <atomic>
#include <condition_variable>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct EXECUTION_LOG_ENTRY
{
    uint64_t         index;
    std::string_view protocol;
    RESULT_STATUS    status;
    std::string      summary;
    double           walltime_ms;
};

struct NETWORK_STATISTICS
{
    size_t  nodes{0};
    size_t  links{0};
    size_t  channels{0};
    size_t  live_pairs{0};
    double  mean_pair_fidelity{0.0};
    int64_t diameter{0};
    double  connectivity{0.0};

    uint64_t messages_sent{0};
    uint64_t messages_received{0};
    uint64_t messages_rejected{0};
    uint64_t messages_dropped{0};
    uint64_t pairs_created{0};

    std::array<uint64_t, PROTOCOL_KIND_COUNT> invocations{};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Owns one network together with its resource arena and executes protocol
 * invocations against it.
 *
 * `execute` may be called from several threads at once. The resource
 * arena and the qubit maps of the nodes are guarded by a single mutex that
 * is held only for individual resource operations, never across a channel
 * receive. Each channel synchronizes itself.
 * */
class ENGINE
{
public:
    const ENGINE_CONFIG config;
private:
    /*
     * State of one call to `execute`. Protocol handlers fill in
     * `result.record` as they progress, so a failed run still reports how
     * far it got.
     * */
    struct EXECUTION
    {
        uint64_t        index;
        rng_type        rng;
        CANCEL_TOKEN*   token;
        PROTOCOL_RESULT result{};
    };

    /*
     * Holds a channel's busy flag for the lifetime of the object.
     * */
    class CHANNEL_CLAIM
    {
    private:
        ENGINE*  engine_;
        CHANNEL* channel_;
    public:
        CHANNEL_CLAIM(ENGINE*, CHANNEL*);
        CHANNEL_CLAIM(const CHANNEL_CLAIM&) =delete;
        ~CHANNEL_CLAIM();

        CHANNEL* operator->() const { return channel_; }
        CHANNEL* get() const { return channel_; }
    };

    RESOURCE_MODEL resources_;
    NETWORK        network_;

    mutable std::mutex resource_mtx_;

    std::mutex              claim_mtx_;
    std::condition_variable claim_cv_;

    mutable std::mutex               log_mtx_;
    std::vector<EXECUTION_LOG_ENTRY> log_;

    std::atomic<uint64_t> invocation_counter_{0};
    std::atomic<uint64_t> clock_ns_{0};

    uint64_t teleport_counter_{0};

    std::atomic<uint64_t>                                  s_pairs_created_{0};
    std::array<std::atomic<uint64_t>, PROTOCOL_KIND_COUNT> s_invocations_{};
public:
    ENGINE(const NETWORK_SPEC&, ENGINE_CONFIG={});
    ENGINE(const ENGINE&) =delete;

    /*
     * Runs one protocol to completion. Never throws a `NETWORK_ERROR`: every
     * failure is reported through the returned result.
     * */
    PROTOCOL_RESULT execute(const PROTOCOL_INVOCATION&, CANCEL_TOKEN* token=nullptr);

    /*
     * Executes `invocations` on `num_threads` worker threads. Results are
     * returned in invocation order.
     * */
    std::vector<PROTOCOL_RESULT> execute_all(const std::vector<PROTOCOL_INVOCATION>&, size_t num_threads=1);

    const NETWORK& network() const { return network_; }

    /*
     * Direct resource operations. These throw `NETWORK_ERROR` on failure.
     * */
    NETWORK_QUBIT  qubit(const std::string& name) const;
    ENTANGLED_PAIR pair(const std::string& name) const;
    bool           pair_intact(const std::string& name) const;

    std::pair<std::string, std::string> pair_qubits(const std::string& pair_name) const;
    std::vector<std::string>            hosted_qubits(const node_id_type&) const;
    std::vector<std::string>            live_pairs() const;

    void    prepare_qubit(const std::string& name, uint8_t bit, BASIS);
    void    apply_pauli(const std::string& name, PAULI);
    uint8_t measure(const std::string& name, BASIS, rng_type&);

    /*
     * Creates a Bell pair between two nodes. The halves occupy a slot at
     * their nodes. Returns the pair's name.
     * */
    std::string create_pair(const node_id_type&, const node_id_type&, std::optional<double> fidelity={});

    NETWORK_STATISTICS               statistics() const;
    std::vector<EXECUTION_LOG_ENTRY> execution_log() const;

    void print_stats(std::ostream&) const;
private:
    void run(const BB84_REQUEST&, EXECUTION&);
    void run(const E91_REQUEST&, EXECUTION&);
    void run(const TELEPORT_REQUEST&, EXECUTION&);
    void run(const ENTANGLE_REQUEST&, EXECUTION&);
    void run(const PURIFY_REQUEST&, EXECUTION&);
    void run(const SWAP_REQUEST&, EXECUTION&);
    void run(const SUPERDENSE_REQUEST&, EXECUTION&);
    void run(const SEND_REQUEST&, EXECUTION&);

    void log(const std::string&) const;

    ROUTE route(const node_id_type&, const node_id_type&) const;

    /*
     * Claims a free channel on the link, waiting up to the receive timeout
     * if all are claimed. Throws a timed-out error otherwise. If
     * `channel_id` is given, only that channel is considered.
     * */
    CHANNEL* claim_channel(const LINK&, EXECUTION&, std::optional<std::string_view> channel_id={});
    void     release_channel(CHANNEL*);

    /*
     * Sends `bits` hop by hop along `path` and returns what arrives at the
     * last node.
     * */
    classical_bits_type relay_classical(const std::vector<node_id_type>& path, classical_bits_type bits, EXECUTION&);

    /*
     * Sends the states hop by hop along `path`, applying link noise on
     * every hop, and returns what arrives at the last node.
     * */
    std::vector<QUANTUM_PAYLOAD> relay_quantum(const std::vector<node_id_type>& path,
                                                std::vector<QUANTUM_PAYLOAD>,
                                                EXECUTION&);

    RECEIVE_RESULT receive_or_throw(CHANNEL*, EXECUTION&);

    time_ns_type now() const { return clock_ns_.load(); }
    void         advance_clock(const LINK&);

    /*
     * The following require `resource_mtx_` to be held.
     * */
    void                 unhost(qubit_handle_type);
    void                 consume_pair(pair_handle_type, rng_type&);
    pair_handle_type     create_hosted_pair(const node_id_type&, const node_id_type&, double fidelity);
    void                 apply_route_noise(qubit_handle_type, const std::vector<node_id_type>& path, rng_type&);

    /*
     * Builds a pair between the ends of `path` out of one transient pair per
     * hop joined by swaps at the intermediate nodes.
     * */
    pair_handle_type     create_transient_chain(const std::vector<node_id_type>& path, rng_type&);

    PURIFY_RECORD        purify_pairs(std::vector<pair_handle_type>, double target, size_t rounds, rng_type&);

    friend class CHANNEL_CLAIM;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_ENGINE_h

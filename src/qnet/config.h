/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_CONFIG_h
#define QNET_CONFIG_h

#include "globals.h"

#include <iostream>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class ROUTING_POLICY { HOP_COUNT, FIDELITY, LOSS };

/*
 * QKD runs prepare 4 qubits per key bit, and purified distribution builds
 * 2^rounds pairs per segment. Requests beyond these are configuration errors.
 * */
constexpr size_t MAX_KEY_LENGTH{size_t{1} << 20};
constexpr size_t MAX_PURIFY_ROUNDS{16};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct ENGINE_CONFIG
{
    uint64_t seed{0};

    /*
     * Fidelity of a freshly generated Bell pair over a single link, and
     * the upper bound on the fidelity of a teleported qubit.
     * */
    double pair_fidelity{0.95};
    double teleport_fidelity_bound{0.95};

    /*
     * QKD parameters:
     *  -- `qber_sample_size` is the maximum number of sifted bits sacrificed
     *      to estimate the QBER (never more than half the sifted key)
     *  -- `correlation_sample_size` is the number of E91 outcomes used for
     *      the reported correlation
     * */
    size_t qber_sample_size{50};
    size_t correlation_sample_size{100};

    /*
     * Purification: each successful round raises the surviving pair by
     * `purify_step` up to `purify_cap`. `purify_rounds` is used by
     * entanglement distribution when purification is requested.
     * */
    double purify_step{0.05};
    double purify_cap{0.99};
    size_t purify_rounds{1};

    uint64_t receive_timeout_ms{1000};

    /*
     * Parameters for links and channels that are generated rather than
     * declared.
     * */
    size_t default_channel_capacity{64};
    double default_channel_fidelity{1.0};
    double default_channel_bandwidth{1e9};
    double default_distance{1.0};
    double default_loss_rate{0.01};

    ROUTING_POLICY routing_policy{ROUTING_POLICY::HOP_COUNT};

    bool          verbose{false};
    std::ostream* log_strm{&std::cout};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_CONFIG_h

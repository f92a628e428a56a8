/*
 *  author: qnet developers
 *  date:   18 October 2026
 *
 *  This file contains the teleportation, superdense coding, and
 *  entanglement swapping handlers of `ENGINE`.
 * */

#include "qnet/engine.h"

#include <algorithm>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const TELEPORT_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = TELEPORT_RECORD{.source=req.source, .target=req.target, .source_qubit=req.qubit};
    TELEPORT_RECORD& rec = std::get<TELEPORT_RECORD>(ex.result.record);

    if (req.source == req.target)
        throw_configuration_error("TELEPORT: source and target are the same node -- " + req.source);

    ROUTE r = route(req.source, req.target);
    rec.hops = r.hops();

    RESOURCE_MODEL::teleport_result_type tr;
    double source_fidelity;
    {
        std::lock_guard<std::mutex> lg(resource_mtx_);

        const NODE& src_node = network_.node(req.source);
        const NODE& dst_node = network_.node(req.target);
        if (!src_node.qubits.count(req.qubit))
            throw_reference_error("TELEPORT: qubit " + req.qubit + " is not hosted at " + req.source);

        qubit_handle_type src = src_node.qubits.at(req.qubit);
        if (!resources_.qubit(src).is_active())
            throw_state_error("TELEPORT: qubit already consumed -- " + req.qubit);
        if (resources_.qubit(src).joint != NO_HANDLE)
            throw_state_error("TELEPORT: qubit is entangled and cannot be teleported -- " + req.qubit);

        pair_handle_type p{NO_HANDLE};
        qubit_handle_type near_half{NO_HANDLE};
        size_t target_slots = dst_node.free_slots();
        if (req.pair.has_value())
        {
            p = resources_.find_pair(*req.pair);
            if (!resources_.is_intact(p))
                throw_state_error("TELEPORT: pair already consumed -- " + *req.pair);

            const ENTANGLED_PAIR& ep = resources_.pair(p);
            const NETWORK_QUBIT& q1 = resources_.qubit(ep.first);
            const NETWORK_QUBIT& q2 = resources_.qubit(ep.second);
            if (q1.owner == req.source && q2.owner == req.target)
                near_half = ep.first;
            else if (q2.owner == req.source && q1.owner == req.target)
                near_half = ep.second;
            else
                throw_state_error("TELEPORT: pair " + *req.pair + " does not connect " + req.source + " and " + req.target);

            // the far half gives its slot to the teleported qubit
            if (!resources_.qubit(resources_.partner_of(near_half)).transient)
                target_slots++;
        }

        if (target_slots == 0)
            throw_resource_error("TELEPORT: node " + req.target + " is at capacity");

        if (!req.pair.has_value())
        {
            p = create_transient_chain(r.path, ex.rng);
            near_half = resources_.pair(p).first;
        }

        const ENTANGLED_PAIR& ep = resources_.pair(p);
        rec.pair = ep.name;
        rec.pair_fidelity = ep.fidelity;
        source_fidelity = resources_.qubit(src).fidelity;

        qubit_handle_type far_half = resources_.partner_of(near_half);
        unhost(src);
        unhost(near_half);
        unhost(far_half);
        tr = resources_.teleport(src, near_half, ex.rng);
    }

    rec.bell_measurement = tr.outcome.as_index();
    rec.classical_bits = tr.outcome.bits();

    // the correction bits travel to the target over the classical channel
    classical_bits_type bits = relay_classical(r.path, {tr.outcome.x_bit, tr.outcome.z_bit}, ex);
    if (bits.size() != 2)
        throw_state_error("TELEPORT: malformed correction message of " + std::to_string(bits.size()) + " bits");

    {
        std::lock_guard<std::mutex> lg(resource_mtx_);

        NODE& dst_node = network_.node(req.target);
        std::string name = req.target + "_teleported_" + std::to_string(teleport_counter_++);
        double fidelity = std::min(source_fidelity, config.teleport_fidelity_bound);

        qubit_handle_type h = resources_.allocate(req.target, name, tr.uncorrected_state, fidelity, now());
        dst_node.host(name, h);
        resources_.apply_pauli_correction(h, {bits[0], bits[1]});

        rec.target_qubit = name;
        rec.fidelity = fidelity;
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const SUPERDENSE_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = SUPERDENSE_RECORD{.sender=req.sender, .receiver=req.receiver, .sent_bits=req.bits};
    SUPERDENSE_RECORD& rec = std::get<SUPERDENSE_RECORD>(ex.result.record);

    if (req.sender == req.receiver)
        throw_configuration_error("SUPERDENSE: sender and receiver are the same node -- " + req.sender);
    if (req.bits[0] > 1 || req.bits[1] > 1)
        throw_configuration_error("SUPERDENSE: message bits must be 0 or 1");

    ROUTE r = route(req.sender, req.receiver);
    rec.hops = r.hops();

    std::lock_guard<std::mutex> lg(resource_mtx_);

    pair_handle_type p{NO_HANDLE};
    qubit_handle_type near_half{NO_HANDLE};
    if (req.pair.has_value())
    {
        p = resources_.find_pair(*req.pair);
        if (!resources_.is_intact(p))
            throw_state_error("SUPERDENSE: pair already consumed -- " + *req.pair);

        const ENTANGLED_PAIR& ep = resources_.pair(p);
        const NETWORK_QUBIT& q1 = resources_.qubit(ep.first);
        const NETWORK_QUBIT& q2 = resources_.qubit(ep.second);
        if (q1.owner == req.sender && q2.owner == req.receiver)
            near_half = ep.first;
        else if (q2.owner == req.sender && q1.owner == req.receiver)
            near_half = ep.second;
        else
            throw_state_error("SUPERDENSE: pair " + *req.pair + " does not connect " + req.sender + " and " + req.receiver);
    }
    else
    {
        p = create_transient_chain(r.path, ex.rng);
        near_half = resources_.pair(p).first;
    }
    qubit_handle_type far_half = resources_.partner_of(near_half);

    const ENTANGLED_PAIR& ep = resources_.pair(p);
    rec.pair = ep.name;
    rec.pair_fidelity = ep.fidelity;

    if (req.bits[0])
        resources_.apply_pauli(near_half, PAULI::Z);
    if (req.bits[1])
        resources_.apply_pauli(near_half, PAULI::X);

    // the encoded half travels to the receiver, picking up link noise on the way
    unhost(near_half);
    unhost(far_half);
    apply_route_noise(near_half, r.path, ex.rng);
    for (size_t i = 0; i+1 < r.path.size(); i++)
        advance_clock(network_.link(r.path[i], r.path[i+1]));

    BELL_OUTCOME out = resources_.bell_measure(near_half, far_half);
    rec.decoded_bits = {out.z_bit, out.x_bit};
    rec.success = (rec.decoded_bits == rec.sent_bits);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const SWAP_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = SWAP_RECORD{.qubit_a=req.qubit_a, .qubit_b=req.qubit_b};
    SWAP_RECORD& rec = std::get<SWAP_RECORD>(ex.result.record);
    rec.corrected = req.measure;

    std::lock_guard<std::mutex> lg(resource_mtx_);

    qubit_handle_type a = resources_.find_qubit(req.qubit_a),
                      b = resources_.find_qubit(req.qubit_b);
    for (qubit_handle_type q : {a, b})
    {
        pair_handle_type p = resources_.pair_of(q);
        if (p == NO_HANDLE || !resources_.is_intact(p))
            throw_state_error("SWAP: qubit is not half of a live pair -- " + resources_.qubit(q).name);
    }

    // `swap` validates colocation before touching anything
    auto sr = resources_.swap(a, b, req.measure, ex.rng);
    unhost(a);
    unhost(b);

    const ENTANGLED_PAIR& np = resources_.pair(sr.pair);
    rec.new_pair = np.name;
    rec.endpoint_a = resources_.qubit(np.first).owner;
    rec.endpoint_b = resources_.qubit(np.second).owner;
    rec.fidelity = np.fidelity;
    rec.bell_measurement = sr.outcome.as_index();

    log("SWAP: " + req.qubit_a + ", " + req.qubit_b + " -> " + np.name);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

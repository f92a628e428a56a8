/*
 *  author: qnet developers
 *  date:   18 October 2026
 *
 *  This file contains the QKD handlers of `ENGINE` (BB84 and E91).
 * */

#include "qnet/engine.h"

#include <algorithm>

namespace qnet
{

namespace
{

classical_bits_type
encode_bases(const basis_vector_type& bases)
{
    classical_bits_type out(bases.size());
    std::transform(bases.begin(), bases.end(), out.begin(), [] (BASIS b) { return b == BASIS::X ? 1 : 0; });
    return out;
}

basis_vector_type
decode_bases(const classical_bits_type& bits)
{
    basis_vector_type out(bits.size());
    std::transform(bits.begin(), bits.end(), out.begin(), [] (uint8_t x) { return x ? BASIS::X : BASIS::Z; });
    return out;
}

bit_vector_type
slice(const bit_vector_type& v, size_t begin, size_t count)
{
    begin = std::min(begin, v.size());
    size_t end = std::min(v.size(), begin + count);
    return bit_vector_type(v.begin() + begin, v.begin() + end);
}

void
check_qkd_endpoints(const node_id_type& alice, const node_id_type& bob, size_t key_length)
{
    if (alice == bob)
        throw_configuration_error("QKD: both parties are the same node -- " + alice);
    if (key_length == 0)
        throw_configuration_error("QKD: key length must be positive");
    if (key_length > MAX_KEY_LENGTH)
    {
        throw_configuration_error("QKD: key length " + std::to_string(key_length)
                                    + " exceeds the maximum of " + std::to_string(MAX_KEY_LENGTH));
    }
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const BB84_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = BB84_RECORD{.alice=req.alice, .bob=req.bob};
    BB84_RECORD& rec = std::get<BB84_RECORD>(ex.result.record);

    check_qkd_endpoints(req.alice, req.bob, req.key_length);
    if (req.security_threshold < 0.0 || req.security_threshold > 1.0)
        throw_configuration_error("BB84: security threshold must be in [0, 1] -- " + std::to_string(req.security_threshold));

    ROUTE r = route(req.alice, req.bob);
    std::vector<node_id_type> reverse_path(r.path.rbegin(), r.path.rend());
    rec.hops = r.hops();

    // alice prepares 4k photons
    const size_t n = 4*req.key_length;
    bit_vector_type   alice_bits(n);
    basis_vector_type alice_bases(n);
    std::vector<QUANTUM_PAYLOAD> photons(n);
    for (size_t i = 0; i < n; i++)
    {
        alice_bits[i] = random_bit(ex.rng);
        alice_bases[i] = random_basis(ex.rng);
        photons[i].state = prepare_basis_state(alice_bits[i], alice_bases[i]);
    }
    rec.raw_length = n;

    rec.stage = QKD_STAGE::TRANSMITTING;
    photons = relay_quantum(r.path, std::move(photons), ex);

    rec.stage = QKD_STAGE::MEASURING;
    bit_vector_type   bob_results(n);
    basis_vector_type bob_bases(n);
    for (size_t i = 0; i < n; i++)
    {
        bob_bases[i] = random_basis(ex.rng);
        bob_results[i] = qnet::measure(photons[i].state, bob_bases[i], ex.rng);
    }

    // public discussion: each side learns the other's bases
    rec.stage = QKD_STAGE::SIFTING;
    basis_vector_type bob_bases_at_alice = decode_bases(relay_classical(reverse_path, encode_bases(bob_bases), ex));
    basis_vector_type alice_bases_at_bob = decode_bases(relay_classical(r.path, encode_bases(alice_bases), ex));

    bit_vector_type alice_sifted = sift(alice_bits, alice_bases, bob_bases_at_alice);
    bit_vector_type bob_sifted = sift(bob_results, alice_bases_at_bob, bob_bases);
    rec.sifted_length = alice_sifted.size();

    rec.stage = QKD_STAGE::ERROR_ESTIMATION;
    size_t sample = std::min(config.qber_sample_size, alice_sifted.size() / 2);
    if (sample == 0)
    {
        rec.stage = QKD_STAGE::ABORTED;
        throw NETWORK_ERROR(ERROR_KIND::SECURITY_ABORTED, "BB84: not enough sifted bits to estimate the error rate");
    }

    // bob sacrifices the first `sample` sifted bits
    bit_vector_type revealed = relay_classical(reverse_path, slice(bob_sifted, 0, sample), ex);
    rec.qber = estimate_qber(alice_sifted, revealed, sample);
    if (rec.qber > req.security_threshold)
    {
        rec.stage = QKD_STAGE::ABORTED;
        throw NETWORK_ERROR(ERROR_KIND::SECURITY_ABORTED,
                    "BB84: qber " + std::to_string(rec.qber) + " exceeds threshold " + std::to_string(req.security_threshold));
    }

    rec.key = slice(alice_sifted, sample, req.key_length);
    rec.receiver_key = slice(bob_sifted, sample, req.key_length);
    rec.final_length = rec.key->size();
    rec.stage = QKD_STAGE::KEY_ACCEPTED;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const E91_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = E91_RECORD{.alice=req.alice, .bob=req.bob};
    E91_RECORD& rec = std::get<E91_RECORD>(ex.result.record);

    check_qkd_endpoints(req.alice, req.bob, req.key_length);

    ROUTE r = route(req.alice, req.bob);
    std::vector<node_id_type> reverse_path(r.path.rbegin(), r.path.rend());
    rec.hops = r.hops();

    const size_t n = 4*req.key_length;
    bit_vector_type   alice_results(n),
                      bob_results(n);
    basis_vector_type alice_bases(n),
                      bob_bases(n);
    for (size_t i = 0; i < n; i++)
    {
        alice_bases[i] = random_basis(ex.rng);
        bob_bases[i] = random_basis(ex.rng);

        std::lock_guard<std::mutex> lg(resource_mtx_);
        pair_handle_type p = resources_.create_entangled_pair(req.alice, req.bob, config.pair_fidelity, now(), true);
        s_pairs_created_++;
        rec.pairs_created++;

        const ENTANGLED_PAIR& ep = resources_.pair(p);
        apply_route_noise(ep.second, r.path, ex.rng);
        alice_results[i] = resources_.measure(ep.first, alice_bases[i], ex.rng);
        bob_results[i] = resources_.measure(ep.second, bob_bases[i], ex.rng);
        resources_.consume_pair(p, ex.rng);
    }

    basis_vector_type bob_bases_at_alice = decode_bases(relay_classical(reverse_path, encode_bases(bob_bases), ex));
    basis_vector_type alice_bases_at_bob = decode_bases(relay_classical(r.path, encode_bases(alice_bases), ex));

    rec.correlation = correlation(alice_results, bob_results, config.correlation_sample_size);

    bit_vector_type alice_matched = sift(alice_results, alice_bases, bob_bases_at_alice);
    bit_vector_type bob_matched = sift(bob_results, alice_bases_at_bob, bob_bases);
    rec.matched_correlation = correlation(alice_matched, bob_matched, alice_matched.size());

    rec.key = slice(alice_matched, 0, req.key_length);
    rec.key_length = rec.key.size();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

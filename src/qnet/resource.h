/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_RESOURCE_h
#define QNET_RESOURCE_h

#include "qnet/qubit.h"

#include <array>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class QUBIT_STATUS { ACTIVE, MEASURED, RELEASED };

struct NETWORK_QUBIT
{
    qubit_handle_type handle{NO_HANDLE};
    std::string       name;
    node_id_type      owner;

    /*
     * Only meaningful while `joint == NO_HANDLE`. Members of a joint state
     * have no individual amplitude vector.
     * */
    QUBIT_STATE state{};

    std::set<qubit_handle_type> entangled_with{};

    double       fidelity{1.0};
    time_ns_type created_ns{0};
    QUBIT_STATUS status{QUBIT_STATUS::ACTIVE};

    joint_handle_type joint{NO_HANDLE};

    /*
     * Transient qubits are created and consumed within one protocol
     * step and never occupy a slot at their node.
     * */
    bool transient{false};

    bool is_active() const { return status == QUBIT_STATUS::ACTIVE; }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Shared state of a Bell pair or GHZ state:
 *
 *      (|m> + sign * |~m>) / sqrt(2)
 *
 * where `m` is the bit-flip mask over `members` (`flip`) and `~m` is its
 * complement. A Bell pair is the two-member case. Pauli operations and
 * Z/X-basis measurements keep the state inside this family, so joint
 * statistics are exact for any number of members without storing a 2^N
 * amplitude vector.
 * */
struct JOINT_STATE
{
    joint_handle_type handle{NO_HANDLE};

    std::vector<qubit_handle_type>                members;
    std::unordered_map<qubit_handle_type, uint8_t> flip;
    int sign{+1};

    bool dissolved{false};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct ENTANGLED_PAIR
{
    pair_handle_type  handle{NO_HANDLE};
    std::string       name;
    qubit_handle_type first{NO_HANDLE};
    qubit_handle_type second{NO_HANDLE};

    double       fidelity{0.95};
    time_ns_type created_ns{0};
    bool         consumed{false};
};

/*
 * Outcome of a Bell-state measurement. `x_bit` selects the X correction
 * and `z_bit` the Z correction at the receiving end.
 * */
struct BELL_OUTCOME
{
    uint8_t x_bit{0};
    uint8_t z_bit{0};

    int as_index() const { return 2*x_bit + z_bit; }
    std::array<uint8_t, 2> bits() const { return {x_bit, z_bit}; }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Arena for all qubits, joint states, and entangled pairs of one engine.
 *
 * Entries are never erased, so handles stay valid for the lifetime of the
 * model. This class is not synchronized; `ENGINE` serializes access.
 * */
class RESOURCE_MODEL
{
public:
    struct teleport_result_type
    {
        BELL_OUTCOME outcome;

        /*
         * The state that arrives at the far end of the pair before the
         * Pauli correction is applied.
         * */
        QUBIT_STATE       uncorrected_state;
        qubit_handle_type far_half;
    };

    struct swap_result_type
    {
        pair_handle_type pair;
        BELL_OUTCOME     outcome;
    };
private:
    std::vector<NETWORK_QUBIT>  qubits_;
    std::vector<JOINT_STATE>    joints_;
    std::vector<ENTANGLED_PAIR> pairs_;

    std::unordered_map<std::string, qubit_handle_type> qubit_by_name_;
    std::unordered_map<std::string, pair_handle_type>  pair_by_name_;

    // the pair (if any) a qubit was created as part of
    std::unordered_map<qubit_handle_type, pair_handle_type> pair_of_qubit_;

    uint64_t pair_counter_{0};
    uint64_t ghz_counter_{0};
public:
    RESOURCE_MODEL() =default;

    qubit_handle_type allocate(const node_id_type& owner,
                                std::string name,
                                QUBIT_STATE,
                                double fidelity,
                                time_ns_type now,
                                bool transient=false);

    /*
     * Creates `count` qubits in |0> named `<node>_q<i>`.
     * */
    std::vector<qubit_handle_type> initialize(const node_id_type&, size_t count, time_ns_type now);

    const NETWORK_QUBIT&  qubit(qubit_handle_type) const;
    const ENTANGLED_PAIR& pair(pair_handle_type) const;

    qubit_handle_type find_qubit(const std::string& name) const;
    pair_handle_type  find_pair(const std::string& name) const;

    pair_handle_type  pair_of(qubit_handle_type) const;

    /*
     * True if both halves are active and still share their joint state.
     * */
    bool is_intact(pair_handle_type) const;

    /*
     * Returns the other member of `q`'s two-member joint state.
     * Throws a state error if `q` is not half of an intact pair.
     * */
    qubit_handle_type partner_of(qubit_handle_type q) const;

    void apply_basis_preparation(qubit_handle_type, uint8_t bit, BASIS);
    void apply_pauli(qubit_handle_type, PAULI);
    void apply_pauli_correction(qubit_handle_type, const std::array<uint8_t, 2>& bits);
    void set_fidelity(qubit_handle_type, double);

    uint8_t measure(qubit_handle_type, BASIS, rng_type&);

    /*
     * Discards a qubit. If it is entangled, it is first measured in Z
     * and the outcome is forgotten, which leaves its partners with the
     * same statistics as tracing it out.
     * */
    void release(qubit_handle_type, rng_type&);

    /*
     * Creates a Bell pair |Phi+> with one half at each node.
     * */
    pair_handle_type create_entangled_pair(const node_id_type& a,
                                            const node_id_type& b,
                                            double fidelity,
                                            time_ns_type now,
                                            bool transient=false);

    /*
     * Creates one qubit per node sharing a GHZ state.
     * */
    std::vector<qubit_handle_type> create_ghz(const std::vector<node_id_type>&,
                                                double fidelity,
                                                time_ns_type now,
                                                bool transient=false);

    /*
     * Releases both halves of the pair (if still active) and marks
     * it consumed.
     * */
    void consume_pair(pair_handle_type, rng_type&);
    void set_pair_fidelity(pair_handle_type, double);

    /*
     * Bell measurement of `source` (an unentangled qubit) with `near_half`
     * of an intact pair. Both measured qubits are marked measured and the
     * far half is released: its state is returned for the caller to
     * install at the destination.
     * */
    teleport_result_type teleport(qubit_handle_type source, qubit_handle_type near_half, rng_type&);

    /*
     * Bell measurement of `a` and `b`, each half of a different intact
     * pair. The outer halves become a new pair with fidelity f1*f2. If
     * `apply_correction` is false, the outcome is left in the new pair's
     * Pauli frame.
     * */
    swap_result_type swap(qubit_handle_type a, qubit_handle_type b, bool apply_correction, rng_type&);

    /*
     * Bell measurement of both halves of one intact pair. The outcome is
     * the pair's Pauli frame, so it is deterministic. Both qubits are
     * marked measured and the pair consumed.
     * */
    BELL_OUTCOME bell_measure(qubit_handle_type a, qubit_handle_type b);

    size_t qubit_count() const { return qubits_.size(); }
    size_t pair_count() const { return pairs_.size(); }

    std::vector<pair_handle_type> intact_pairs() const;
private:
    NETWORK_QUBIT& get_active(qubit_handle_type, const char* caller);
    NETWORK_QUBIT& get(qubit_handle_type);

    joint_handle_type new_joint(const std::vector<qubit_handle_type>&);
    pair_handle_type  new_pair(qubit_handle_type, qubit_handle_type, double fidelity, time_ns_type now);

    /*
     * Returns the Pauli frame (x, z) of a two-member joint relative to
     * |Phi+>, placed on its second member.
     * */
    BELL_OUTCOME frame_of(const JOINT_STATE&) const;

    void dissolve(JOINT_STATE&);
    void drop_member(JOINT_STATE&, qubit_handle_type);
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_RESOURCE_h

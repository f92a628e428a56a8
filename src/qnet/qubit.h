/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_QUBIT_h
#define QNET_QUBIT_h

#include "globals.h"

#include <array>
#include <complex>
#include <iosfwd>
#include <string>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class BASIS { Z, X };
enum class PAULI { I, X, Y, Z };

char to_char(BASIS);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * A single-qubit state `a0|0> + a1|1>`. Multi-qubit states are never
 * stored as a literal vector (see `JOINT_STATE` in `qnet/resource.h`).
 * */
struct QUBIT_STATE
{
    using amplitude_type = std::complex<double>;

    std::array<amplitude_type, 2> amp{amplitude_type{1.0, 0.0}, amplitude_type{0.0, 0.0}};

    /*
     * Probability of reading 0 (i.e., |0> or |+>) when measured
     * in the given basis.
     * */
    double probability_of_zero(BASIS) const;

    /*
     * Returns true if this state is equal to `other` up to a global phase.
     * */
    bool equivalent_to(const QUBIT_STATE& other, double tol=1e-9) const;

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream&, const QUBIT_STATE&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * BB84 state preparation:
 *  Z basis: 0 -> |0>, 1 -> |1>
 *  X basis: 0 -> |+>, 1 -> |->
 * */
QUBIT_STATE prepare_basis_state(uint8_t bit, BASIS);

void apply_pauli(QUBIT_STATE&, PAULI);
void apply_hadamard(QUBIT_STATE&);

/*
 * Applies X if `x_bit` is set and then Z if `z_bit` is set. This is the
 * correction step of teleportation.
 * */
void apply_pauli_correction(QUBIT_STATE&, uint8_t x_bit, uint8_t z_bit);

/*
 * Samples an outcome in the given basis and collapses `q` onto the
 * corresponding basis state.
 * */
uint8_t measure(QUBIT_STATE& q, BASIS, rng_type&);

/*
 * Picks X, Y, or Z uniformly.
 * */
PAULI random_pauli_error(rng_type&);

BASIS random_basis(rng_type&);
uint8_t random_bit(rng_type&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_QUBIT_h

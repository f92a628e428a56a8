/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/qubit.h"

#include <cmath>
#include <iostream>
#include <sstream>

namespace qnet
{

namespace
{

const double INV_SQRT2{1.0 / std::sqrt(2.0)};

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

char
to_char(BASIS b)
{
    return b == BASIS::Z ? 'Z' : 'X';
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

double
QUBIT_STATE::probability_of_zero(BASIS b) const
{
    double norm = std::norm(amp[0]) + std::norm(amp[1]);
    if (norm == 0.0)
        return 0.5;

    if (b == BASIS::Z)
        return std::norm(amp[0]) / norm;

    // rotate into the Hadamard basis: <+|psi> = (a0 + a1)/sqrt2
    amplitude_type plus = (amp[0] + amp[1]) * INV_SQRT2;
    return std::norm(plus) / norm;
}

bool
QUBIT_STATE::equivalent_to(const QUBIT_STATE& other, double tol) const
{
    // |<a|b>| == 1 for normalized states iff they differ by a global phase
    amplitude_type inner = std::conj(amp[0])*other.amp[0] + std::conj(amp[1])*other.amp[1];
    return std::abs(std::abs(inner) - 1.0) < tol;
}

std::string
QUBIT_STATE::to_string() const
{
    std::ostringstream strm;
    strm << "[" << amp[0].real();
    if (amp[0].imag() != 0.0)
        strm << (amp[0].imag() < 0 ? "" : "+") << amp[0].imag() << "i";
    strm << ", " << amp[1].real();
    if (amp[1].imag() != 0.0)
        strm << (amp[1].imag() < 0 ? "" : "+") << amp[1].imag() << "i";
    strm << "]";
    return strm.str();
}

std::ostream&
operator<<(std::ostream& os, const QUBIT_STATE& q)
{
    os << q.to_string();
    return os;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

QUBIT_STATE
prepare_basis_state(uint8_t bit, BASIS b)
{
    QUBIT_STATE q;
    if (b == BASIS::Z)
    {
        q.amp[0] = bit ? 0.0 : 1.0;
        q.amp[1] = bit ? 1.0 : 0.0;
    }
    else
    {
        q.amp[0] = INV_SQRT2;
        q.amp[1] = bit ? -INV_SQRT2 : INV_SQRT2;
    }
    return q;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
apply_pauli(QUBIT_STATE& q, PAULI p)
{
    const QUBIT_STATE::amplitude_type I{0.0, 1.0};
    switch (p)
    {
    case PAULI::I:
        break;
    case PAULI::X:
        std::swap(q.amp[0], q.amp[1]);
        break;
    case PAULI::Y:
        {
            // Y = [[0, -i], [i, 0]]
            auto a0 = q.amp[0];
            q.amp[0] = -I * q.amp[1];
            q.amp[1] = I * a0;
        }
        break;
    case PAULI::Z:
        q.amp[1] = -q.amp[1];
        break;
    }
}

void
apply_hadamard(QUBIT_STATE& q)
{
    auto a0 = q.amp[0],
         a1 = q.amp[1];
    q.amp[0] = (a0 + a1) * INV_SQRT2;
    q.amp[1] = (a0 - a1) * INV_SQRT2;
}

void
apply_pauli_correction(QUBIT_STATE& q, uint8_t x_bit, uint8_t z_bit)
{
    if (x_bit)
        apply_pauli(q, PAULI::X);
    if (z_bit)
        apply_pauli(q, PAULI::Z);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

uint8_t
measure(QUBIT_STATE& q, BASIS b, rng_type& rng)
{
    std::uniform_real_distribution<double> fp_rand{0.0, 1.0};
    double p0 = q.probability_of_zero(b);
    // snap rounding error so basis states measure deterministically
    if (p0 > 1.0 - 1e-12)
        p0 = 1.0;
    else if (p0 < 1e-12)
        p0 = 0.0;
    uint8_t outcome = (fp_rand(rng) < p0) ? 0 : 1;
    q = prepare_basis_state(outcome, b);
    return outcome;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

PAULI
random_pauli_error(rng_type& rng)
{
    std::uniform_int_distribution<int> dist{0, 2};
    switch (dist(rng))
    {
    case 0:
        return PAULI::X;
    case 1:
        return PAULI::Y;
    default:
        return PAULI::Z;
    }
}

BASIS
random_basis(rng_type& rng)
{
    return random_bit(rng) ? BASIS::X : BASIS::Z;
}

uint8_t
random_bit(rng_type& rng)
{
    return static_cast<uint8_t>(rng() & 1);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

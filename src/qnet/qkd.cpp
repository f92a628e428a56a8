/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/qkd.h"
#include "qnet/error.h"

#include <algorithm>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bit_vector_type
sift(const bit_vector_type& bits, const basis_vector_type& a_bases, const basis_vector_type& b_bases)
{
    if (bits.size() != a_bases.size() || bits.size() != b_bases.size())
    {
        throw_configuration_error("sift: length mismatch -- bits = " + std::to_string(bits.size())
                                    + ", alice bases = " + std::to_string(a_bases.size())
                                    + ", bob bases = " + std::to_string(b_bases.size()));
    }

    bit_vector_type out;
    out.reserve(bits.size() / 2);
    for (size_t i = 0; i < bits.size(); i++)
    {
        if (a_bases[i] == b_bases[i])
            out.push_back(bits[i]);
    }
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

double
estimate_qber(const bit_vector_type& alice_key, const bit_vector_type& bob_key, size_t sample_size)
{
    size_t n = std::min({sample_size, alice_key.size(), bob_key.size()});
    if (n == 0)
        return 0.0;

    size_t errors{0};
    for (size_t i = 0; i < n; i++)
        errors += (alice_key[i] != bob_key[i]);
    return mean(errors, n);
}

double
correlation(const bit_vector_type& a, const bit_vector_type& b, size_t sample_size)
{
    size_t n = std::min({sample_size, a.size(), b.size()});
    if (n == 0)
        return 0.0;

    int64_t sum{0};
    for (size_t i = 0; i < n; i++)
        sum += ((a[i] ^ b[i]) & 1) ? -1 : +1;
    return mean(sum, n);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

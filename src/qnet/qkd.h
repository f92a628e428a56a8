/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_QKD_h
#define QNET_QKD_h

#include "qnet/qubit.h"

#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

using bit_vector_type = std::vector<uint8_t>;
using basis_vector_type = std::vector<BASIS>;

/*
 * Keeps `bits[i]` wherever `a_bases[i] == b_bases[i]`. The three vectors
 * must have the same length.
 * */
bit_vector_type sift(const bit_vector_type& bits, const basis_vector_type& a_bases, const basis_vector_type& b_bases);

/*
 * Fraction of mismatches over the first `sample_size` positions (or the
 * shorter key, if smaller). Returns 0 for an empty sample.
 * */
double estimate_qber(const bit_vector_type& alice_key, const bit_vector_type& bob_key, size_t sample_size);

/*
 * sum((-1)^(a_i + b_i)) / N over the first `sample_size` positions. Returns
 * 0 for an empty sample.
 * */
double correlation(const bit_vector_type& a, const bit_vector_type& b, size_t sample_size);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_QKD_h

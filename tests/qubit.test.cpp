/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "test_common.h"

#include <cmath>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_basis_states_measure_deterministically()
{
    rng_type rng{1};
    for (int i = 0; i < 100; i++)
    {
        for (uint8_t bit : {0, 1})
        {
            for (BASIS b : {BASIS::Z, BASIS::X})
            {
                QUBIT_STATE q = prepare_basis_state(bit, b);
                CHECK(measure(q, b, rng) == bit, "basis state measured in its own basis");
                CHECK(q.equivalent_to(prepare_basis_state(bit, b)), "measurement leaves the basis state");
            }
        }
    }
    printf("PASS: basis states measure deterministically\n");
}

void
test_paulis()
{
    QUBIT_STATE q = prepare_basis_state(0, BASIS::Z);
    apply_pauli(q, PAULI::X);
    CHECK(q.equivalent_to(prepare_basis_state(1, BASIS::Z)), "X|0> = |1>");

    q = prepare_basis_state(0, BASIS::X);
    apply_pauli(q, PAULI::Z);
    CHECK(q.equivalent_to(prepare_basis_state(1, BASIS::X)), "Z|+> = |->");

    q = prepare_basis_state(0, BASIS::Z);
    apply_pauli(q, PAULI::Y);
    CHECK(q.equivalent_to(prepare_basis_state(1, BASIS::Z)), "Y|0> ~ |1>");

    q = prepare_basis_state(0, BASIS::Z);
    apply_hadamard(q);
    CHECK(q.equivalent_to(prepare_basis_state(0, BASIS::X)), "H|0> = |+>");
    apply_hadamard(q);
    CHECK(q.equivalent_to(prepare_basis_state(0, BASIS::Z)), "HH = I");

    printf("PASS: pauli and hadamard\n");
}

void
test_correction_undoes_teleport_frame()
{
    QUBIT_STATE psi;
    psi.amp = {0.6, 0.8};
    for (uint8_t x : {0, 1})
    {
        for (uint8_t z : {0, 1})
        {
            QUBIT_STATE q = psi;
            if (z)
                apply_pauli(q, PAULI::Z);
            if (x)
                apply_pauli(q, PAULI::X);
            apply_pauli_correction(q, x, z);
            CHECK(q.equivalent_to(psi), "X^x then Z^z undoes X^x Z^z");
        }
    }
    printf("PASS: correction undoes teleport frame\n");
}

void
test_superposition_statistics()
{
    rng_type rng{7};
    const int trials = 4000;
    int ones{0};
    for (int i = 0; i < trials; i++)
    {
        QUBIT_STATE q = prepare_basis_state(0, BASIS::X);
        ones += measure(q, BASIS::Z, rng);
    }
    double frac = mean(ones, trials);
    CHECK(std::abs(frac - 0.5) < 0.05, "|+> in Z is a fair coin");

    QUBIT_STATE q;
    q.amp = {0.6, 0.8};
    CHECK(std::abs(q.probability_of_zero(BASIS::Z) - 0.36) < 1e-12, "p0 in Z");
    CHECK(std::abs(q.probability_of_zero(BASIS::X) - 0.98) < 1e-12, "p0 in X");
    printf("PASS: superposition statistics\n");
}

void
test_link_noise()
{
    rng_type rng{3};
    for (int i = 0; i < 200; i++)
    {
        QUBIT_STATE q = prepare_basis_state(1, BASIS::X);
        CHECK(!apply_link_noise(q, 0.0, rng), "no noise at loss 0");
        CHECK(q.equivalent_to(prepare_basis_state(1, BASIS::X)), "state unchanged at loss 0");
        CHECK(sample_link_noise(0.0, rng) == PAULI::I, "no sampled error at loss 0");
        CHECK(apply_link_noise(q, 1.0, rng), "always noisy at loss 1");
        CHECK(sample_link_noise(1.0, rng) != PAULI::I, "always a sampled error at loss 1");
    }
    printf("PASS: link noise\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    printf("=== Qubit Test ===\n");
    test_basis_states_measure_deterministically();
    test_paulis();
    test_correction_undoes_teleport_frame();
    test_superposition_statistics();
    test_link_noise();
    return 0;
}

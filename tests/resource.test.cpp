/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "test_common.h"

#include <cmath>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_allocation()
{
    RESOURCE_MODEL rm;
    auto regs = rm.initialize("a", 3, 0);
    CHECK(regs.size() == 3, "three register qubits");
    CHECK(rm.qubit(regs[2]).name == "a_q2", "register naming");
    CHECK(rm.find_qubit("a_q1") == regs[1], "lookup by name");
    CHECK(rm.qubit(regs[0]).is_active(), "new qubits are active");

    CHECK(throws_kind(ERROR_KIND::RESOURCE_ERROR, [&] { rm.allocate("a", "a_q0", QUBIT_STATE{}, 1.0, 0); }),
            "duplicate name is a resource error");
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, [&] { rm.allocate("a", "x", QUBIT_STATE{}, 1.5, 0); }),
            "fidelity above one is rejected");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { rm.find_qubit("nope"); }), "unknown qubit");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { rm.find_pair("nope"); }), "unknown pair");

    rng_type rng{0};
    rm.measure(regs[0], BASIS::Z, rng);
    CHECK(throws_kind(ERROR_KIND::STATE_ERROR, [&] { rm.measure(regs[0], BASIS::Z, rng); }),
            "measuring twice is a state error");
    printf("PASS: allocation\n");
}

void
test_bell_pair_correlations()
{
    RESOURCE_MODEL rm;
    rng_type rng{11};
    int x_flipped_z_agree{0};
    for (int i = 0; i < 200; i++)
    {
        pair_handle_type p = rm.create_entangled_pair("a", "b", 0.95, 0);
        const ENTANGLED_PAIR& ep = rm.pair(p);
        CHECK(rm.is_intact(p), "new pair is intact");
        CHECK(rm.partner_of(ep.first) == ep.second, "partners");
        CHECK(rm.qubit(ep.first).entangled_with.count(ep.second), "entangled_with is symmetric");

        BASIS b = (i % 2) ? BASIS::X : BASIS::Z;
        uint8_t m1 = rm.measure(ep.first, b, rng),
                m2 = rm.measure(ep.second, b, rng);
        CHECK(m1 == m2, "Phi+ outcomes agree in a shared basis");
        CHECK(!rm.is_intact(p), "measured pair is no longer intact");
    }

    // X on one half anticorrelates Z outcomes but not X outcomes
    for (int i = 0; i < 200; i++)
    {
        pair_handle_type p = rm.create_entangled_pair("a", "b", 0.95, 0);
        const ENTANGLED_PAIR& ep = rm.pair(p);
        rm.apply_pauli(ep.second, PAULI::X);
        BASIS b = (i % 2) ? BASIS::X : BASIS::Z;
        uint8_t m1 = rm.measure(ep.first, b, rng),
                m2 = rm.measure(ep.second, b, rng);
        if (b == BASIS::Z)
            CHECK(m1 != m2, "X error flips Z correlation");
        else
            x_flipped_z_agree += (m1 == m2);
    }
    CHECK(x_flipped_z_agree == 100, "X error leaves X correlation");

    // Z on one half anticorrelates X outcomes
    for (int i = 0; i < 100; i++)
    {
        pair_handle_type p = rm.create_entangled_pair("a", "b", 0.95, 0);
        const ENTANGLED_PAIR& ep = rm.pair(p);
        rm.apply_pauli(ep.first, PAULI::Z);
        uint8_t m1 = rm.measure(ep.first, BASIS::X, rng),
                m2 = rm.measure(ep.second, BASIS::X, rng);
        CHECK(m1 != m2, "Z error flips X correlation");
    }
    printf("PASS: bell pair correlations\n");
}

void
test_ghz_correlations()
{
    RESOURCE_MODEL rm;
    rng_type rng{5};
    for (int i = 0; i < 100; i++)
    {
        auto members = rm.create_ghz({"a", "b", "c"}, 0.9, 0);
        CHECK(members.size() == 3, "one qubit per node");
        uint8_t m0 = rm.measure(members[0], BASIS::Z, rng);
        CHECK(rm.measure(members[1], BASIS::Z, rng) == m0, "GHZ Z outcomes agree");
        CHECK(rm.measure(members[2], BASIS::Z, rng) == m0, "GHZ Z outcomes agree");
    }

    // the parity of all X outcomes of a GHZ state is even
    for (int i = 0; i < 100; i++)
    {
        auto members = rm.create_ghz({"a", "b", "c"}, 0.9, 0);
        uint8_t parity{0};
        for (auto q : members)
            parity ^= rm.measure(q, BASIS::X, rng);
        CHECK(parity == 0, "GHZ X parity is even");
    }

    auto single = rm.create_ghz({"a"}, 0.9, 0);
    CHECK(rm.qubit(single[0]).joint == NO_HANDLE, "single-node GHZ is a plain qubit");
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, [&] { rm.create_ghz({}, 0.9, 0); }), "empty GHZ");
    printf("PASS: ghz correlations\n");
}

void
test_teleport_delivers_state()
{
    RESOURCE_MODEL rm;
    rng_type rng{17};
    QUBIT_STATE psi;
    psi.amp = {0.6, 0.8};
    for (int i = 0; i < 50; i++)
    {
        qubit_handle_type src = rm.allocate("a", "src_" + std::to_string(i), psi, 1.0, 0);
        pair_handle_type p = rm.create_entangled_pair("a", "b", 0.95, 0);
        qubit_handle_type near = rm.pair(p).first;

        auto tr = rm.teleport(src, near, rng);
        CHECK(tr.far_half == rm.pair(p).second, "far half is the other end");
        CHECK(rm.pair(p).consumed, "teleport consumes the pair");
        CHECK(!rm.qubit(src).is_active(), "source is measured");

        QUBIT_STATE out = tr.uncorrected_state;
        apply_pauli_correction(out, tr.outcome.x_bit, tr.outcome.z_bit);
        CHECK(out.equivalent_to(psi), "corrected state equals the input");
    }
    printf("PASS: teleport delivers state\n");
}

void
test_swap()
{
    RESOURCE_MODEL rm;
    rng_type rng{23};
    for (int i = 0; i < 100; i++)
    {
        pair_handle_type p1 = rm.create_entangled_pair("a", "b", 0.9, 0),
                         p2 = rm.create_entangled_pair("b", "c", 0.8, 0);
        bool correct = (i % 2 == 0);
        auto sr = rm.swap(rm.pair(p1).second, rm.pair(p2).first, correct, rng);

        const ENTANGLED_PAIR& np = rm.pair(sr.pair);
        CHECK(std::abs(np.fidelity - 0.72) < 1e-12, "swap fidelity is the product");
        CHECK(rm.qubit(np.first).owner == "a" && rm.qubit(np.second).owner == "c", "outer ends");
        CHECK(rm.is_intact(sr.pair), "new pair is intact");
        CHECK(rm.pair(p1).consumed && rm.pair(p2).consumed, "input pairs consumed");

        BASIS b = (i % 4 < 2) ? BASIS::Z : BASIS::X;
        uint8_t m1 = rm.measure(np.first, b, rng),
                m2 = rm.measure(np.second, b, rng);
        uint8_t expected_diff{0};
        if (!correct)
            expected_diff = (b == BASIS::Z) ? sr.outcome.x_bit : sr.outcome.z_bit;
        CHECK((m1 ^ m2) == expected_diff, "swapped pair correlations follow the Pauli frame");
    }

    pair_handle_type p1 = rm.create_entangled_pair("a", "b", 0.9, 0),
                     p2 = rm.create_entangled_pair("c", "d", 0.9, 0);
    CHECK(throws_kind(ERROR_KIND::STATE_ERROR, [&] { rm.swap(rm.pair(p1).second, rm.pair(p2).first, true, rng); }),
            "swap needs colocated qubits");
    CHECK(throws_kind(ERROR_KIND::STATE_ERROR, [&] { rm.swap(rm.pair(p1).first, rm.pair(p1).second, true, rng); }),
            "swap of one pair's halves");
    printf("PASS: swap\n");
}

void
test_bell_measure_reads_frame()
{
    RESOURCE_MODEL rm;
    for (int code = 0; code < 4; code++)
    {
        uint8_t z = code / 2,
                x = code % 2;
        pair_handle_type p = rm.create_entangled_pair("a", "b", 0.95, 0);
        qubit_handle_type h1 = rm.pair(p).first,
                          h2 = rm.pair(p).second;
        if (z)
            rm.apply_pauli(h1, PAULI::Z);
        if (x)
            rm.apply_pauli(h1, PAULI::X);

        BELL_OUTCOME out = rm.bell_measure(h2, h1);
        CHECK(out.z_bit == z && out.x_bit == x, "outcome is the encoded frame");
        CHECK(rm.pair(p).consumed, "pair consumed");
        CHECK(rm.qubit(h1).status == QUBIT_STATUS::MEASURED && rm.qubit(h2).status == QUBIT_STATUS::MEASURED,
                "both halves measured");
    }

    pair_handle_type y = rm.create_entangled_pair("a", "b", 0.95, 0);
    rm.apply_pauli(rm.pair(y).first, PAULI::Y);
    BELL_OUTCOME out = rm.bell_measure(rm.pair(y).first, rm.pair(y).second);
    CHECK(out.x_bit == 1 && out.z_bit == 1, "Y sets both bits");

    pair_handle_type p1 = rm.create_entangled_pair("a", "b", 0.9, 0),
                     p2 = rm.create_entangled_pair("a", "b", 0.9, 0);
    CHECK(throws_kind(ERROR_KIND::STATE_ERROR, [&] { rm.bell_measure(rm.pair(p1).first, rm.pair(p2).second); }),
            "halves of different pairs");
    CHECK(throws_kind(ERROR_KIND::STATE_ERROR, [&] { rm.bell_measure(rm.pair(y).first, rm.pair(y).second); }),
            "already measured");
    CHECK(rm.is_intact(p1) && rm.is_intact(p2), "rejected measurement leaves pairs intact");
    printf("PASS: bell measure reads frame\n");
}

void
test_release_and_consume()
{
    RESOURCE_MODEL rm;
    rng_type rng{29};
    pair_handle_type p = rm.create_entangled_pair("a", "b", 0.9, 0);
    qubit_handle_type second = rm.pair(p).second;
    rm.release(rm.pair(p).first, rng);
    CHECK(!rm.is_intact(p), "releasing a half breaks the pair");
    CHECK(rm.qubit(second).is_active(), "partner stays active");
    CHECK(rm.qubit(second).joint == NO_HANDLE, "partner is no longer entangled");

    pair_handle_type q = rm.create_entangled_pair("a", "b", 0.9, 0);
    rm.consume_pair(q, rng);
    CHECK(rm.pair(q).consumed, "consumed flag");
    CHECK(rm.qubit(rm.pair(q).first).status == QUBIT_STATUS::RELEASED, "halves released");
    CHECK(rm.intact_pairs().empty(), "no intact pairs left");

    pair_handle_type r = rm.create_entangled_pair("a", "b", 0.9, 0);
    rm.set_pair_fidelity(r, 1.7);
    CHECK(rm.pair(r).fidelity == 1.0, "pair fidelity is clamped");
    printf("PASS: release and consume\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    printf("=== Resource Test ===\n");
    test_allocation();
    test_bell_pair_correlations();
    test_ghz_correlations();
    test_teleport_delivers_state();
    test_swap();
    test_bell_measure_reads_frame();
    test_release_and_consume();
    return 0;
}

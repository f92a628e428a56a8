/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/resource.h"
#include "qnet/error.h"

#include <algorithm>

namespace qnet
{

namespace
{

std::string
handle_str(int64_t h)
{
    return std::to_string(h);
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

qubit_handle_type
RESOURCE_MODEL::allocate(const node_id_type& owner,
                         std::string name,
                         QUBIT_STATE state,
                         double fidelity,
                         time_ns_type now,
                         bool transient)
{
    if (fidelity < 0.0 || fidelity > 1.0)
        throw_configuration_error("RESOURCE_MODEL::allocate: fidelity out of range -- " + std::to_string(fidelity));
    if (qubit_by_name_.count(name))
        throw_resource_error("RESOURCE_MODEL::allocate: qubit name already in use -- " + name);

    qubit_handle_type h = static_cast<qubit_handle_type>(qubits_.size());
    qubits_.push_back(NETWORK_QUBIT{
                        .handle=h,
                        .name=name,
                        .owner=owner,
                        .state=state,
                        .fidelity=fidelity,
                        .created_ns=now,
                        .transient=transient
                    });
    qubit_by_name_[name] = h;
    return h;
}

std::vector<qubit_handle_type>
RESOURCE_MODEL::initialize(const node_id_type& node, size_t count, time_ns_type now)
{
    std::vector<qubit_handle_type> out;
    out.reserve(count);
    for (size_t i = 0; i < count; i++)
        out.push_back(allocate(node, node + "_q" + std::to_string(i), QUBIT_STATE{}, 1.0, now));
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

const NETWORK_QUBIT&
RESOURCE_MODEL::qubit(qubit_handle_type h) const
{
    if (h < 0 || static_cast<size_t>(h) >= qubits_.size())
        throw_reference_error("RESOURCE_MODEL::qubit: unknown qubit handle -- " + handle_str(h));
    return qubits_[h];
}

const ENTANGLED_PAIR&
RESOURCE_MODEL::pair(pair_handle_type h) const
{
    if (h < 0 || static_cast<size_t>(h) >= pairs_.size())
        throw_reference_error("RESOURCE_MODEL::pair: unknown pair handle -- " + handle_str(h));
    return pairs_[h];
}

qubit_handle_type
RESOURCE_MODEL::find_qubit(const std::string& name) const
{
    auto it = qubit_by_name_.find(name);
    if (it == qubit_by_name_.end())
        throw_reference_error("RESOURCE_MODEL::find_qubit: unknown qubit -- " + name);
    return it->second;
}

pair_handle_type
RESOURCE_MODEL::find_pair(const std::string& name) const
{
    auto it = pair_by_name_.find(name);
    if (it == pair_by_name_.end())
        throw_reference_error("RESOURCE_MODEL::find_pair: unknown pair -- " + name);
    return it->second;
}

pair_handle_type
RESOURCE_MODEL::pair_of(qubit_handle_type q) const
{
    auto it = pair_of_qubit_.find(q);
    return it == pair_of_qubit_.end() ? NO_HANDLE : it->second;
}

bool
RESOURCE_MODEL::is_intact(pair_handle_type h) const
{
    const ENTANGLED_PAIR& p = pair(h);
    if (p.consumed)
        return false;
    const NETWORK_QUBIT& a = qubits_[p.first];
    const NETWORK_QUBIT& b = qubits_[p.second];
    return a.is_active() && b.is_active() && a.joint != NO_HANDLE && a.joint == b.joint;
}

qubit_handle_type
RESOURCE_MODEL::partner_of(qubit_handle_type q) const
{
    const NETWORK_QUBIT& x = qubit(q);
    if (!x.is_active())
        throw_state_error("RESOURCE_MODEL::partner_of: qubit is not active -- " + x.name);
    if (x.joint == NO_HANDLE || joints_[x.joint].members.size() != 2)
        throw_state_error("RESOURCE_MODEL::partner_of: qubit is not half of a pair -- " + x.name);

    const JOINT_STATE& j = joints_[x.joint];
    return j.members[0] == q ? j.members[1] : j.members[0];
}

std::vector<pair_handle_type>
RESOURCE_MODEL::intact_pairs() const
{
    std::vector<pair_handle_type> out;
    for (const auto& p : pairs_)
    {
        if (is_intact(p.handle))
            out.push_back(p.handle);
    }
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
RESOURCE_MODEL::apply_basis_preparation(qubit_handle_type h, uint8_t bit, BASIS b)
{
    NETWORK_QUBIT& q = get_active(h, "apply_basis_preparation");
    if (q.joint != NO_HANDLE)
        throw_state_error("RESOURCE_MODEL::apply_basis_preparation: qubit is entangled -- " + q.name);
    q.state = prepare_basis_state(bit, b);
}

void
RESOURCE_MODEL::apply_pauli(qubit_handle_type h, PAULI p)
{
    NETWORK_QUBIT& q = get_active(h, "apply_pauli");
    if (q.joint == NO_HANDLE)
    {
        qnet::apply_pauli(q.state, p);
        return;
    }

    JOINT_STATE& j = joints_[q.joint];
    if (p == PAULI::X || p == PAULI::Y)
        j.flip[h] ^= 1;
    if (p == PAULI::Z || p == PAULI::Y)
        j.sign = -j.sign;
}

void
RESOURCE_MODEL::apply_pauli_correction(qubit_handle_type h, const std::array<uint8_t, 2>& bits)
{
    if (bits[0])
        apply_pauli(h, PAULI::X);
    if (bits[1])
        apply_pauli(h, PAULI::Z);
}

void
RESOURCE_MODEL::set_fidelity(qubit_handle_type h, double f)
{
    get(h).fidelity = std::clamp(f, 0.0, 1.0);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

uint8_t
RESOURCE_MODEL::measure(qubit_handle_type h, BASIS b, rng_type& rng)
{
    NETWORK_QUBIT& q = get_active(h, "measure");

    uint8_t outcome;
    if (q.joint == NO_HANDLE)
    {
        outcome = qnet::measure(q.state, b, rng);
    }
    else
    {
        JOINT_STATE& j = joints_[q.joint];
        if (b == BASIS::Z)
        {
            // every branch of the superposition is a product of Z eigenstates,
            // so all members collapse together
            uint8_t branch = random_bit(rng);
            outcome = branch ^ j.flip[h];
            for (qubit_handle_type r : j.members)
                qubits_[r].state = prepare_basis_state(branch ^ j.flip[r], BASIS::Z);
            dissolve(j);
        }
        else
        {
            outcome = random_bit(rng);
            if (outcome)
                j.sign = -j.sign;
            drop_member(j, h);
            q.state = prepare_basis_state(outcome, BASIS::X);
        }
    }

    q.status = QUBIT_STATUS::MEASURED;
    return outcome;
}

void
RESOURCE_MODEL::release(qubit_handle_type h, rng_type& rng)
{
    NETWORK_QUBIT& q = get(h);
    if (!q.is_active())
        return;
    if (q.joint != NO_HANDLE)
        measure(h, BASIS::Z, rng);
    qubits_[h].status = QUBIT_STATUS::RELEASED;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

pair_handle_type
RESOURCE_MODEL::create_entangled_pair(const node_id_type& a,
                                      const node_id_type& b,
                                      double fidelity,
                                      time_ns_type now,
                                      bool transient)
{
    std::string name = "pair_" + a + "_" + b + "_" + std::to_string(pair_counter_++);
    qubit_handle_type q1 = allocate(a, name + "_1", QUBIT_STATE{}, fidelity, now, transient),
                      q2 = allocate(b, name + "_2", QUBIT_STATE{}, fidelity, now, transient);
    new_joint({q1, q2});

    pair_handle_type p = new_pair(q1, q2, fidelity, now);
    pairs_[p].name = name;
    pair_by_name_[name] = p;
    return p;
}

std::vector<qubit_handle_type>
RESOURCE_MODEL::create_ghz(const std::vector<node_id_type>& nodes,
                           double fidelity,
                           time_ns_type now,
                           bool transient)
{
    if (nodes.empty())
        throw_configuration_error("RESOURCE_MODEL::create_ghz: no nodes given");

    std::string prefix = "ghz_" + std::to_string(ghz_counter_++);
    std::vector<qubit_handle_type> members;
    members.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); i++)
    {
        members.push_back(allocate(nodes[i], prefix + "_" + nodes[i] + "_" + std::to_string(i),
                                    QUBIT_STATE{}, fidelity, now, transient));
    }

    if (members.size() == 1)
        qubits_[members[0]].state = prepare_basis_state(0, BASIS::X);
    else
        new_joint(members);
    return members;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
RESOURCE_MODEL::consume_pair(pair_handle_type h, rng_type& rng)
{
    pair(h);  // validates handle
    ENTANGLED_PAIR& p = pairs_[h];
    release(p.first, rng);
    release(p.second, rng);
    p.consumed = true;
}

void
RESOURCE_MODEL::set_pair_fidelity(pair_handle_type h, double f)
{
    pair(h);
    ENTANGLED_PAIR& p = pairs_[h];
    p.fidelity = std::clamp(f, 0.0, 1.0);
    qubits_[p.first].fidelity = p.fidelity;
    qubits_[p.second].fidelity = p.fidelity;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

RESOURCE_MODEL::teleport_result_type
RESOURCE_MODEL::teleport(qubit_handle_type source, qubit_handle_type near_half, rng_type& rng)
{
    NETWORK_QUBIT& src = get_active(source, "teleport");
    if (src.joint != NO_HANDLE)
        throw_state_error("RESOURCE_MODEL::teleport: source qubit is entangled -- " + src.name);

    qubit_handle_type far = partner_of(near_half);
    JOINT_STATE& j = joints_[qubits_[near_half].joint];

    // frame of the pair expressed on the far half
    BELL_OUTCOME frame = frame_of(j);

    // ideal Bell-state measurement outcomes are uniform regardless of the input
    BELL_OUTCOME out{random_bit(rng), random_bit(rng)};

    // far half holds P * X^x * Z^z |psi>, P being the pair's frame
    QUBIT_STATE st = src.state;
    if (out.z_bit)
        qnet::apply_pauli(st, PAULI::Z);
    if (out.x_bit)
        qnet::apply_pauli(st, PAULI::X);
    if (frame.z_bit)
        qnet::apply_pauli(st, PAULI::Z);
    if (frame.x_bit)
        qnet::apply_pauli(st, PAULI::X);

    dissolve(j);

    src.status = QUBIT_STATUS::MEASURED;
    src.state = prepare_basis_state(out.z_bit, BASIS::X);
    qubits_[near_half].status = QUBIT_STATUS::MEASURED;
    qubits_[near_half].state = prepare_basis_state(out.x_bit, BASIS::Z);
    qubits_[far].status = QUBIT_STATUS::RELEASED;

    pair_handle_type p = pair_of(near_half);
    if (p != NO_HANDLE)
        pairs_[p].consumed = true;

    return teleport_result_type{out, st, far};
}

RESOURCE_MODEL::swap_result_type
RESOURCE_MODEL::swap(qubit_handle_type a, qubit_handle_type b, bool apply_correction, rng_type& rng)
{
    NETWORK_QUBIT& qa = get_active(a, "swap");
    NETWORK_QUBIT& qb = get_active(b, "swap");
    if (qa.owner != qb.owner)
    {
        throw_state_error("RESOURCE_MODEL::swap: qubits are hosted at different nodes -- "
                            + qa.name + " @ " + qa.owner + ", " + qb.name + " @ " + qb.owner);
    }
    if (qa.joint != NO_HANDLE && qa.joint == qb.joint)
        throw_state_error("RESOURCE_MODEL::swap: qubits belong to the same pair -- " + qa.name + ", " + qb.name);

    qubit_handle_type outer_a = partner_of(a),
                      outer_b = partner_of(b);
    pair_handle_type pa = pair_of(a),
                     pb = pair_of(b);
    double fa = pa != NO_HANDLE ? pairs_[pa].fidelity : qa.fidelity,
           fb = pb != NO_HANDLE ? pairs_[pb].fidelity : qb.fidelity;

    JOINT_STATE& ja = joints_[qa.joint];
    JOINT_STATE& jb = joints_[qb.joint];
    BELL_OUTCOME frame_a = frame_of(ja),
                 frame_b = frame_of(jb);
    BELL_OUTCOME out{random_bit(rng), random_bit(rng)};

    uint8_t x = frame_a.x_bit ^ frame_b.x_bit,
            z = frame_a.z_bit ^ frame_b.z_bit;
    if (!apply_correction)
    {
        x ^= out.x_bit;
        z ^= out.z_bit;
    }

    dissolve(ja);
    dissolve(jb);
    qubits_[a].status = QUBIT_STATUS::MEASURED;
    qubits_[b].status = QUBIT_STATUS::MEASURED;
    if (pa != NO_HANDLE)
        pairs_[pa].consumed = true;
    if (pb != NO_HANDLE)
        pairs_[pb].consumed = true;

    joint_handle_type jh = new_joint({outer_a, outer_b});
    joints_[jh].flip[outer_b] = x;
    joints_[jh].sign = z ? -1 : +1;

    time_ns_type now = std::max(qubits_[outer_a].created_ns, qubits_[outer_b].created_ns);
    pair_handle_type p = new_pair(outer_a, outer_b, fa*fb, now);
    const node_id_type& na = qubits_[outer_a].owner;
    const node_id_type& nb = qubits_[outer_b].owner;
    std::string name = "pair_" + na + "_" + nb + "_" + std::to_string(pair_counter_++);
    pairs_[p].name = name;
    pair_by_name_[name] = p;

    return swap_result_type{p, out};
}

BELL_OUTCOME
RESOURCE_MODEL::bell_measure(qubit_handle_type a, qubit_handle_type b)
{
    NETWORK_QUBIT& qa = get_active(a, "bell_measure");
    NETWORK_QUBIT& qb = get_active(b, "bell_measure");
    if (a == b || qa.joint == NO_HANDLE || qa.joint != qb.joint || joints_[qa.joint].members.size() != 2)
        throw_state_error("RESOURCE_MODEL::bell_measure: qubits are not the halves of one pair -- " + qa.name + ", " + qb.name);

    JOINT_STATE& j = joints_[qa.joint];
    BELL_OUTCOME out = frame_of(j);
    dissolve(j);

    qa.status = QUBIT_STATUS::MEASURED;
    qa.state = prepare_basis_state(out.z_bit, BASIS::X);
    qb.status = QUBIT_STATUS::MEASURED;
    qb.state = prepare_basis_state(out.x_bit, BASIS::Z);

    pair_handle_type p = pair_of(a);
    if (p != NO_HANDLE)
        pairs_[p].consumed = true;
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NETWORK_QUBIT&
RESOURCE_MODEL::get(qubit_handle_type h)
{
    if (h < 0 || static_cast<size_t>(h) >= qubits_.size())
        throw_reference_error("RESOURCE_MODEL: unknown qubit handle -- " + handle_str(h));
    return qubits_[h];
}

NETWORK_QUBIT&
RESOURCE_MODEL::get_active(qubit_handle_type h, const char* caller)
{
    NETWORK_QUBIT& q = get(h);
    if (!q.is_active())
        throw_state_error("RESOURCE_MODEL::" + std::string(caller) + ": qubit already consumed -- " + q.name);
    return q;
}

joint_handle_type
RESOURCE_MODEL::new_joint(const std::vector<qubit_handle_type>& members)
{
    joint_handle_type jh = static_cast<joint_handle_type>(joints_.size());
    JOINT_STATE j{.handle=jh, .members=members};
    for (qubit_handle_type q : members)
    {
        j.flip[q] = 0;
        qubits_[q].joint = jh;
        qubits_[q].entangled_with.clear();
        for (qubit_handle_type r : members)
        {
            if (r != q)
                qubits_[q].entangled_with.insert(r);
        }
    }
    joints_.push_back(std::move(j));
    return jh;
}

pair_handle_type
RESOURCE_MODEL::new_pair(qubit_handle_type q1, qubit_handle_type q2, double fidelity, time_ns_type now)
{
    pair_handle_type p = static_cast<pair_handle_type>(pairs_.size());
    pairs_.push_back(ENTANGLED_PAIR{
                        .handle=p,
                        .first=q1,
                        .second=q2,
                        .fidelity=fidelity,
                        .created_ns=now
                    });
    pair_of_qubit_[q1] = p;
    pair_of_qubit_[q2] = p;
    qubits_[q1].fidelity = fidelity;
    qubits_[q2].fidelity = fidelity;
    return p;
}

BELL_OUTCOME
RESOURCE_MODEL::frame_of(const JOINT_STATE& j) const
{
    // (|m0 m1> + s|~m0 ~m1>)/sqrt2 equals X^(m0^m1) Z^(s<0) on the second member of |Phi+>, up to phase
    uint8_t d = j.flip.at(j.members[0]) ^ j.flip.at(j.members[1]);
    return BELL_OUTCOME{d, static_cast<uint8_t>(j.sign < 0 ? 1 : 0)};
}

void
RESOURCE_MODEL::dissolve(JOINT_STATE& j)
{
    for (qubit_handle_type q : j.members)
    {
        qubits_[q].joint = NO_HANDLE;
        qubits_[q].entangled_with.clear();
    }
    j.members.clear();
    j.dissolved = true;
}

void
RESOURCE_MODEL::drop_member(JOINT_STATE& j, qubit_handle_type q)
{
    j.members.erase(std::remove(j.members.begin(), j.members.end(), q), j.members.end());
    qubits_[q].joint = NO_HANDLE;
    qubits_[q].entangled_with.clear();
    for (qubit_handle_type r : j.members)
        qubits_[r].entangled_with.erase(q);

    if (j.members.size() == 1)
    {
        // (|m> + s|~m>)/sqrt2 on one qubit is |+> or |-> for either mask bit
        qubit_handle_type last = j.members[0];
        qubits_[last].state = prepare_basis_state(j.sign < 0 ? 1 : 0, BASIS::X);
        dissolve(j);
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

/*
 *  author: qnet developers
 *  date:   18 October 2026
 *
 *  This file contains the entanglement distribution and purification
 *  handlers of `ENGINE`.
 * */

#include "qnet/engine.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace qnet
{

namespace
{

void
check_distinct_nodes(const std::vector<node_id_type>& nodes)
{
    std::set<node_id_type> seen;
    for (const auto& n : nodes)
    {
        if (!seen.insert(n).second)
            throw_configuration_error("ENTANGLE: node listed twice -- " + n);
    }
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const ENTANGLE_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = ENTANGLE_RECORD{.kind=req.kind, .nodes=req.nodes, .purified=req.purify};
    ENTANGLE_RECORD& rec = std::get<ENTANGLE_RECORD>(ex.result.record);

    if (req.fidelity_threshold < 0.0 || req.fidelity_threshold > 1.0)
        throw_configuration_error("ENTANGLE: fidelity threshold must be in [0, 1] -- " + std::to_string(req.fidelity_threshold));
    check_distinct_nodes(req.nodes);

    if (req.kind == ENTANGLEMENT_KIND::CLUSTER)
        throw_configuration_error("ENTANGLE: cluster states are not supported");

    if (req.kind == ENTANGLEMENT_KIND::GHZ)
    {
        if (req.nodes.empty())
            throw_configuration_error("ENTANGLE: a GHZ state needs at least one node");

        std::lock_guard<std::mutex> lg(resource_mtx_);
        for (const auto& n : req.nodes)
        {
            if (network_.node(n).free_slots() == 0)
                throw_resource_error("ENTANGLE: node " + n + " is at capacity");
        }

        auto members = resources_.create_ghz(req.nodes, config.pair_fidelity, now());
        for (qubit_handle_type h : members)
        {
            const NETWORK_QUBIT& q = resources_.qubit(h);
            network_.node(q.owner).host(q.name, h);
            rec.qubits.push_back(q.name);
        }
        rec.min_fidelity = config.pair_fidelity;
        rec.meets_threshold = rec.min_fidelity >= req.fidelity_threshold;
        return;
    }

    if (req.nodes.size() < 2)
        throw_configuration_error("ENTANGLE: Bell distribution needs at least two nodes");

    // resolve every route before creating anything
    std::vector<ROUTE> routes;
    for (size_t i = 0; i+1 < req.nodes.size(); i++)
        routes.push_back(route(req.nodes[i], req.nodes[i+1]));

    if (req.purify && config.purify_rounds > MAX_PURIFY_ROUNDS)
    {
        throw_configuration_error("ENTANGLE: purify_rounds " + std::to_string(config.purify_rounds)
                                    + " exceeds the maximum of " + std::to_string(MAX_PURIFY_ROUNDS));
    }
    const size_t group_size = req.purify ? (size_t{1} << config.purify_rounds) : 1;

    std::lock_guard<std::mutex> lg(resource_mtx_);

    // an endpoint shared by two segments needs slots for both
    std::map<node_id_type, size_t> demand;
    for (size_t i = 0; i+1 < req.nodes.size(); i++)
    {
        demand[req.nodes[i]] += group_size;
        demand[req.nodes[i+1]] += group_size;
    }
    for (const auto& [n, k] : demand)
    {
        if (network_.node(n).free_slots() < k)
        {
            throw_resource_error("ENTANGLE: node " + n + " needs " + std::to_string(k) + " free slots, has "
                                    + std::to_string(network_.node(n).free_slots()));
        }
    }

    rec.min_fidelity = 1.0;
    for (size_t i = 0; i+1 < req.nodes.size(); i++)
    {
        const ROUTE& r = routes[i];
        double f = std::pow(config.pair_fidelity, static_cast<double>(r.hops()));

        std::vector<pair_handle_type> group;
        for (size_t j = 0; j < group_size; j++)
        {
            pair_handle_type p = create_hosted_pair(req.nodes[i], req.nodes[i+1], f);
            apply_route_noise(resources_.pair(p).second, r.path, ex.rng);
            group.push_back(p);
        }

        if (req.purify)
        {
            PURIFY_RECORD pr = purify_pairs(group, req.fidelity_threshold, config.purify_rounds, ex.rng);
            rec.pairs.insert(rec.pairs.end(), pr.surviving_pairs.begin(), pr.surviving_pairs.end());
            rec.min_fidelity = std::min(rec.min_fidelity, pr.final_fidelity);
        }
        else
        {
            rec.pairs.push_back(resources_.pair(group[0]).name);
            rec.min_fidelity = std::min(rec.min_fidelity, f);
        }
    }
    rec.meets_threshold = rec.min_fidelity >= req.fidelity_threshold;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const PURIFY_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = PURIFY_RECORD{.initial_pairs=req.pairs.size()};

    if (req.target_fidelity < 0.0 || req.target_fidelity > 1.0)
        throw_configuration_error("PURIFY: target fidelity must be in [0, 1] -- " + std::to_string(req.target_fidelity));

    std::lock_guard<std::mutex> lg(resource_mtx_);

    auto endpoints_of = [this] (pair_handle_type p)
    {
        const ENTANGLED_PAIR& ep = resources_.pair(p);
        node_id_type a = resources_.qubit(ep.first).owner,
                     b = resources_.qubit(ep.second).owner;
        return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
    };

    std::vector<pair_handle_type> pairs;
    std::set<pair_handle_type> seen;
    for (const auto& name : req.pairs)
    {
        pair_handle_type p = resources_.find_pair(name);
        if (!seen.insert(p).second)
            throw_configuration_error("PURIFY: pair listed twice -- " + name);
        if (!resources_.is_intact(p))
            throw_state_error("PURIFY: pair already consumed -- " + name);
        pairs.push_back(p);
    }
    // all pairs must connect the same two nodes
    for (pair_handle_type p : pairs)
    {
        if (endpoints_of(p) != endpoints_of(pairs.front()))
        {
            auto [a, b] = endpoints_of(p);
            auto [fa, fb] = endpoints_of(pairs.front());
            throw_state_error("PURIFY: pair " + resources_.pair(p).name + " connects " + a + " and " + b
                                + ", expected " + fa + " and " + fb);
        }
    }

    ex.result.record = purify_pairs(pairs, req.target_fidelity, req.rounds, ex.rng);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

PURIFY_RECORD
ENGINE::purify_pairs(std::vector<pair_handle_type> pairs, double target, size_t rounds, rng_type& rng)
{
    auto min_fidelity = [this] (const std::vector<pair_handle_type>& v)
    {
        double f{1.0};
        for (pair_handle_type p : v)
            f = std::min(f, resources_.pair(p).fidelity);
        return v.empty() ? 0.0 : f;
    };

    PURIFY_RECORD rec{.initial_pairs=pairs.size()};
    for (size_t r = 0; r < rounds; r++)
    {
        if (pairs.size() < 2 || min_fidelity(pairs) >= target)
            break;

        std::vector<pair_handle_type> survivors;
        for (size_t i = 0; i+1 < pairs.size(); i += 2)
        {
            pair_handle_type keep = pairs[i],
                             sacrifice = pairs[i+1];
            double base = std::min(resources_.pair(keep).fidelity, resources_.pair(sacrifice).fidelity);
            double f = base >= config.purify_cap ? base : std::min(config.purify_cap, base + config.purify_step);

            consume_pair(sacrifice, rng);
            resources_.set_pair_fidelity(keep, f);
            survivors.push_back(keep);
        }

        // an odd pair out has no partner this round and is discarded
        if (pairs.size() % 2 == 1)
            consume_pair(pairs.back(), rng);

        pairs = std::move(survivors);
        rec.rounds_performed++;
    }

    rec.final_pairs = pairs.size();
    rec.final_fidelity = min_fidelity(pairs);
    for (pair_handle_type p : pairs)
        rec.surviving_pairs.push_back(resources_.pair(p).name);
    return rec;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

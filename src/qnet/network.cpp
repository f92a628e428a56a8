/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/network.h"
#include "qnet/error.h"

#include <algorithm>

namespace qnet
{

namespace
{

void
check_probability(const std::string& what, double p)
{
    if (p < 0.0 || p > 1.0)
        throw_configuration_error("build_network: " + what + " must be in [0, 1] -- " + std::to_string(p));
}

void
update_memory_occupancy(NODE& n)
{
    if (n.memory.has_value())
        n.memory->occupancy = n.qubits.size() > n.qubit_count ? n.qubits.size() - n.qubit_count : 0;
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
to_string(TOPOLOGY t)
{
    switch (t)
    {
    case TOPOLOGY::MESH:
        return "mesh";
    case TOPOLOGY::STAR:
        return "star";
    case TOPOLOGY::RING:
        return "ring";
    case TOPOLOGY::TREE:
        return "tree";
    }
    return "unknown";
}

std::string_view
to_string(NODE_KIND k)
{
    switch (k)
    {
    case NODE_KIND::ENDPOINT:
        return "endpoint";
    case NODE_KIND::REPEATER:
        return "repeater";
    case NODE_KIND::ROUTER:
        return "router";
    case NODE_KIND::SERVER:
        return "server";
    }
    return "unknown";
}

TOPOLOGY
topology_from_string(std::string_view s)
{
    if (s == "mesh")
        return TOPOLOGY::MESH;
    if (s == "star")
        return TOPOLOGY::STAR;
    if (s == "ring")
        return TOPOLOGY::RING;
    if (s == "tree")
        return TOPOLOGY::TREE;
    throw_configuration_error("topology_from_string: unknown topology -- " + std::string{s});
}

NODE_KIND
node_kind_from_string(std::string_view s)
{
    if (s == "endpoint")
        return NODE_KIND::ENDPOINT;
    if (s == "repeater")
        return NODE_KIND::REPEATER;
    if (s == "router")
        return NODE_KIND::ROUTER;
    if (s == "server")
        return NODE_KIND::SERVER;
    throw_configuration_error("node_kind_from_string: unknown node kind -- " + std::string{s});
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

size_t
NODE::capacity() const
{
    return qubit_count + (memory.has_value() ? memory->capacity : 0);
}

size_t
NODE::free_slots() const
{
    return qubits.size() >= capacity() ? 0 : capacity() - qubits.size();
}

void
NODE::host(const std::string& name, qubit_handle_type h)
{
    if (qubits.count(name))
        throw_resource_error("NODE::host: qubit already hosted at " + id + " -- " + name);
    if (free_slots() == 0)
    {
        throw_resource_error("NODE::host: node " + id + " is at capacity ("
                                + std::to_string(capacity()) + " qubits) -- " + name);
    }
    qubits[name] = h;
    update_memory_occupancy(*this);
}

void
NODE::unhost(const std::string& name)
{
    qubits.erase(name);
    update_memory_occupancy(*this);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

LINK::LINK(node_id_type _source, node_id_type _target, double _distance, double _loss_rate)
    :id(_source + "-" + _target),
    source(_source),
    target(_target),
    distance(_distance),
    loss_rate(_loss_rate)
{}

bool
LINK::connects(const node_id_type& a, const node_id_type& b) const
{
    return (source == a && target == b) || (source == b && target == a);
}

CHANNEL*
LINK::select_channel() const
{
    if (channels.empty())
        return nullptr;
    for (const auto& ch : channels)
    {
        if (!ch->busy())
            return ch.get();
    }
    return channels.front().get();
}

double
LINK::best_channel_fidelity() const
{
    double best{0.0};
    for (const auto& ch : channels)
        best = std::max(best, ch->fidelity);
    return best;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NODE&
NETWORK::add_node(NODE n)
{
    if (nodes_.count(n.id))
        throw_configuration_error("NETWORK::add_node: duplicate node id -- " + n.id);
    node_order_.push_back(n.id);
    auto [it, inserted] = nodes_.emplace(n.id, std::move(n));
    return it->second;
}

LINK&
NETWORK::add_link(const node_id_type& src, const node_id_type& dst, double distance, double loss_rate)
{
    if (!has_node(src))
        throw_configuration_error("NETWORK::add_link: link references undeclared node -- " + src);
    if (!has_node(dst))
        throw_configuration_error("NETWORK::add_link: link references undeclared node -- " + dst);
    if (src == dst)
        throw_configuration_error("NETWORK::add_link: self loop -- " + src);
    if (distance < 0.0)
        throw_configuration_error("NETWORK::add_link: negative distance -- " + src + "-" + dst);
    check_probability("loss rate of " + src + "-" + dst, loss_rate);

    auto l = std::make_unique<LINK>(src, dst, distance, loss_rate);
    if (link_by_id_.count(l->id))
        throw_configuration_error("NETWORK::add_link: duplicate link -- " + l->id);

    nodes_.at(src).neighbors.insert(dst);
    nodes_.at(dst).neighbors.insert(src);

    LINK& ref = *l;
    link_by_id_[l->id] = l.get();
    links_.push_back(std::move(l));
    return ref;
}

CHANNEL&
NETWORK::add_channel(LINK& l, std::string id, size_t capacity, double fidelity, double bandwidth)
{
    if (channel_by_id_.count(id))
        throw_configuration_error("NETWORK::add_channel: duplicate channel id -- " + id);
    check_probability("fidelity of channel " + id, fidelity);
    if (bandwidth < 0.0)
        throw_configuration_error("NETWORK::add_channel: negative bandwidth -- " + id);

    auto ch = std::make_unique<CHANNEL>(id, capacity, fidelity, bandwidth);
    CHANNEL& ref = *ch;
    channel_by_id_[id] = ch.get();
    l.channels.push_back(std::move(ch));
    return ref;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bool
NETWORK::has_node(const node_id_type& id) const
{
    return nodes_.count(id) > 0;
}

NODE&
NETWORK::node(const node_id_type& id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw_reference_error("NETWORK::node: unknown node -- " + id);
    return it->second;
}

const NODE&
NETWORK::node(const node_id_type& id) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
        throw_reference_error("NETWORK::node: unknown node -- " + id);
    return it->second;
}

LINK*
NETWORK::find_link(const node_id_type& a, const node_id_type& b) const
{
    auto it = link_by_id_.find(a + "-" + b);
    if (it != link_by_id_.end())
        return it->second;
    it = link_by_id_.find(b + "-" + a);
    if (it != link_by_id_.end())
        return it->second;
    return nullptr;
}

LINK&
NETWORK::link(const node_id_type& a, const node_id_type& b) const
{
    LINK* l = find_link(a, b);
    if (l == nullptr)
        throw_reference_error("NETWORK::link: nodes are not adjacent -- " + a + ", " + b);
    return *l;
}

CHANNEL*
NETWORK::find_channel(const std::string& id) const
{
    auto it = channel_by_id_.find(id);
    return it == channel_by_id_.end() ? nullptr : it->second;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::vector<std::pair<size_t, size_t>>
topology_edges(TOPOLOGY t, size_t n)
{
    std::vector<std::pair<size_t, size_t>> edges;
    switch (t)
    {
    case TOPOLOGY::MESH:
        for (size_t i = 0; i < n; i++)
            for (size_t j = i+1; j < n; j++)
                edges.emplace_back(i, j);
        break;
    case TOPOLOGY::STAR:
        for (size_t i = 1; i < n; i++)
            edges.emplace_back(0, i);
        break;
    case TOPOLOGY::RING:
        if (n == 2)
            edges.emplace_back(0, 1);
        else if (n >= 3)
        {
            for (size_t i = 0; i < n; i++)
                edges.emplace_back(i, (i+1) % n);
        }
        break;
    case TOPOLOGY::TREE:
        for (size_t i = 0; i < n/2; i++)
        {
            if (2*i+1 < n)
                edges.emplace_back(i, 2*i+1);
            if (2*i+2 < n)
                edges.emplace_back(i, 2*i+2);
        }
        break;
    }
    return edges;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NETWORK
build_network(const NETWORK_SPEC& spec, RESOURCE_MODEL& resources, const ENGINE_CONFIG& conf, time_ns_type now)
{
    NETWORK net;
    net.name = spec.name;
    net.topology = topology_from_string(spec.topology);

    for (const auto& ns : spec.nodes)
    {
        if (ns.id.empty())
            throw_configuration_error("build_network: node with empty id");
        if (ns.qubit_count < 0)
            throw_configuration_error("build_network: negative qubit count -- " + ns.id);

        NODE n{.id=ns.id, .kind=ns.kind, .position=ns.position};
        n.qubit_count = static_cast<size_t>(ns.qubit_count);
        if (ns.memory.has_value())
        {
            if (ns.memory->capacity < 0)
                throw_configuration_error("build_network: negative memory capacity -- " + ns.id);
            if (ns.memory->coherence_time_ns < 0.0)
                throw_configuration_error("build_network: negative coherence time -- " + ns.id);
            n.memory = QUANTUM_MEMORY{static_cast<size_t>(ns.memory->capacity), ns.memory->coherence_time_ns, 0};
        }
        net.add_node(std::move(n));
    }

    // register qubits are created only after all ids are known to be unique
    for (const auto& ns : spec.nodes)
    {
        NODE& n = net.node(ns.id);
        for (qubit_handle_type h : resources.initialize(ns.id, n.qubit_count, now))
            n.host(resources.qubit(h).name, h);
    }

    auto add_default_channel = [&] (LINK& l)
    {
        net.add_channel(l, l.id + "/ch0", conf.default_channel_capacity,
                        conf.default_channel_fidelity, conf.default_channel_bandwidth);
    };

    for (const auto& ls : spec.links)
    {
        if (net.find_link(ls.source, ls.target) != nullptr)
            throw_configuration_error("build_network: nodes linked twice -- " + ls.source + "-" + ls.target);

        LINK& l = net.add_link(ls.source, ls.target, ls.distance, ls.loss_rate);
        for (const auto& cs : ls.channels)
        {
            if (cs.capacity < 0)
                throw_configuration_error("build_network: negative channel capacity -- " + cs.id);
            net.add_channel(l, cs.id, static_cast<size_t>(cs.capacity), cs.fidelity, cs.bandwidth);
        }
        if (l.channels.empty())
            add_default_channel(l);
    }

    const auto& ids = net.node_ids();
    for (auto [i, j] : topology_edges(net.topology, ids.size()))
    {
        if (net.find_link(ids[i], ids[j]) != nullptr)
            continue;
        LINK& l = net.add_link(ids[i], ids[j], conf.default_distance, conf.default_loss_rate);
        add_default_channel(l);
    }

    return net;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

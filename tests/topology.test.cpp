/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "test_common.h"

#include <cmath>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

size_t
link_count_for(std::string topology, size_t n)
{
    RESOURCE_MODEL rm;
    NETWORK net = build_network(make_network_spec(topology, n), rm, ENGINE_CONFIG{});
    return net.link_count();
}

void
test_topology_link_counts()
{
    for (size_t n : {1, 2, 3, 5, 8})
    {
        CHECK(link_count_for("mesh", n) == n*(n-1)/2, "mesh has n(n-1)/2 links");
        CHECK(link_count_for("star", n) == (n == 0 ? 0 : n-1), "star has n-1 links");
        CHECK(link_count_for("tree", n) == (n == 0 ? 0 : n-1), "tree has n-1 links");
    }
    CHECK(link_count_for("ring", 5) == 5, "ring of 5");
    CHECK(link_count_for("ring", 3) == 3, "ring of 3");
    CHECK(link_count_for("ring", 2) == 1, "ring of 2 is a single link");
    CHECK(link_count_for("ring", 1) == 0, "ring of 1 has no links");
    std::vector<std::pair<size_t, size_t>> ring2{{0, 1}};
    CHECK(topology_edges(TOPOLOGY::RING, 2) == ring2, "ring of 2 does not repeat its link");
    CHECK(topology_edges(TOPOLOGY::RING, 1).empty(), "ring of 1 has no self link");

    auto tree = topology_edges(TOPOLOGY::TREE, 7);
    std::vector<std::pair<size_t, size_t>> expected{{0, 1}, {0, 2}, {1, 3}, {1, 4}, {2, 5}, {2, 6}};
    CHECK(tree == expected, "tree links each node to children 2i+1 and 2i+2");
    printf("PASS: topology link counts\n");
}

void
test_build_network()
{
    RESOURCE_MODEL rm;
    NETWORK_SPEC spec = make_network_spec("star", 4, 2, 3);
    spec.nodes[1].kind = NODE_KIND::REPEATER;
    spec.links.push_back(LINK_SPEC{
                            .source="n1",
                            .target="n2",
                            .distance=4.0,
                            .loss_rate=0.2,
                            .channels={CHANNEL_SPEC{.id="fast", .capacity=8, .fidelity=0.99},
                                       CHANNEL_SPEC{.id="slow", .capacity=2}}
                        });
    NETWORK net = build_network(spec, rm, ENGINE_CONFIG{});

    CHECK(net.node_count() == 4, "four nodes");
    CHECK(net.link_count() == 4, "declared link plus three star links");
    CHECK(net.channel_count() == 5, "two declared channels plus three defaults");
    CHECK(net.node_ids().front() == "n0", "declaration order");

    const NODE& n1 = net.node("n1");
    CHECK(n1.kind == NODE_KIND::REPEATER, "node kind");
    CHECK(n1.capacity() == 5, "capacity is registers plus memory");
    CHECK(n1.free_slots() == 3, "registers occupy their slots");
    CHECK(n1.qubits.count("n1_q0") && n1.qubits.count("n1_q1"), "register qubits are hosted");
    CHECK(n1.neighbors.count("n0") && n1.neighbors.count("n2"), "neighbors are symmetric");
    CHECK(net.node("n2").neighbors.count("n1"), "neighbors are symmetric");

    LINK* l = net.find_link("n2", "n1");
    CHECK(l != nullptr && l->id == "n1-n2", "links are found in either direction");
    CHECK(l->loss_rate == 0.2 && l->distance == 4.0, "declared link parameters");
    CHECK(std::abs(l->best_channel_fidelity() - 0.99) < 1e-12, "best channel fidelity");
    CHECK(net.find_channel("n0-n3/ch0") != nullptr, "generated links get a default channel");
    CHECK(net.find_channel("fast")->capacity == 8, "declared channel capacity");

    CHECK(l->select_channel()->id == "fast", "first free channel");
    CHECK(l->select_channel()->try_claim(), "claim a free channel");
    CHECK(l->select_channel()->id == "slow", "claimed channels are skipped");
    l->channels[1]->try_claim();
    CHECK(l->select_channel()->id == "fast", "all claimed falls back to the first");
    l->channels[0]->release();
    l->channels[1]->release();
    CHECK(net.find_link("n2", "n3") == nullptr, "star leaves are not linked to each other");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { net.node("n9"); }), "unknown node");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { net.link("n2", "n3"); }), "no such link");
    printf("PASS: build network\n");
}

void
test_invalid_declarations()
{
    auto build = [] (NETWORK_SPEC spec)
    {
        return [spec] { RESOURCE_MODEL rm; build_network(spec, rm, ENGINE_CONFIG{}); };
    };

    NETWORK_SPEC bad_topology = make_network_spec("hypercube", 3);
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(bad_topology)), "unknown topology");

    NETWORK_SPEC dup = make_network_spec("mesh", 2);
    dup.nodes.push_back(dup.nodes[0]);
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(dup)), "duplicate node id");

    NETWORK_SPEC dangling = make_network_spec("mesh", 2);
    dangling.links.push_back(LINK_SPEC{.source="n0", .target="x"});
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(dangling)), "link to undeclared node");

    NETWORK_SPEC loop = make_network_spec("mesh", 2);
    loop.links.push_back(LINK_SPEC{.source="n0", .target="n0"});
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(loop)), "self loop");

    NETWORK_SPEC twice = make_network_spec("mesh", 2);
    twice.links.push_back(LINK_SPEC{.source="n0", .target="n1"});
    twice.links.push_back(LINK_SPEC{.source="n1", .target="n0"});
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(twice)), "nodes linked twice");

    NETWORK_SPEC lossy = make_network_spec("mesh", 2);
    lossy.links.push_back(LINK_SPEC{.source="n0", .target="n1", .loss_rate=1.5});
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(lossy)), "loss rate above one");

    NETWORK_SPEC negative = make_network_spec("mesh", 2);
    negative.nodes[0].qubit_count = -1;
    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, build(negative)), "negative qubit count");

    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR, [] { node_kind_from_string("satellite"); }), "unknown node kind");
    printf("PASS: invalid declarations\n");
}

void
test_node_capacity()
{
    NODE n{.id="x"};
    n.qubit_count = 1;
    n.memory = QUANTUM_MEMORY{.capacity=1};
    n.host("a", 0);
    n.host("b", 1);
    CHECK(n.memory->occupancy == 1, "second qubit goes to memory");
    CHECK(n.free_slots() == 0, "full");
    CHECK(throws_kind(ERROR_KIND::RESOURCE_ERROR, [&] { n.host("c", 2); }), "host beyond capacity");
    n.unhost("a");
    CHECK(n.free_slots() == 1, "unhost frees a slot");
    CHECK(n.memory->occupancy == 0, "memory drains first");
    printf("PASS: node capacity\n");
}

void
test_routing()
{
    RESOURCE_MODEL rm;
    NETWORK net = build_network(make_network_spec("star", 5), rm, ENGINE_CONFIG{});

    ROUTE r = find_route(net, "n1", "n4", ROUTING_POLICY::HOP_COUNT);
    CHECK(r.found && r.hops() == 2, "leaf to leaf through the hub");
    CHECK(r.path == std::vector<node_id_type>({"n1", "n0", "n4"}), "path through the hub");

    ROUTE self = find_route(net, "n2", "n2", ROUTING_POLICY::HOP_COUNT);
    CHECK(self.found && self.hops() == 0, "a node reaches itself");
    CHECK(network_diameter(net) == 2, "star diameter");
    CHECK(connectivity_ratio(net) == 1.0, "star is connected");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { find_route(net, "n1", "zz", ROUTING_POLICY::HOP_COUNT); }),
            "route to unknown node");

    // a long direct link loses to a two hop detour when cost depends on distance
    NETWORK_SPEC spec = make_network_spec("mesh", 3);
    spec.links.push_back(LINK_SPEC{.source="n0", .target="n1", .distance=10.0});
    RESOURCE_MODEL rm2;
    NETWORK tri = build_network(spec, rm2, ENGINE_CONFIG{});
    CHECK(find_route(tri, "n0", "n1", ROUTING_POLICY::HOP_COUNT).hops() == 1, "hop count takes the direct link");
    CHECK(find_route(tri, "n0", "n1", ROUTING_POLICY::LOSS).hops() == 2, "loss policy avoids the long link");
    CHECK(find_route(tri, "n0", "n1", ROUTING_POLICY::FIDELITY).hops() == 2, "fidelity policy avoids the long link");

    NETWORK split;
    split.add_node(NODE{.id="a"});
    split.add_node(NODE{.id="b"});
    CHECK(!find_route(split, "a", "b", ROUTING_POLICY::HOP_COUNT).found, "no route between islands");
    CHECK(!find_route(split, "a", "b", ROUTING_POLICY::LOSS).found, "no weighted route between islands");
    CHECK(throws_kind(ERROR_KIND::REFERENCE_ERROR, [&] { require_route(split, "a", "b", ROUTING_POLICY::HOP_COUNT); }),
            "require_route without a route");
    CHECK(network_diameter(split) == -1, "disconnected diameter");
    CHECK(connectivity_ratio(split) == 0.0, "disconnected ratio");
    printf("PASS: routing\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    printf("=== Topology Test ===\n");
    test_topology_link_counts();
    test_build_network();
    test_invalid_declarations();
    test_node_capacity();
    test_routing();
    return 0;
}

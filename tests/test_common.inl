/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

inline NETWORK_SPEC
make_network_spec(std::string topology, size_t n, int64_t qubits, int64_t memory)
{
    NETWORK_SPEC spec{.name="test", .topology=topology};
    for (size_t i = 0; i < n; i++)
    {
        NODE_SPEC ns{.id="n" + std::to_string(i), .qubit_count=qubits};
        if (memory > 0)
            ns.memory = MEMORY_SPEC{.capacity=memory};
        spec.nodes.push_back(ns);
    }
    return spec;
}

inline NETWORK_SPEC
make_chain_spec(size_t n, double loss, int64_t qubits, int64_t memory)
{
    // declaration orders for which the binary tree is the path n0 - n1 - ...
    std::vector<std::vector<size_t>> tree_orders{{0}, {0, 1}, {1, 0, 2}, {2, 1, 3, 0}};
    CHECK(n >= 1 && n <= 4, "make_chain_spec: chains of 1 to 4 nodes only");

    NETWORK_SPEC spec{.name="chain", .topology="tree"};
    for (size_t i : tree_orders[n-1])
    {
        NODE_SPEC ns{.id="n" + std::to_string(i), .qubit_count=qubits};
        if (memory > 0)
            ns.memory = MEMORY_SPEC{.capacity=memory};
        spec.nodes.push_back(ns);
    }
    for (size_t i = 0; i+1 < n; i++)
    {
        spec.links.push_back(LINK_SPEC{
                                .source="n" + std::to_string(i),
                                .target="n" + std::to_string(i+1),
                                .loss_rate=loss
                            });
    }
    return spec;
}

template <class F> bool
throws_kind(ERROR_KIND k, F f)
{
    try
    {
        f();
    }
    catch (const NETWORK_ERROR& e)
    {
        return e.kind == k;
    }
    return false;
}

inline ENGINE_CONFIG
make_test_config(uint64_t seed, double default_loss)
{
    ENGINE_CONFIG conf;
    conf.seed = seed;
    conf.default_loss_rate = default_loss;
    conf.receive_timeout_ms = 2000;
    return conf;
}

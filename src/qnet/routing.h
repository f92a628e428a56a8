/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_ROUTING_h
#define QNET_ROUTING_h

#include "qnet/network.h"

#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

// the path includes both endpoints; if `found` is false the path is empty
struct ROUTE
{
    bool                      found{false};
    std::vector<node_id_type> path{};
    double                    cost{0.0};

    size_t hops() const { return path.empty() ? 0 : path.size()-1; }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Edge weight of a link under the given policy:
 *  -- HOP_COUNT: 1
 *  -- FIDELITY:  distance * 2/(f + 1e-6) + loss * distance / 100,
 *                where f is the best channel fidelity of the link
 *  -- LOSS:      distance + 3 * loss * distance / 100
 * */
double link_cost(const LINK&, ROUTING_POLICY);

/*
 * `HOP_COUNT` runs a bfs; the other policies run Dijkstra over
 * `link_cost`. A route from a node to itself is the single-node path.
 * */
ROUTE find_route(const NETWORK&, const node_id_type& src, const node_id_type& dst, ROUTING_POLICY);

// same as `find_route` but throws a reference error if no route exists
ROUTE require_route(const NETWORK&, const node_id_type& src, const node_id_type& dst, ROUTING_POLICY);

/*
 * Largest hop distance between any two nodes, or -1 if the network
 * is disconnected.
 * */
int64_t network_diameter(const NETWORK&);

/*
 * Fraction of ordered node pairs that can reach each other.
 * */
double connectivity_ratio(const NETWORK&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_ROUTING_h

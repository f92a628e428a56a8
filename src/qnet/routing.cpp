/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/routing.h"
#include "qnet/error.h"

#include <algorithm>
#include <deque>
#include <limits>
#include <queue>
#include <unordered_map>

namespace qnet
{

namespace
{

using prev_map_type = std::unordered_map<node_id_type, node_id_type>;

std::vector<node_id_type>
backtrack(const prev_map_type& prev, const node_id_type& src, const node_id_type& dst)
{
    std::vector<node_id_type> path{dst};
    node_id_type curr = dst;
    while (curr != src)
    {
        curr = prev.at(curr);
        path.push_back(curr);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

/*
 * Hop distances from `src` to every reachable node.
 * */
std::unordered_map<node_id_type, int64_t>
bfs_distances(const NETWORK& net, const node_id_type& src)
{
    std::unordered_map<node_id_type, int64_t> dist{{src, 0}};
    std::deque<node_id_type> bfs{src};
    while (bfs.size() > 0)
    {
        node_id_type curr = std::move(bfs.front());
        bfs.pop_front();
        for (const auto& n : net.node(curr).neighbors)
        {
            if (dist.count(n))
                continue;
            dist[n] = dist[curr] + 1;
            bfs.push_back(n);
        }
    }
    return dist;
}

ROUTE
route_bfs(const NETWORK& net, const node_id_type& src, const node_id_type& dst)
{
    std::deque<node_id_type> bfs{src};
    prev_map_type prev{{src, src}};

    while (bfs.size() > 0)
    {
        node_id_type curr = std::move(bfs.front());
        bfs.pop_front();

        // and exit early if we reach `dst`
        if (curr == dst)
            break;

        for (const auto& n : net.node(curr).neighbors)
        {
            // already visited:
            if (prev.find(n) != prev.end())
                continue;
            prev[n] = curr;
            bfs.push_back(n);
        }
    }

    if (prev.find(dst) == prev.end())
        return ROUTE{};

    auto path = backtrack(prev, src, dst);
    double cost = static_cast<double>(path.size()-1);
    return ROUTE{true, std::move(path), cost};
}

ROUTE
route_dijkstra(const NETWORK& net, const node_id_type& src, const node_id_type& dst, ROUTING_POLICY policy)
{
    using entry_type = std::pair<double, node_id_type>;
    std::priority_queue<entry_type, std::vector<entry_type>, std::greater<entry_type>> pq;
    std::unordered_map<node_id_type, double> dist{{src, 0.0}};
    prev_map_type prev{{src, src}};

    pq.emplace(0.0, src);
    while (!pq.empty())
    {
        auto [d, curr] = pq.top();
        pq.pop();
        if (d > dist[curr])
            continue;
        if (curr == dst)
            break;

        for (const auto& n : net.node(curr).neighbors)
        {
            double nd = d + link_cost(net.link(curr, n), policy);
            auto it = dist.find(n);
            if (it == dist.end() || nd < it->second)
            {
                dist[n] = nd;
                prev[n] = curr;
                pq.emplace(nd, n);
            }
        }
    }

    auto it = dist.find(dst);
    if (it == dist.end())
        return ROUTE{};
    return ROUTE{true, backtrack(prev, src, dst), it->second};
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

double
link_cost(const LINK& l, ROUTING_POLICY policy)
{
    switch (policy)
    {
    case ROUTING_POLICY::HOP_COUNT:
        return 1.0;
    case ROUTING_POLICY::FIDELITY:
        {
            double f = l.best_channel_fidelity();
            return l.distance * (1.0 / (f + 1e-6)) * 2.0 + l.loss_rate * l.distance / 100.0;
        }
    case ROUTING_POLICY::LOSS:
        return l.distance + 3.0 * l.loss_rate * l.distance / 100.0;
    }
    return 1.0;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

ROUTE
find_route(const NETWORK& net, const node_id_type& src, const node_id_type& dst, ROUTING_POLICY policy)
{
    if (!net.has_node(src))
        throw_reference_error("find_route: unknown node -- " + src);
    if (!net.has_node(dst))
        throw_reference_error("find_route: unknown node -- " + dst);

    if (src == dst)
        return ROUTE{true, {src}, 0.0};

    if (policy == ROUTING_POLICY::HOP_COUNT)
        return route_bfs(net, src, dst);
    return route_dijkstra(net, src, dst, policy);
}

ROUTE
require_route(const NETWORK& net, const node_id_type& src, const node_id_type& dst, ROUTING_POLICY policy)
{
    ROUTE r = find_route(net, src, dst, policy);
    if (!r.found)
        throw_reference_error("require_route: no route from " + src + " to " + dst);
    return r;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int64_t
network_diameter(const NETWORK& net)
{
    int64_t diameter{0};
    for (const auto& id : net.node_ids())
    {
        auto dist = bfs_distances(net, id);
        if (dist.size() != net.node_count())
            return -1;
        for (const auto& [n, d] : dist)
            diameter = std::max(diameter, d);
    }
    return diameter;
}

double
connectivity_ratio(const NETWORK& net)
{
    size_t n = net.node_count();
    if (n < 2)
        return 1.0;

    size_t reachable{0};
    for (const auto& id : net.node_ids())
        reachable += bfs_distances(net, id).size() - 1;
    return static_cast<double>(reachable) / static_cast<double>(n*(n-1));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_NETWORK_h
#define QNET_NETWORK_h

#include "qnet/channel.h"
#include "qnet/config.h"
#include "qnet/resource.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class TOPOLOGY { MESH, STAR, RING, TREE };
enum class NODE_KIND { ENDPOINT, REPEATER, ROUTER, SERVER };

std::string_view to_string(TOPOLOGY);
std::string_view to_string(NODE_KIND);

// these throw a configuration error on an unknown name
TOPOLOGY  topology_from_string(std::string_view);
NODE_KIND node_kind_from_string(std::string_view);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct POSITION
{
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

struct MEMORY_SPEC
{
    int64_t capacity{0};
    double  coherence_time_ns{1e6};
};

struct NODE_SPEC
{
    node_id_type id;
    NODE_KIND    kind{NODE_KIND::ENDPOINT};
    int64_t      qubit_count{0};

    std::optional<MEMORY_SPEC> memory{};
    std::optional<POSITION>    position{};
};

struct CHANNEL_SPEC
{
    std::string id;
    int64_t     capacity{64};
    double      fidelity{1.0};
    double      bandwidth{1e9};
};

struct LINK_SPEC
{
    node_id_type source;
    node_id_type target;
    double       distance{1.0};
    double       loss_rate{0.01};

    std::vector<CHANNEL_SPEC> channels{};
};

/*
 * `topology` is kept as text so that an unknown kind is reported when the
 * network is built rather than when the declaration is parsed.
 * */
struct NETWORK_SPEC
{
    std::string name;
    std::string topology{"mesh"};

    std::vector<NODE_SPEC> nodes{};
    std::vector<LINK_SPEC> links{};
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct QUANTUM_MEMORY
{
    size_t capacity{0};
    double coherence_time_ns{1e6};
    size_t occupancy{0};
};

struct NODE
{
    node_id_type            id;
    NODE_KIND               kind{NODE_KIND::ENDPOINT};
    std::optional<POSITION> position{};

    // name -> handle of every qubit currently hosted here
    std::map<std::string, qubit_handle_type> qubits{};

    std::optional<QUANTUM_MEMORY> memory{};
    std::set<node_id_type>        neighbors{};

    size_t qubit_count{0};

    size_t capacity() const;
    size_t free_slots() const;

    /*
     * Records `h` as hosted here. Throws a resource error if the node is
     * full. Qubits beyond `qubit_count` occupy the quantum memory.
     * */
    void host(const std::string& name, qubit_handle_type h);
    void unhost(const std::string& name);
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class LINK
{
public:
    const std::string  id;
    const node_id_type source;
    const node_id_type target;
    const double       distance;
    const double       loss_rate;

    std::vector<std::unique_ptr<CHANNEL>> channels;

    LINK(node_id_type source, node_id_type target, double distance, double loss_rate);

    bool connects(const node_id_type&, const node_id_type&) const;

    /*
     * Returns the first channel not claimed by a protocol run, or the
     * first channel if all are claimed.
     * */
    CHANNEL* select_channel() const;

    double best_channel_fidelity() const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class NETWORK
{
public:
    std::string name;
    TOPOLOGY    topology{TOPOLOGY::MESH};
private:
    std::map<node_id_type, NODE> nodes_;
    std::vector<node_id_type>    node_order_;

    std::vector<std::unique_ptr<LINK>>        links_;
    std::unordered_map<std::string, LINK*>    link_by_id_;
    std::unordered_map<std::string, CHANNEL*> channel_by_id_;
public:
    NETWORK() =default;
    NETWORK(NETWORK&&) =default;
    NETWORK& operator=(NETWORK&&) =default;

    NODE&       add_node(NODE);
    LINK&       add_link(const node_id_type&, const node_id_type&, double distance, double loss_rate);
    CHANNEL&    add_channel(LINK&, std::string id, size_t capacity, double fidelity, double bandwidth);

    bool        has_node(const node_id_type&) const;
    NODE&       node(const node_id_type&);
    const NODE& node(const node_id_type&) const;

    /*
     * Returns the link between the two nodes in either direction, or
     * nullptr if they are not adjacent.
     * */
    LINK*       find_link(const node_id_type&, const node_id_type&) const;
    LINK&       link(const node_id_type&, const node_id_type&) const;
    CHANNEL*    find_channel(const std::string& id) const;

    // nodes in declaration order
    const std::vector<node_id_type>&          node_ids() const { return node_order_; }
    const std::vector<std::unique_ptr<LINK>>& links() const { return links_; }

    size_t node_count() const { return nodes_.size(); }
    size_t link_count() const { return links_.size(); }
    size_t channel_count() const { return channel_by_id_.size(); }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Materializes a network:
 *  (1) nodes are created and their register qubits initialized,
 *  (2) declared links (and their channels) are created,
 *  (3) links implied by the topology are generated, skipping any pair of
 *      nodes that is already linked.
 * A link with no channels receives a default channel `<link id>/ch0`.
 * */
NETWORK build_network(const NETWORK_SPEC&, RESOURCE_MODEL&, const ENGINE_CONFIG&, time_ns_type now=0);

/*
 * Returns the node pairs the topology connects, in generation order.
 * */
std::vector<std::pair<size_t, size_t>> topology_edges(TOPOLOGY, size_t node_count);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_NETWORK_h

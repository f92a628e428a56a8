/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_PROTOCOL_h
#define QNET_PROTOCOL_h

#include "qnet/error.h"
#include "qnet/qkd.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct BB84_REQUEST
{
    node_id_type alice;
    node_id_type bob;
    size_t       key_length{256};
    double       security_threshold{0.11};
};

struct E91_REQUEST
{
    node_id_type alice;
    node_id_type bob;
    size_t       key_length{256};
};

/*
 * If `pair` is not given, the engine generates one (through a repeater
 * chain if the nodes are not adjacent).
 * */
struct TELEPORT_REQUEST
{
    node_id_type               source;
    node_id_type               target;
    std::string                qubit;
    std::optional<std::string> pair{};
};

enum class ENTANGLEMENT_KIND { BELL, GHZ, CLUSTER };

std::string_view  to_string(ENTANGLEMENT_KIND);
ENTANGLEMENT_KIND entanglement_kind_from_string(std::string_view);

struct ENTANGLE_REQUEST
{
    std::vector<node_id_type> nodes;
    ENTANGLEMENT_KIND         kind{ENTANGLEMENT_KIND::BELL};
    double                    fidelity_threshold{0.9};
    bool                      purify{false};
};

struct PURIFY_REQUEST
{
    std::vector<std::string> pairs;
    double                   target_fidelity{0.9};
    size_t                   rounds{1};
};

struct SWAP_REQUEST
{
    std::string qubit_a;
    std::string qubit_b;
    bool        measure{true};
};

/*
 * Two classical bits carried by one qubit of a shared pair. `bits[0]`
 * selects a Z and `bits[1]` an X on the sender's half. If `pair` is not
 * given, the engine generates one as for teleportation.
 * */
struct SUPERDENSE_REQUEST
{
    node_id_type               sender;
    node_id_type               receiver;
    std::array<uint8_t, 2>     bits{0, 0};
    std::optional<std::string> pair{};
};

/*
 * Classical bits relayed hop by hop along the route. A named channel is
 * only allowed between adjacent nodes.
 * */
struct SEND_REQUEST
{
    node_id_type               source;
    node_id_type               destination;
    bit_vector_type            bits;
    std::optional<std::string> channel{};
};

using PROTOCOL_INVOCATION = std::variant<BB84_REQUEST,
                                         E91_REQUEST,
                                         TELEPORT_REQUEST,
                                         ENTANGLE_REQUEST,
                                         PURIFY_REQUEST,
                                         SWAP_REQUEST,
                                         SUPERDENSE_REQUEST,
                                         SEND_REQUEST>;

constexpr size_t PROTOCOL_KIND_COUNT{std::variant_size_v<PROTOCOL_INVOCATION>};

std::string_view protocol_name(const PROTOCOL_INVOCATION&);
std::string_view protocol_name(size_t variant_index);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * QKD runs progress through these in order and end in either
 * `KEY_ACCEPTED` or `ABORTED`.
 * */
enum class QKD_STAGE
{
    PREPARING,
    TRANSMITTING,
    MEASURING,
    SIFTING,
    ERROR_ESTIMATION,
    KEY_ACCEPTED,
    ABORTED
};

std::string_view to_string(QKD_STAGE);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

struct BB84_RECORD
{
    node_id_type alice;
    node_id_type bob;

    size_t raw_length{0};
    size_t sifted_length{0};
    size_t final_length{0};
    double qber{0.0};

    std::optional<bit_vector_type> key{};
    std::optional<bit_vector_type> receiver_key{};

    QKD_STAGE stage{QKD_STAGE::PREPARING};
    size_t    hops{0};
};

struct E91_RECORD
{
    node_id_type alice;
    node_id_type bob;

    size_t pairs_created{0};
    size_t key_length{0};
    double correlation{0.0};

    // correlation restricted to outcomes where both sides chose the same basis
    double matched_correlation{0.0};

    bit_vector_type key{};
    size_t          hops{0};
};

struct TELEPORT_RECORD
{
    node_id_type source;
    node_id_type target;
    std::string  source_qubit;
    std::string  target_qubit;
    std::string  pair;

    int                    bell_measurement{0};
    std::array<uint8_t, 2> classical_bits{0, 0};

    // output fidelity is min(source fidelity, bound); the pair's is kept for reference
    double fidelity{0.0};
    double pair_fidelity{0.0};
    size_t hops{0};
};

struct ENTANGLE_RECORD
{
    ENTANGLEMENT_KIND         kind{ENTANGLEMENT_KIND::BELL};
    std::vector<node_id_type> nodes{};

    // bell: one pair per consecutive node couple; ghz: empty
    std::vector<std::string> pairs{};
    // ghz: one qubit per node; bell: empty
    std::vector<std::string> qubits{};

    double min_fidelity{0.0};
    bool   meets_threshold{false};
    bool   purified{false};
};

struct PURIFY_RECORD
{
    size_t initial_pairs{0};
    size_t final_pairs{0};
    double final_fidelity{0.0};
    size_t rounds_performed{0};

    std::vector<std::string> surviving_pairs{};
};

struct SWAP_RECORD
{
    std::string  qubit_a;
    std::string  qubit_b;
    std::string  new_pair;
    node_id_type endpoint_a;
    node_id_type endpoint_b;

    double fidelity{0.0};
    int    bell_measurement{0};

    // false if the outcome was left in the pair's Pauli frame
    bool corrected{true};
};

struct SUPERDENSE_RECORD
{
    node_id_type sender;
    node_id_type receiver;
    std::string  pair;

    std::array<uint8_t, 2> sent_bits{0, 0};
    std::array<uint8_t, 2> decoded_bits{0, 0};

    bool   success{false};
    double pair_fidelity{0.0};
    size_t hops{0};
};

struct SEND_RECORD
{
    node_id_type source;
    node_id_type destination;

    bit_vector_type sent{};
    bit_vector_type received{};

    // set only when the request named a channel
    std::string channel{};
    size_t      hops{0};
};

using PROTOCOL_RECORD = std::variant<std::monostate,
                                     BB84_RECORD,
                                     E91_RECORD,
                                     TELEPORT_RECORD,
                                     ENTANGLE_RECORD,
                                     PURIFY_RECORD,
                                     SWAP_RECORD,
                                     SUPERDENSE_RECORD,
                                     SEND_RECORD>;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

enum class RESULT_STATUS { COMPLETED, ABORTED, FAILED };

std::string_view to_string(RESULT_STATUS);

struct PROTOCOL_RESULT
{
    RESULT_STATUS             status{RESULT_STATUS::COMPLETED};
    std::optional<ERROR_KIND> error{};
    std::string               message{};

    /*
     * Failed runs may still carry a partial record (e.g., a QKD record
     * with the stage that was reached).
     * */
    PROTOCOL_RECORD record{};

    bool completed() const { return status == RESULT_STATUS::COMPLETED; }
};

/*
 * One-line human readable description, used by the execution log.
 * */
std::string summarize(const PROTOCOL_RESULT&);

std::string bits_to_string(const bit_vector_type&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_PROTOCOL_h

/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/protocol.h"

#include <iomanip>
#include <sstream>

namespace qnet
{

namespace
{

template <class T> struct always_false : std::false_type {};

std::string
fmt_double(double x)
{
    std::ostringstream strm;
    strm << std::fixed << std::setprecision(4) << x;
    return strm.str();
}

std::string
join(const std::vector<std::string>& v, std::string_view sep)
{
    std::string out;
    for (size_t i = 0; i < v.size(); i++)
    {
        if (i > 0)
            out += sep;
        out += v[i];
    }
    return out;
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
to_string(ENTANGLEMENT_KIND k)
{
    switch (k)
    {
    case ENTANGLEMENT_KIND::BELL:
        return "bell";
    case ENTANGLEMENT_KIND::GHZ:
        return "ghz";
    case ENTANGLEMENT_KIND::CLUSTER:
        return "cluster";
    }
    return "unknown";
}

ENTANGLEMENT_KIND
entanglement_kind_from_string(std::string_view s)
{
    if (s == "bell")
        return ENTANGLEMENT_KIND::BELL;
    if (s == "ghz")
        return ENTANGLEMENT_KIND::GHZ;
    if (s == "cluster")
        return ENTANGLEMENT_KIND::CLUSTER;
    throw_configuration_error("entanglement_kind_from_string: unknown entanglement kind -- " + std::string{s});
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
protocol_name(size_t idx)
{
    constexpr std::string_view NAMES[] = {"bb84", "e91", "teleport", "entangle", "purify", "swap", "superdense", "send"};
    static_assert(sizeof(NAMES)/sizeof(NAMES[0]) == PROTOCOL_KIND_COUNT);
    return idx < PROTOCOL_KIND_COUNT ? NAMES[idx] : "unknown";
}

std::string_view
protocol_name(const PROTOCOL_INVOCATION& inv)
{
    return protocol_name(inv.index());
}

std::string_view
to_string(QKD_STAGE s)
{
    switch (s)
    {
    case QKD_STAGE::PREPARING:
        return "preparing";
    case QKD_STAGE::TRANSMITTING:
        return "transmitting";
    case QKD_STAGE::MEASURING:
        return "measuring";
    case QKD_STAGE::SIFTING:
        return "sifting";
    case QKD_STAGE::ERROR_ESTIMATION:
        return "error_estimation";
    case QKD_STAGE::KEY_ACCEPTED:
        return "key_accepted";
    case QKD_STAGE::ABORTED:
        return "aborted";
    }
    return "unknown";
}

std::string_view
to_string(RESULT_STATUS s)
{
    switch (s)
    {
    case RESULT_STATUS::COMPLETED:
        return "completed";
    case RESULT_STATUS::ABORTED:
        return "aborted";
    case RESULT_STATUS::FAILED:
        return "failed";
    }
    return "unknown";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
bits_to_string(const bit_vector_type& bits)
{
    std::string out;
    out.reserve(bits.size());
    for (uint8_t b : bits)
        out.push_back(b ? '1' : '0');
    return out;
}

std::string
summarize(const PROTOCOL_RESULT& r)
{
    std::ostringstream strm;
    strm << to_string(r.status);
    if (r.error.has_value())
        strm << " [" << to_string(*r.error) << "]";

    std::visit([&strm] (const auto& rec)
    {
        using T = std::decay_t<decltype(rec)>;
        if constexpr (std::is_same_v<T, std::monostate>)
        {
        }
        else if constexpr (std::is_same_v<T, BB84_RECORD>)
        {
            strm << " bb84 " << rec.alice << " -> " << rec.bob
                << " raw=" << rec.raw_length
                << " sifted=" << rec.sifted_length
                << " final=" << rec.final_length
                << " qber=" << fmt_double(rec.qber)
                << " stage=" << to_string(rec.stage)
                << " hops=" << rec.hops;
        }
        else if constexpr (std::is_same_v<T, E91_RECORD>)
        {
            strm << " e91 " << rec.alice << " -> " << rec.bob
                << " pairs=" << rec.pairs_created
                << " key=" << rec.key_length
                << " correlation=" << fmt_double(rec.correlation)
                << " matched=" << fmt_double(rec.matched_correlation)
                << " hops=" << rec.hops;
        }
        else if constexpr (std::is_same_v<T, TELEPORT_RECORD>)
        {
            strm << " teleport " << rec.source_qubit << "@" << rec.source
                << " -> " << rec.target_qubit << "@" << rec.target
                << " via " << rec.pair
                << " bsm=" << rec.bell_measurement
                << " bits=" << int(rec.classical_bits[0]) << int(rec.classical_bits[1])
                << " fidelity=" << fmt_double(rec.fidelity)
                << " pair_fidelity=" << fmt_double(rec.pair_fidelity)
                << " hops=" << rec.hops;
        }
        else if constexpr (std::is_same_v<T, ENTANGLE_RECORD>)
        {
            strm << " entangle " << to_string(rec.kind)
                << " nodes=" << join(rec.nodes, ",");
            if (!rec.pairs.empty())
                strm << " pairs=" << join(rec.pairs, ",");
            if (!rec.qubits.empty())
                strm << " qubits=" << join(rec.qubits, ",");
            strm << " min_fidelity=" << fmt_double(rec.min_fidelity)
                << " meets_threshold=" << (rec.meets_threshold ? "yes" : "no")
                << (rec.purified ? " purified" : "");
        }
        else if constexpr (std::is_same_v<T, PURIFY_RECORD>)
        {
            strm << " purify " << rec.initial_pairs << " -> " << rec.final_pairs
                << " rounds=" << rec.rounds_performed
                << " fidelity=" << fmt_double(rec.final_fidelity);
        }
        else if constexpr (std::is_same_v<T, SWAP_RECORD>)
        {
            strm << " swap " << rec.qubit_a << "," << rec.qubit_b
                << " -> " << rec.new_pair << " (" << rec.endpoint_a << "-" << rec.endpoint_b << ")"
                << " bsm=" << rec.bell_measurement
                << " fidelity=" << fmt_double(rec.fidelity)
                << (rec.corrected ? "" : " uncorrected");
        }
        else if constexpr (std::is_same_v<T, SUPERDENSE_RECORD>)
        {
            strm << " superdense " << rec.sender << " -> " << rec.receiver
                << " via " << rec.pair
                << " sent=" << int(rec.sent_bits[0]) << int(rec.sent_bits[1])
                << " decoded=" << int(rec.decoded_bits[0]) << int(rec.decoded_bits[1])
                << " pair_fidelity=" << fmt_double(rec.pair_fidelity)
                << " hops=" << rec.hops
                << (rec.success ? "" : " mismatch");
        }
        else if constexpr (std::is_same_v<T, SEND_RECORD>)
        {
            strm << " send " << rec.source << " -> " << rec.destination
                << " bits=" << bits_to_string(rec.sent)
                << " received=" << bits_to_string(rec.received);
            if (!rec.channel.empty())
                strm << " channel=" << rec.channel;
            strm << " hops=" << rec.hops;
        }
        else
        {
            static_assert(always_false<T>::value, "unhandled record type");
        }
    }, r.record);

    if (!r.message.empty())
        strm << " -- " << r.message;
    return strm.str();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

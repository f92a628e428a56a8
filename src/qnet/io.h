/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_IO_h
#define QNET_IO_h

#include "qnet/engine.h"
#include "qnet/network.h"
#include "qnet/protocol.h"

#include <string>
#include <vector>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * A network and the protocols to run on it, in file order.
 * */
struct DECLARATION
{
    NETWORK_SPEC                     network{};
    std::vector<PROTOCOL_INVOCATION> invocations{};
};

/*
 * Line format (`#` starts a comment):
 *
 *  network <name> <mesh|star|ring|tree>
 *  node <id> <endpoint|repeater|router|server> <qubits> [memory=N] [coherence=T] [pos=x,y,z]
 *  link <source> <target> [distance=D] [loss=P]
 *  channel <id> [capacity=N] [fidelity=F] [bandwidth=B]
 *  bb84 <alice> <bob> <key_length> <threshold>
 *  e91 <alice> <bob> <key_length>
 *  teleport <source> <target> <qubit> [pair=<pair>]
 *  entangle <bell|ghz|cluster> <threshold> <node>... [purify]
 *  purify <target_fidelity> <rounds> <pair>...
 *  swap <qubit_a> <qubit_b> [nomeasure]
 *  superdense <sender> <receiver> <two bits> [pair=<pair>]
 *  send <source> <destination> <bits> [channel=<id>]
 *
 * A `channel` line attaches to the most recent `link`. Any malformed line
 * is a configuration error naming the line number.
 * */
DECLARATION parse_declaration(const std::vector<std::string>& lines);

/*
 * Reads a declaration from a plain, `.gz`, or `.xz` file.
 * */
DECLARATION read_declaration(std::string path);

/*
 * Writes one line per log entry to a plain or `.gz` file.
 * */
void write_execution_log(std::string path, const std::vector<EXECUTION_LOG_ENTRY>&);

std::string format_log_entry(const EXECUTION_LOG_ENTRY&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_IO_h

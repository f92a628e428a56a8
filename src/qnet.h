/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_h
#define QNET_h

#include "qnet/channel.h"
#include "qnet/config.h"
#include "qnet/engine.h"
#include "qnet/error.h"
#include "qnet/io.h"
#include "qnet/network.h"
#include "qnet/protocol.h"
#include "qnet/qkd.h"
#include "qnet/qubit.h"
#include "qnet/resource.h"
#include "qnet/routing.h"

#include <chrono>
#include <string>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Wall clock since `walltime_start()` was last called.
 * */
void        walltime_start();
std::string walltime();
double      walltime_s();

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_h

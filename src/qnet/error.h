/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#ifndef QNET_ERROR_h
#define QNET_ERROR_h

#include <stdexcept>
#include <string>
#include <string_view>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * `CAPACITY_EXCEEDED`, `TIMED_OUT`, and `SECURITY_ABORTED` are
 * normal outcomes of channel and QKD operations. They are never thrown
 * by the resource model or the topology builder, but the engine uses them
 * to label results.
 * */
enum class ERROR_KIND
{
    CONFIGURATION_ERROR,
    REFERENCE_ERROR,
    RESOURCE_ERROR,
    STATE_ERROR,
    CAPACITY_EXCEEDED,
    TIMED_OUT,
    SECURITY_ABORTED
};

std::string_view to_string(ERROR_KIND);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

class NETWORK_ERROR : public std::runtime_error
{
public:
    const ERROR_KIND kind;

    NETWORK_ERROR(ERROR_KIND, const std::string& msg);
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

[[noreturn]] void throw_configuration_error(const std::string&);
[[noreturn]] void throw_reference_error(const std::string&);
[[noreturn]] void throw_resource_error(const std::string&);
[[noreturn]] void throw_state_error(const std::string&);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

#endif  // QNET_ERROR_h

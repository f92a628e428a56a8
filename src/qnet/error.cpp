/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/error.h"

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string_view
to_string(ERROR_KIND k)
{
    switch (k)
    {
    case ERROR_KIND::CONFIGURATION_ERROR:
        return "ConfigurationError";
    case ERROR_KIND::REFERENCE_ERROR:
        return "ReferenceError";
    case ERROR_KIND::RESOURCE_ERROR:
        return "ResourceError";
    case ERROR_KIND::STATE_ERROR:
        return "StateError";
    case ERROR_KIND::CAPACITY_EXCEEDED:
        return "CapacityExceeded";
    case ERROR_KIND::TIMED_OUT:
        return "TimedOut";
    case ERROR_KIND::SECURITY_ABORTED:
        return "SecurityAborted";
    }
    return "UnknownError";
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NETWORK_ERROR::NETWORK_ERROR(ERROR_KIND _kind, const std::string& msg)
    :std::runtime_error(msg),
    kind(_kind)
{}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
throw_configuration_error(const std::string& msg)
{
    throw NETWORK_ERROR(ERROR_KIND::CONFIGURATION_ERROR, msg);
}

void
throw_reference_error(const std::string& msg)
{
    throw NETWORK_ERROR(ERROR_KIND::REFERENCE_ERROR, msg);
}

void
throw_resource_error(const std::string& msg)
{
    throw NETWORK_ERROR(ERROR_KIND::RESOURCE_ERROR, msg);
}

void
throw_state_error(const std::string& msg)
{
    throw NETWORK_ERROR(ERROR_KIND::STATE_ERROR, msg);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

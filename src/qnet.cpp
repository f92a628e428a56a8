/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet.h"

#include <sstream>

namespace qnet
{

namespace
{

std::chrono::steady_clock::time_point GL_WALL_START{std::chrono::steady_clock::now()};

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
walltime_start()
{
    GL_WALL_START = std::chrono::steady_clock::now();
}

std::string
walltime()
{
    double total_seconds = walltime_s();

    int minutes = static_cast<int>(total_seconds) / 60;
    double remaining_seconds = total_seconds - (minutes * 60);
    int seconds = static_cast<int>(remaining_seconds);
    int milliseconds = static_cast<int>((remaining_seconds - seconds) * 1000);

    std::ostringstream oss;
    oss << minutes << "m " << seconds << "s " << milliseconds << "ms";
    return oss.str();
}

double
walltime_s()
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - GL_WALL_START).count();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet

/*
 *  author: Suhas Vittal
 *  date:   4 January 2026
 * */

#ifndef GLOBALS_h
#define GLOBALS_h

#include <cstdint>
#include <iosfwd>
#include <random>
#include <string>
#include <string_view>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
 * Handles index into the dense arrays owned by `qnet::RESOURCE_MODEL`.
 * A handle is never reused, so a stale handle always refers to a
 * measured or released entry rather than to some other object.
 * */
using qubit_handle_type = int64_t;
using pair_handle_type =  int64_t;
using joint_handle_type = int64_t;

constexpr int64_t NO_HANDLE{-1};

using node_id_type = std::string;

/*
 * Simulated time is kept in nanoseconds.
 * */
using time_ns_type = uint64_t;

/*
 * Every source of randomness in the engine is a generator of this type
 * passed in by the caller.
 * */
using rng_type = std::mt19937_64;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> void print_stat_line(std::ostream&, std::string_view, T, bool indent=true);
template <class T, class U> double mean(T, U);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

#include "globals.tpp"

#endif  // GLOBALS_h

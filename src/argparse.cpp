/*
    author: Suhas Vittal
    date:   19 September 2025
*/

#include "argparse.h"

#include <algorithm>
#include <cctype>
#include <iostream>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

namespace
{

[[noreturn]] void
die_with_error(std::string msg, const std::string& usage)
{
    std::cerr << usage << "\n";
    throw std::invalid_argument("ARGPARSE::parse: " + msg);
}

template <class T> T
read_number(std::string_view name, const std::string& arg)
{
    try
    {
        size_t pos;
        T x;
        if constexpr (std::is_same<T, int64_t>::value)
            x = std::stoll(arg, &pos);
        else if constexpr (std::is_same<T, uint64_t>::value)
        {
            if (!arg.empty() && arg.front() == '-')
                throw std::invalid_argument(arg);
            x = std::stoull(arg, &pos);
        }
        else
            x = std::stod(arg, &pos);

        if (pos != arg.size())
            throw std::invalid_argument(arg);
        return x;
    }
    catch (const std::logic_error&)
    {
        // both std::invalid_argument and std::out_of_range
        throw std::invalid_argument("ARGPARSE: bad value for `" + std::string{name} + "` -- " + arg);
    }
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
ARGPARSE::usage(std::string_view program_name) const
{
    return "usage: " + std::string{program_name} + usage_strm.str() + " [options]"
            + "\n\nOPTIONS ---------------------------------------\n"
            + options_strm.str();
}

bool
ARGPARSE::parse(int argc, char** argv)
{
    const std::string usage_string = usage(argc > 0 ? argv[0] : "qnet");

    size_t required_idx{0};
    for (int i = 1; i < argc; ++i)
    {
        std::string x{argv[i]};
        if (x.empty())
            die_with_error("empty argument", usage_string);

        if (x == "-h" || x == "--help")
        {
            std::cout << usage_string << "\n";
            return false;
        }

        if (required_idx < required_arguments.size())
        {
            const auto& [name, description, ptr, type] = required_arguments[required_idx];
            if (x.front() == '-' && x.size() > 1 && !std::isdigit(static_cast<unsigned char>(x[1])))
            {
                die_with_error("expected required argument `"
                                        + std::string{name} + "` but got option `" + x + "`", usage_string);
            }

            read_argument_and_write_to_ptr(name, x, ptr, type);
            required_idx++;
        }
        else
        {
            if (x.front() != '-' || x.size() < 2)
                die_with_error("expected optional argument but got `" + x + "`", usage_string);

            bool is_option = (x[1] == '-');

            auto opt_it = std::find_if(optional_arguments.begin(), optional_arguments.end(),
                                        [&x, is_option] (const auto& arg)
                                        {
                                            return is_option ? arg.full_name == x : arg.flag_name == x;
                                        });
            if (opt_it == optional_arguments.end())
                die_with_error("unknown optional argument: " + x, usage_string);

            const auto& [flag_name, full_name, description, ptr, type] = *opt_it;
            if (type == ARGPARSE::TYPE_INFO::FLAG)
            {
                *static_cast<bool*>(ptr) = true;
            }
            else
            {
                if (i+1 >= argc)
                    die_with_error("option `" + x + "` expects a value", usage_string);
                read_argument_and_write_to_ptr(x, std::string{argv[++i]}, ptr, type);
            }
        }
    }

    if (required_idx < required_arguments.size())
    {
        die_with_error("expected "
                + std::to_string(required_arguments.size() - required_idx) + " more required arguments",
                usage_string);
    }
    return true;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
read_argument_and_write_to_ptr(std::string_view name, std::string arg, void* ptr, ARGPARSE::TYPE_INFO type)
{
    switch (type)
    {
    case ARGPARSE::TYPE_INFO::STRING:
        *static_cast<std::string*>(ptr) = arg;
        break;

    case ARGPARSE::TYPE_INFO::INT:
        *static_cast<int64_t*>(ptr) = read_number<int64_t>(name, arg);
        break;

    case ARGPARSE::TYPE_INFO::UINT:
        *static_cast<uint64_t*>(ptr) = read_number<uint64_t>(name, arg);
        break;

    case ARGPARSE::TYPE_INFO::FLOAT:
        *static_cast<double*>(ptr) = read_number<double>(name, arg);
        break;

    case ARGPARSE::TYPE_INFO::FLAG:
        throw std::logic_error("read_argument_and_write_to_ptr: flags take no value -- " + std::string{name});
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

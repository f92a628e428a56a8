/*
    author: Suhas Vittal
    date:   5 September 2025
*/

#ifndef ARGPARSE_h
#define ARGPARSE_h

#include <cstdint>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <vector>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

/*
    Builder-style command line parser:

        ARGPARSE()
            .required("decl", "network declaration file", decl_file)
            .optional("-s", "--seed", "rng seed", seed, 0)
            .parse(argc, argv);

    All required arguments come first, in order. Errors are thrown as
    `std::invalid_argument` after the usage string is printed to stderr.
*/
class ARGPARSE
{
public:
    enum class TYPE_INFO { STRING, INT, UINT, FLOAT, FLAG };

    struct required_argument_type
    {
        std::string_view name;
        std::string_view description;
        void*            ptr;
        TYPE_INFO        type;
    };

    struct optional_argument_type
    {
        std::string_view flag_name{""};  // i.e., '-v'
        std::string_view full_name{""};  // i.e., '--verbose'
        std::string_view description;
        void*            ptr;
        TYPE_INFO        type;
    };
private:
    std::vector<required_argument_type> required_arguments;
    std::vector<optional_argument_type> optional_arguments;

    std::stringstream usage_strm;
    std::stringstream options_strm;
public:
    ARGPARSE() =default;

    template <class T> ARGPARSE& required(std::string_view name, std::string_view description, T& ref);
    template <class T, class DT> ARGPARSE& optional(std::string_view flag_name, std::string_view full_name,
                                            std::string_view description, T& ref, DT default_value);

    /*
        Returns false if help was requested (the usage string has then
        been printed to stdout and nothing else was read).
    */
    bool parse(int argc, char** argv);

    std::string usage(std::string_view program_name) const;
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void read_argument_and_write_to_ptr(std::string_view name, std::string arg, void*, ARGPARSE::TYPE_INFO);

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> constexpr ARGPARSE::TYPE_INFO
argparse_get_type_info()
{
    if constexpr (std::is_same<T, std::string>::value)
        return ARGPARSE::TYPE_INFO::STRING;
    else if constexpr (std::is_same<T, int64_t>::value)
        return ARGPARSE::TYPE_INFO::INT;
    else if constexpr (std::is_same<T, uint64_t>::value)
        return ARGPARSE::TYPE_INFO::UINT;
    else if constexpr (std::is_same<T, double>::value)
        return ARGPARSE::TYPE_INFO::FLOAT;
    else
        return ARGPARSE::TYPE_INFO::FLAG;
}

template <class T> constexpr std::string_view
argparse_type_name()
{
    if constexpr (std::is_same<T, std::string>::value)
        return "string";
    else if constexpr (std::is_same<T, int64_t>::value)
        return "int";
    else if constexpr (std::is_same<T, uint64_t>::value)
        return "uint";
    else if constexpr (std::is_same<T, double>::value)
        return "float";
    else
        return "bool";
}

template <class T> constexpr void
argparse_check_valid_type()
{
    constexpr bool type_is_ok = std::is_same<T, std::string>::value
                                || std::is_same<T, int64_t>::value
                                || std::is_same<T, uint64_t>::value
                                || std::is_same<T, double>::value
                                || std::is_same<T, bool>::value;
    static_assert(type_is_ok,
        "invalid type for argparse, only valid types are std::string, int64_t, uint64_t, double, and bool");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

template <class T> ARGPARSE&
ARGPARSE::required(std::string_view name, std::string_view description, T& ref)
{
    if (optional_arguments.size() > 0)
        throw std::logic_error("ARGPARSE::required: required arguments must be added before optional arguments");

    argparse_check_valid_type<T>();
    static_assert(!std::is_same<T, bool>::value, "a required argument cannot be a flag");

    required_arguments.push_back({name, description, static_cast<void*>(&ref), argparse_get_type_info<T>()});

    usage_strm << " <" << name << ">";
    options_strm << "  " << std::setw(28) << std::left << name
                << std::setw(48) << std::left << description
                << std::setw(8) << std::left << argparse_type_name<T>()
                << "required\n";

    return *this;
}

template <class T, class DT> ARGPARSE&
ARGPARSE::optional(std::string_view flag_name,
                        std::string_view full_name,
                        std::string_view description,
                        T& ref,
                        DT default_value)
{
    argparse_check_valid_type<T>();

    ref = static_cast<T>(default_value);
    optional_arguments.push_back({flag_name, full_name, description, static_cast<void*>(&ref),
                                    argparse_get_type_info<T>()});

    std::string name_string;
    if (flag_name.empty())
        name_string = std::string{full_name};
    else if (full_name.empty())
        name_string = std::string{flag_name};
    else
        name_string = std::string{flag_name} + ", " + std::string{full_name};

    options_strm << "  " << std::setw(28) << std::left << name_string
                << std::setw(48) << std::left << description
                << std::setw(8) << std::left << argparse_type_name<T>();
    if constexpr (std::is_same<T, bool>::value)
        options_strm << "flag\n";
    else
        options_strm << "default: " << ref << "\n";

    return *this;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

#endif  // ARGPARSE_h

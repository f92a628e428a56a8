/*
 *  author: Suhas Vittal
 *  date:   5 January 2026
 * */

#include <iomanip>
#include <iostream>
#include <type_traits>

template <class T> void
print_stat_line(std::ostream& out, std::string_view name, T value, bool indent)
{
    if (indent)
        out << "   ";
    out << std::setw(52) << std::left << name << " : ";
    if constexpr (std::is_floating_point<T>::value)
    {
        auto flags = out.flags();
        auto prec = out.precision();
        out << std::setw(12) << std::right << std::fixed << std::setprecision(4) << value;
        out.flags(flags);
        out.precision(prec);
    }
    else
        out << std::setw(12) << std::right << value;
    out << "\n";
}

template <class T, class U> double
mean(T x, U y)
{
    if (y == 0)
        return 0.0;
    return static_cast<double>(x) / static_cast<double>(y);
}

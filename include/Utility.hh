/** \file
 *
 * \brief Definition of general purpose utilities
 *
 * Although the utilities in this do not depend on any other classes or
 * functions inside the Coup namespace, the functions are still inside the
 * namespace to avoid name conflicts.
 */

#ifndef UTILITY_HH_
#define UTILITY_HH_

#include <concepts>
#include <stdexcept>
#include <ranges>

namespace Coup {

/** \brief Range over integers
 *
 * Generate an increasing range over integers from zero to \p n
 * (exclusive). This can be used in ranged for
 *
 * \code{.cc}
 * for (const auto i : to(N_CARDS_PER_PLAYER)) {
 *     std::cout << i << std::endl;
 * }
 * \endcode
 *
 * \param n the upper bound of the range
 *
 * \return A range from 0 to \p n (exclusive upper bound)
 *
 * \throw std::invalid_argument if \p n < 0
 */
template<std::integral Integer>
constexpr auto to(Integer n)
{
    if (n < Integer {}) {
        throw std::invalid_argument {"Invalid integer range"};
    }
    return std::ranges::views::iota(Integer {}, n);
}

}

#endif // UTILITY_HH_

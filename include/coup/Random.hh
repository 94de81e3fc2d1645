/** \file
 *
 * \brief The common random number generator
 */

#ifndef RANDOM_HH_
#define RANDOM_HH_

#include <random>

namespace Coup {

/** \brief The preferred random number generator for the Coup project
 */
using Rng = std::mt19937;

/** \brief Get reference to the global random number generator
 *
 * The generator is seeded from the OS random number source. Reproducibility
 * of shuffles is not supported.
 *
 * \return Reference to the global random number generator
 */
Rng& getRng();

}

#endif // RANDOM_HH_

/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * IMPORTANT: gsl-lite is a PRIVATE dependency of vcxbridge.
 *            Include this header from .cpp files only; never from
 *            headers under include/vcxbridge/.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace vcxbridge {

/**
 * @brief Scoped alias for the gsl-lite v1 namespace.
 */
namespace gsl = ::gsl_lite;

} // namespace vcxbridge

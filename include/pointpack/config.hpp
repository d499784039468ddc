/**
 * @file config.hpp
 * @brief pointpack compile-time configuration.
 *
 * Bit-field codec for point-cloud record batches: sub-fields sharing the
 * bits of a composed container field are unpacked into their own columns
 * and repacked into the container using per-sub-field bit masks.
 */

#ifndef POINTPACK_CONFIG_HPP
#define POINTPACK_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace pointpack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Mask type. Wide enough for the largest supported container element.
using mask_t = std::uint64_t;

/// Widest container element, in bits
inline constexpr std::size_t MAX_CONTAINER_BITS = 64U;

/// Sentinel for "no such column/field"
inline constexpr std::size_t NPOS = static_cast<std::size_t>(-1);

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define POINTPACK_NO_EXCEPTIONS=1 to drop the exception types and the
 * throwing convenience overloads. The Error-returning API is always built.
 * @{
 */
#ifndef POINTPACK_NO_EXCEPTIONS
#define POINTPACK_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @defgroup masks Mask Validation
 *
 * Define POINTPACK_ALLOW_OVERLAPPING_MASKS=1 to let PointFormat::create
 * accept composed fields whose sub-field masks overlap. Repack order then
 * decides which sub-field owns the shared bits.
 * @{
 */
#ifndef POINTPACK_ALLOW_OVERLAPPING_MASKS
#define POINTPACK_ALLOW_OVERLAPPING_MASKS 0
#endif
/** @} */

} // namespace pointpack

#endif // POINTPACK_CONFIG_HPP

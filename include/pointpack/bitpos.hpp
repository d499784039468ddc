/**
 * @file bitpos.hpp
 * @brief Bit position helpers for sub-field masks.
 *
 * A sub-field is addressed by a mask over its container value. The shift
 * of a sub-field is the index of the lowest set bit of its mask; the
 * largest value it can hold is mask >> shift.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = LSB of the container value
 * - Masks are expressed in the container's native value, not in bytes
 */

#ifndef POINTPACK_BITPOS_HPP
#define POINTPACK_BITPOS_HPP

#include "config.hpp"
#include "error.hpp"

namespace pointpack {

namespace detail {

/**
 * @brief Index of the lowest set bit, without checking for zero.
 *
 * @warning Caller must ensure mask != 0.
 */
inline unsigned lsb_unchecked(mask_t mask) noexcept {
    return static_cast<unsigned>(__builtin_ctzll(mask));
}

/**
 * @brief Index of the highest set bit, without checking for zero.
 *
 * @warning Caller must ensure mask != 0.
 */
inline unsigned msb_unchecked(mask_t mask) noexcept {
    return 63U - static_cast<unsigned>(__builtin_clzll(mask));
}

} // namespace detail

/**
 * @brief Resolve the shift of a mask (index of its lowest set bit).
 *
 * @param mask Sub-field mask
 * @param[out] shift Lowest set bit index (0-63)
 * @return Error::Ok on success, Error::InvalidMask if mask is zero
 */
inline Error lowest_set_bit(mask_t mask, unsigned& shift) noexcept {
    if (mask == 0) [[unlikely]] {
        return Error::InvalidMask;
    }
    shift = detail::lsb_unchecked(mask);
    return Error::Ok;
}

/**
 * @brief Largest value a sub-field can hold under a mask.
 *
 * @param mask Sub-field mask (nonzero)
 * @param shift Shift resolved from the same mask
 * @return mask >> shift
 */
[[nodiscard]] constexpr mask_t max_value(mask_t mask, unsigned shift) noexcept {
    return mask >> shift;
}

/**
 * @brief Number of bits from the lowest to the highest set bit of a mask.
 *
 * Equals the population count for contiguous masks.
 *
 * @param mask Sub-field mask
 * @return Bit span, 0 for a zero mask
 */
[[nodiscard]] inline unsigned bit_span(mask_t mask) noexcept {
    if (mask == 0) {
        return 0;
    }
    return detail::msb_unchecked(mask) - detail::lsb_unchecked(mask) + 1U;
}

/**
 * @brief Check that a mask only addresses bits of a container.
 *
 * @param mask Sub-field mask
 * @param container_bits Container element width in bits
 * @return true if no bit at or above container_bits is set
 */
[[nodiscard]] constexpr bool mask_fits(mask_t mask, std::size_t container_bits) noexcept {
    if (container_bits >= MAX_CONTAINER_BITS) {
        return true;
    }
    return (mask >> container_bits) == 0;
}

} // namespace pointpack

#endif // POINTPACK_BITPOS_HPP

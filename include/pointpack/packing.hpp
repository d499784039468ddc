/**
 * @file packing.hpp
 * @brief Mask-driven sub-field extraction and injection.
 *
 * Implements the two primitives every composed field is built from:
 * - unpack: result[i] = (source[i] & mask) >> shift
 * - pack:   dest[i] = (dest[i] & ~mask) | ((value[i] << shift) & mask)
 *
 * shift is the lowest set bit of mask. Container elements are processed
 * through their unsigned representation, so signed containers keep their
 * exact bit pattern. Sub-field value columns are always unsigned.
 *
 * Packing validates the whole value column before writing anything: a
 * value above mask >> shift fails with Error::RangeViolation and leaves the
 * destination untouched.
 */

#ifndef POINTPACK_PACKING_HPP
#define POINTPACK_PACKING_HPP

#include "bitpos.hpp"
#include "config.hpp"
#include "error.hpp"
#include "record_batch.hpp"

#include <type_traits>
#include <vector>

namespace pointpack {

namespace detail {

template <typename T>
inline constexpr bool is_container_v = std::is_integral_v<T> && !std::is_same_v<T, bool>;

template <typename T>
inline constexpr bool is_sub_field_v = is_container_v<T> && std::is_unsigned_v<T>;

/**
 * @brief Resolve and check a mask against a container type.
 */
template <typename Container> inline Error resolve_mask(mask_t mask, unsigned& shift) noexcept {
    auto result = lowest_set_bit(mask, shift);
    if (result != Error::Ok) {
        return result;
    }
    if (!mask_fits(mask, sizeof(Container) * 8U)) {
        return Error::InvalidMask;
    }
    return Error::Ok;
}

/**
 * @brief Maximum of a value column (0 for an empty column).
 *
 * Single reduction pass; no early exit so the loop stays branch-free.
 */
template <typename Sub> inline Sub column_max(const Sub* values, std::size_t count) noexcept {
    Sub max = 0;
    for (std::size_t i = 0; i < count; ++i) {
        max = values[i] > max ? values[i] : max;
    }
    return max;
}

/**
 * @brief Validate a value column against a mask's maximum value.
 */
template <typename Sub>
inline Error check_range(const Sub* values, std::size_t count, mask_t mask, unsigned shift,
                         RangeError* range) noexcept {
    const mask_t max_allowed = max_value(mask, shift);
    const auto max = static_cast<mask_t>(column_max(values, count));
    if (max > max_allowed) {
        if (range != nullptr) {
            range->value = max;
            range->max_allowed = max_allowed;
        }
        return Error::RangeViolation;
    }
    return Error::Ok;
}

/**
 * @brief Write values into the masked bits of in, storing into out.
 *
 * in and out may alias. Values must already be range-checked.
 */
template <typename Dst, typename Sub>
inline void inject(const Dst* in, Dst* out, const Sub* values, std::size_t count, mask_t mask,
                   unsigned shift) noexcept {
    using UDst = std::make_unsigned_t<Dst>;
    const auto keep = static_cast<UDst>(~mask);
    for (std::size_t i = 0; i < count; ++i) {
        const auto bits = static_cast<UDst>((static_cast<mask_t>(values[i]) << shift) & mask);
        out[i] = static_cast<Dst>(static_cast<UDst>(static_cast<UDst>(in[i]) & keep) | bits);
    }
}

} // namespace detail

/**
 * @brief Extract a sub-field from a container column.
 *
 * Narrowing into a Dst smaller than mask >> shift truncates silently;
 * picking a wide enough Dst is the caller's responsibility.
 *
 * @tparam Dst Sub-field element type
 * @tparam Src Container element type
 * @param source Container column
 * @param count Number of elements
 * @param mask Sub-field mask
 * @param[out] result Sub-field column (count elements)
 * @return Error::Ok on success, Error::InvalidMask if mask is zero or
 *         addresses bits outside Src
 */
template <typename Dst, typename Src>
Error unpack(const Src* source, std::size_t count, mask_t mask, Dst* result) noexcept {
    static_assert(detail::is_container_v<Src>, "container must be an integer type");
    static_assert(detail::is_container_v<Dst>, "sub-field must be an integer type");

    unsigned shift = 0;
    auto err = detail::resolve_mask<Src>(mask, shift);
    if (err != Error::Ok) {
        return err;
    }

    using USrc = std::make_unsigned_t<Src>;
    for (std::size_t i = 0; i < count; ++i) {
        result[i] = static_cast<Dst>((static_cast<mask_t>(static_cast<USrc>(source[i])) & mask) >>
                                     shift);
    }
    return Error::Ok;
}

/**
 * @brief Pack a sub-field into a container column in place.
 *
 * Only the masked bits of dest change. On failure dest is untouched.
 *
 * @param[in,out] dest Container column
 * @param values Sub-field values
 * @param count Number of elements in both columns
 * @param mask Sub-field mask
 * @param[out] range Offending value and allowed maximum on Error::RangeViolation
 * @return Error::Ok, Error::InvalidMask or Error::RangeViolation
 */
template <typename Dst, typename Sub>
Error pack_into(Dst* dest, const Sub* values, std::size_t count, mask_t mask,
                RangeError* range = nullptr) noexcept {
    static_assert(detail::is_container_v<Dst>, "container must be an integer type");
    static_assert(detail::is_sub_field_v<Sub>, "sub-field must be an unsigned integer type");

    unsigned shift = 0;
    auto err = detail::resolve_mask<Dst>(mask, shift);
    if (err != Error::Ok) {
        return err;
    }
    err = detail::check_range(values, count, mask, shift, range);
    if (err != Error::Ok) {
        return err;
    }

    detail::inject(dest, dest, values, count, mask, shift);
    return Error::Ok;
}

/**
 * @brief Pack a sub-field into a copy of a container column.
 *
 * dest is never modified; the packed column is written to result.
 * Produces the same bits as pack_into() on the same inputs.
 *
 * @param dest Container column
 * @param values Sub-field values
 * @param count Number of elements in all columns
 * @param mask Sub-field mask
 * @param[out] result Packed container column (count elements)
 * @param[out] range Offending value and allowed maximum on Error::RangeViolation
 * @return Error::Ok, Error::InvalidMask or Error::RangeViolation
 */
template <typename Dst, typename Sub>
Error pack(const Dst* dest, const Sub* values, std::size_t count, mask_t mask, Dst* result,
           RangeError* range = nullptr) noexcept {
    static_assert(detail::is_container_v<Dst>, "container must be an integer type");
    static_assert(detail::is_sub_field_v<Sub>, "sub-field must be an unsigned integer type");

    unsigned shift = 0;
    auto err = detail::resolve_mask<Dst>(mask, shift);
    if (err != Error::Ok) {
        return err;
    }
    err = detail::check_range(values, count, mask, shift, range);
    if (err != Error::Ok) {
        return err;
    }

    detail::inject(dest, result, values, count, mask, shift);
    return Error::Ok;
}

/**
 * @defgroup column_packing Column-level packing
 *
 * Same primitives on type-erased Columns, dispatching on their DType.
 * Containers may be any integer DType, sub-field columns any unsigned one;
 * other types fail with Error::InvalidArg, as do columns of different
 * lengths.
 * @{
 */

/**
 * @brief Extract a sub-field column.
 *
 * @param source Container column
 * @param mask Sub-field mask
 * @param[out] result Preallocated sub-field column, same length as source;
 *             its dtype selects the target type
 */
Error unpack_column(const Column& source, mask_t mask, Column& result);

/**
 * @brief Pack a sub-field column into a container column in place.
 */
Error pack_column_into(Column& dest, const Column& values, mask_t mask,
                       RangeError* range = nullptr);

/**
 * @brief Pack a sub-field column into a new copy of a container column.
 *
 * @param[out] result Replaced by a column of dest's dtype and length on
 *             success, untouched on failure
 */
Error pack_column(const Column& dest, const Column& values, mask_t mask, Column& result,
                  RangeError* range = nullptr);

/** @} */

#if !POINTPACK_NO_EXCEPTIONS

namespace detail {

[[noreturn]] inline void throw_pack_error(Error err, const RangeError& range) {
    ErrorDetail info;
    info.code = err;
    info.value = range.value;
    info.max_allowed = range.max_allowed;
    throw_error(info);
}

} // namespace detail

/**
 * @brief Extract a sub-field into a new vector.
 * @throws InvalidMaskException
 */
template <typename Dst = std::uint8_t, typename Src>
std::vector<Dst> unpack(const std::vector<Src>& source, mask_t mask) {
    std::vector<Dst> result(source.size());
    auto err = unpack(source.data(), source.size(), mask, result.data());
    if (err != Error::Ok) {
        detail::throw_pack_error(err, RangeError{});
    }
    return result;
}

/**
 * @brief Pack a sub-field into a new copy of a container vector.
 * @throws InvalidArgumentException, InvalidMaskException, RangeViolationException
 */
template <typename Dst, typename Sub>
std::vector<Dst> pack(const std::vector<Dst>& dest, const std::vector<Sub>& values, mask_t mask) {
    if (dest.size() != values.size()) {
        throw InvalidArgumentException("pack: column lengths differ");
    }
    std::vector<Dst> result(dest.size());
    RangeError range;
    auto err = pack(dest.data(), values.data(), dest.size(), mask, result.data(), &range);
    if (err != Error::Ok) {
        detail::throw_pack_error(err, range);
    }
    return result;
}

/**
 * @brief Pack a sub-field into a container vector in place.
 * @throws InvalidArgumentException, InvalidMaskException, RangeViolationException
 */
template <typename Dst, typename Sub>
void pack_into(std::vector<Dst>& dest, const std::vector<Sub>& values, mask_t mask) {
    if (dest.size() != values.size()) {
        throw InvalidArgumentException("pack_into: column lengths differ");
    }
    RangeError range;
    auto err = pack_into(dest.data(), values.data(), dest.size(), mask, &range);
    if (err != Error::Ok) {
        detail::throw_pack_error(err, range);
    }
}

#endif // !POINTPACK_NO_EXCEPTIONS

} // namespace pointpack

#endif // POINTPACK_PACKING_HPP

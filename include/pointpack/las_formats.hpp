/**
 * @file las_formats.hpp
 * @brief Standard LAS point data record formats.
 *
 * Point formats 0-10 of the ASPRS LAS 1.4 specification (R15), with their
 * composed fields:
 *
 * | Formats | Composed field         | Sub-fields                                   |
 * |---------|------------------------|----------------------------------------------|
 * | 0-5     | bit_fields             | return_number, number_of_returns,            |
 * |         |                        | scan_direction_flag, edge_of_flight_line     |
 * | 0-5     | raw_classification     | classification, synthetic, key_point,        |
 * |         |                        | withheld                                     |
 * | 6-10    | bit_fields             | return_number, number_of_returns             |
 * | 6-10    | classification_flags   | synthetic, key_point, withheld, overlap,     |
 * |         |                        | scanner_channel, scan_direction_flag,        |
 * |         |                        | edge_of_flight_line                          |
 *
 * @see https://www.asprs.org/wp-content/uploads/2019/07/LAS_1_4_r15.pdf
 */

#ifndef POINTPACK_LAS_FORMATS_HPP
#define POINTPACK_LAS_FORMATS_HPP

#include "config.hpp"
#include "error.hpp"
#include "point_format.hpp"

namespace pointpack {

/// Number of LAS point formats known to las_point_format()
inline constexpr int LAS_POINT_FORMAT_COUNT = 11;

/**
 * @brief Get the descriptor of a LAS point format.
 *
 * @param id Point format id (0-10)
 * @param[out] format Resolved point format
 * @return Error::Ok on success, Error::InvalidArg for unknown ids
 */
Error las_point_format(int id, PointFormat& format);

/**
 * @brief Number of LAS point formats supported.
 */
[[nodiscard]] constexpr int las_point_format_count() noexcept {
    return LAS_POINT_FORMAT_COUNT;
}

#if !POINTPACK_NO_EXCEPTIONS
/**
 * @brief Throwing variant of las_point_format().
 * @throws InvalidArgumentException for unknown ids
 */
PointFormat las_point_format(int id);
#endif

} // namespace pointpack

#endif // POINTPACK_LAS_FORMATS_HPP

/**
 * @file pointpack.hpp
 * @brief High-level pointpack API.
 *
 * Single include for the whole library: element types, record batches,
 * point formats, the packing primitives and the batch-level codec.
 *
 * Typical read path:
 * @code
 * PointFormat format;
 * las_point_format(6, format);
 * RecordBatch physical;
 * RecordBatch::from_records(format.physical_schema(), bytes, size, physical);
 * RecordBatch expanded;
 * if (unpack_sub_fields(physical, format, expanded) != Error::Ok) { ... }
 * @endcode
 */

#ifndef POINTPACK_HPP
#define POINTPACK_HPP

#include "bitpos.hpp"
#include "config.hpp"
#include "dtype.hpp"
#include "error.hpp"
#include "las_formats.hpp"
#include "packing.hpp"
#include "point_format.hpp"
#include "record_batch.hpp"
#include "record_codec.hpp"

namespace pointpack {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace pointpack

#endif // POINTPACK_HPP

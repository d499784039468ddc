/**
 * @file record_codec.hpp
 * @brief Batch-level unpacking and repacking of composed fields.
 *
 * - unpack_sub_fields(): physical batch -> expanded batch
 * - repack_sub_fields(): expanded batch -> physical batch
 *
 * Both produce a fresh zero-initialised batch with the same number of
 * records in the same order. Plain fields are copied byte for byte.
 *
 * @par Schema binding
 * The input batch must hold exactly the fields of the format's input
 * schema (physical for unpack, expanded for repack), by name and element
 * type, in any order, and every column must hold num_records() elements
 * of that type. Anything else fails with Error::SchemaMismatch before the
 * output is touched.
 *
 * @par Repack failure
 * Sub-fields are packed in declared order. If one is out of range the
 * call stops with Error::RangeViolation and the partial batch is still
 * handed back: fields before the failing composed field keep their
 * values, the failing composed column and every field after it are zero.
 */

#ifndef POINTPACK_RECORD_CODEC_HPP
#define POINTPACK_RECORD_CODEC_HPP

#include "config.hpp"
#include "error.hpp"
#include "point_format.hpp"
#include "record_batch.hpp"

namespace pointpack {

/**
 * @brief Expand every composed field of a physical batch into sub-fields.
 *
 * @param physical Batch in the format's physical schema
 * @param format Point format
 * @param[out] expanded Batch in the format's expanded schema
 * @param[out] detail Offending field on failure
 * @return Error::Ok or Error::SchemaMismatch
 */
Error unpack_sub_fields(const RecordBatch& physical, const PointFormat& format,
                        RecordBatch& expanded, ErrorDetail* detail = nullptr);

/**
 * @brief Collapse the sub-fields of an expanded batch into composed fields.
 *
 * @param expanded Batch in the format's expanded schema
 * @param format Point format
 * @param[out] physical Batch in the format's physical schema
 * @param[out] detail Offending field, sub-field and value on failure
 * @return Error::Ok, Error::SchemaMismatch or Error::RangeViolation
 */
Error repack_sub_fields(const RecordBatch& expanded, const PointFormat& format,
                        RecordBatch& physical, ErrorDetail* detail = nullptr);

#if !POINTPACK_NO_EXCEPTIONS
/**
 * @brief Throwing variant of unpack_sub_fields().
 * @throws SchemaMismatchException
 */
RecordBatch unpack_sub_fields(const RecordBatch& physical, const PointFormat& format);

/**
 * @brief Throwing variant of repack_sub_fields().
 * @throws SchemaMismatchException, RangeViolationException
 */
RecordBatch repack_sub_fields(const RecordBatch& expanded, const PointFormat& format);
#endif

} // namespace pointpack

#endif // POINTPACK_RECORD_CODEC_HPP

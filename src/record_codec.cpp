/**
 * @file record_codec.cpp
 * @brief Batch-level unpacking and repacking of composed fields.
 */

#include <pointpack/record_codec.hpp>

#include <pointpack/packing.hpp>

#include <numeric>
#include <utility>

namespace pointpack {

namespace {

Error mismatch(ErrorDetail* info, const FieldDescriptor& field) {
    detail::set_detail(info, Error::SchemaMismatch, field.name);
    if (info != nullptr) {
        info->expected = dtype_name(field.dtype);
    }
    return Error::SchemaMismatch;
}

/**
 * @brief Map each field of an expected schema to a column of a batch.
 *
 * binding[i] is the batch column holding expected[i]. Every bound column
 * must carry the expected type and one element per record.
 */
Error bind_columns(const RecordBatch& batch, const Schema& expected,
                   std::vector<std::size_t>& binding, ErrorDetail* info) {
    binding.resize(expected.size());

    if (batch.schema() == expected) {
        // Fast path: identical layout
        std::iota(binding.begin(), binding.end(), std::size_t{0});
    } else {
        for (std::size_t i = 0; i < expected.size(); ++i) {
            const std::size_t index = batch.find(expected[i].name);
            if (index == NPOS || batch.schema()[index].dtype != expected[i].dtype) {
                return mismatch(info, expected[i]);
            }
            binding[i] = index;
        }
    }

    // Columns can be replaced through RecordBatch::column()
    for (std::size_t i = 0; i < expected.size(); ++i) {
        const Column& column = batch.column(binding[i]);
        if (column.dtype() != expected[i].dtype || column.size() != batch.num_records()) {
            return mismatch(info, expected[i]);
        }
    }

    // Every expected field is bound; any remaining column is unknown
    if (batch.num_fields() != expected.size()) {
        for (const auto& field : batch.schema()) {
            if (find_field(expected, field.name) == NPOS) {
                detail::set_detail(info, Error::SchemaMismatch, field.name);
                return Error::SchemaMismatch;
            }
        }
        detail::set_detail(info, Error::SchemaMismatch, std::string());
        return Error::SchemaMismatch;
    }

    return Error::Ok;
}

} // namespace

Error unpack_sub_fields(const RecordBatch& physical, const PointFormat& format,
                        RecordBatch& expanded, ErrorDetail* info) {
    std::vector<std::size_t> binding;
    auto err = bind_columns(physical, format.physical_schema(), binding, info);
    if (err != Error::Ok) {
        return err;
    }

    RecordBatch result(format.expanded_schema(), physical.num_records());

    for (const auto& plain : format.plain_fields()) {
        result.column(plain.expanded_index) = physical.column(binding[plain.physical_index]);
    }

    for (const auto& field : format.composed_fields()) {
        const Column& source = physical.column(binding[field.physical_index]);
        for (const auto& sub : field.sub_fields) {
            err = unpack_column(source, sub.mask, result.column(sub.expanded_index));
            if (err != Error::Ok) {
                detail::set_detail(info, err, field.name, sub.name);
                return err;
            }
        }
    }

    expanded = std::move(result);
    return Error::Ok;
}

Error repack_sub_fields(const RecordBatch& expanded, const PointFormat& format,
                        RecordBatch& physical, ErrorDetail* info) {
    std::vector<std::size_t> binding;
    auto err = bind_columns(expanded, format.expanded_schema(), binding, info);
    if (err != Error::Ok) {
        return err;
    }

    RecordBatch result(format.physical_schema(), expanded.num_records());

    // Walk physical order; plain and composed lists are both sorted by it
    const auto& plain_fields = format.plain_fields();
    const auto& composed_fields = format.composed_fields();
    auto plain = plain_fields.begin();
    auto composed = composed_fields.begin();

    while (plain != plain_fields.end() || composed != composed_fields.end()) {
        const bool take_plain =
            composed == composed_fields.end() ||
            (plain != plain_fields.end() && plain->physical_index < composed->physical_index);

        if (take_plain) {
            result.column(plain->physical_index) = expanded.column(binding[plain->expanded_index]);
            ++plain;
            continue;
        }

        Column& dest = result.column(composed->physical_index);
        for (const auto& sub : composed->sub_fields) {
            RangeError range;
            err = pack_column_into(dest, expanded.column(binding[sub.expanded_index]), sub.mask,
                                   &range);
            if (err != Error::Ok) {
                // Abort this composed field only
                dest.zero();
                detail::set_detail(info, err, composed->name, sub.name);
                if (info != nullptr && err == Error::RangeViolation) {
                    info->value = range.value;
                    info->max_allowed = range.max_allowed;
                }
                physical = std::move(result);
                return err;
            }
        }
        ++composed;
    }

    physical = std::move(result);
    return Error::Ok;
}

#if !POINTPACK_NO_EXCEPTIONS
RecordBatch unpack_sub_fields(const RecordBatch& physical, const PointFormat& format) {
    RecordBatch expanded;
    ErrorDetail detail;
    if (unpack_sub_fields(physical, format, expanded, &detail) != Error::Ok) {
        throw_error(detail);
    }
    return expanded;
}

RecordBatch repack_sub_fields(const RecordBatch& expanded, const PointFormat& format) {
    RecordBatch physical;
    ErrorDetail detail;
    if (repack_sub_fields(expanded, format, physical, &detail) != Error::Ok) {
        throw_error(detail);
    }
    return physical;
}
#endif

} // namespace pointpack

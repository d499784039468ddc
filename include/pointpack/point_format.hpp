/**
 * @file point_format.hpp
 * @brief Point format descriptors: physical schema plus composed fields.
 *
 * A point format is described once, by name, and resolved into indices at
 * load time. After PointFormat::create() every composed field knows its
 * physical column, and every sub-field its expanded column, shift, maximum
 * value and element type, so batch operations never look names up per
 * element.
 *
 * @par Expanded schema
 * Physical field order, with each composed field replaced in place by its
 * sub-fields in declared order.
 */

#ifndef POINTPACK_POINT_FORMAT_HPP
#define POINTPACK_POINT_FORMAT_HPP

#include "config.hpp"
#include "dtype.hpp"
#include "error.hpp"
#include "record_batch.hpp"

#include <string>
#include <vector>

namespace pointpack {

/**
 * @brief Description of one sub-field, as supplied by a format catalog.
 */
struct SubFieldDescriptor {
    std::string name;
    mask_t mask = 0;
    DType dtype = DType::UInt8; ///< Column type in the expanded schema
};

/**
 * @brief Description of one composed field, as supplied by a format catalog.
 *
 * The container element type is taken from the physical schema entry of
 * the same name.
 */
struct ComposedFieldDescriptor {
    std::string name;
    std::vector<SubFieldDescriptor> sub_fields;
};

/**
 * @brief Resolved sub-field.
 */
struct SubField {
    std::string name;
    mask_t mask = 0;
    unsigned shift = 0;
    mask_t max_value = 0;   ///< mask >> shift
    unsigned bit_width = 0; ///< Span of the mask
    DType dtype = DType::UInt8;
    std::size_t expanded_index = NPOS;
};

/**
 * @brief Resolved composed field.
 */
struct ComposedField {
    std::string name;
    DType dtype = DType::UInt8;
    std::size_t physical_index = NPOS;
    std::vector<SubField> sub_fields;
};

/**
 * @brief Resolved plain (non-composed) field.
 */
struct PlainField {
    std::size_t physical_index = NPOS;
    std::size_t expanded_index = NPOS;
};

/**
 * @brief Immutable, pre-resolved point format.
 */
class PointFormat {
public:
    PointFormat() = default;

    /**
     * @brief Validate and resolve a point format description.
     *
     * Checks, in order:
     * - physical field names are non-empty and unique (InvalidArg)
     * - each composed field names a physical field (SchemaMismatch) of
     *   integer type (InvalidArg), at most once (InvalidArg), and has at
     *   least one sub-field (InvalidArg)
     * - each mask is nonzero and fits the container (InvalidMask)
     * - masks of one composed field are disjoint (InvalidMask), unless
     *   POINTPACK_ALLOW_OVERLAPPING_MASKS is set
     * - each sub-field type is unsigned and can hold mask >> shift
     *   (InvalidArg)
     * - expanded field names are unique (InvalidArg)
     *
     * @param physical Physical schema in record order
     * @param composed Composed field descriptions, any order
     * @param[out] format Resolved format, untouched on failure
     * @param[out] detail Offending field/sub-field on failure
     * @return Error::Ok on success
     */
    static Error create(Schema physical, const std::vector<ComposedFieldDescriptor>& composed,
                        PointFormat& format, ErrorDetail* detail = nullptr);

#if !POINTPACK_NO_EXCEPTIONS
    /**
     * @brief Throwing variant of create().
     * @throws PointPackException subclass matching the Error
     */
    static PointFormat make(Schema physical, const std::vector<ComposedFieldDescriptor>& composed);
#endif

    [[nodiscard]] const Schema& physical_schema() const noexcept { return physical_; }
    [[nodiscard]] const Schema& expanded_schema() const noexcept { return expanded_; }

    /// Composed fields in physical order
    [[nodiscard]] const std::vector<ComposedField>& composed_fields() const noexcept {
        return composed_;
    }

    /// Plain fields in physical order
    [[nodiscard]] const std::vector<PlainField>& plain_fields() const noexcept { return plain_; }

    /**
     * @brief Composed field by name.
     * @return Pointer to the field, nullptr if name is not composed
     */
    [[nodiscard]] const ComposedField* find_composed(const std::string& name) const noexcept;

    /**
     * @brief Sub-field by name, with its owner.
     * @return Pointer to the sub-field, nullptr if absent
     */
    [[nodiscard]] const SubField* find_sub_field(const std::string& name,
                                                 const ComposedField** owner = nullptr) const
        noexcept;

    /// Size in bytes of one physical record
    [[nodiscard]] std::size_t record_size() const noexcept {
        return pointpack::record_size(physical_);
    }

private:
    Schema physical_;
    Schema expanded_;
    std::vector<ComposedField> composed_;
    std::vector<PlainField> plain_;
};

} // namespace pointpack

#endif // POINTPACK_POINT_FORMAT_HPP

/**
 * @file point_format.cpp
 * @brief Point format validation and resolution.
 */

#include <pointpack/point_format.hpp>

#include <pointpack/bitpos.hpp>

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace pointpack {

namespace {

Error fail(ErrorDetail* info, Error code, const std::string& field,
           const std::string& sub_field = std::string()) {
    detail::set_detail(info, code, field, sub_field);
    return code;
}

/**
 * @brief Resolve one sub-field against its container type.
 */
Error resolve_sub_field(const SubFieldDescriptor& desc, DType container, SubField& out) {
    unsigned shift = 0;
    if (lowest_set_bit(desc.mask, shift) != Error::Ok) {
        return Error::InvalidMask;
    }
    if (!mask_fits(desc.mask, dtype_bits(container))) {
        return Error::InvalidMask;
    }

    // Expanded column must hold every value the mask can produce
    const mask_t max = max_value(desc.mask, shift);
    if (!dtype_is_unsigned(desc.dtype) || dtype_unsigned_max(desc.dtype) < max) {
        return Error::InvalidArg;
    }

    out.name = desc.name;
    out.mask = desc.mask;
    out.shift = shift;
    out.max_value = max;
    out.bit_width = bit_span(desc.mask);
    out.dtype = desc.dtype;
    return Error::Ok;
}

} // namespace

Error PointFormat::create(Schema physical, const std::vector<ComposedFieldDescriptor>& composed,
                          PointFormat& format, ErrorDetail* detail) {
    // Physical names
    std::unordered_set<std::string> physical_names;
    for (const auto& field : physical) {
        if (field.name.empty() || !physical_names.insert(field.name).second) {
            return fail(detail, Error::InvalidArg, field.name);
        }
    }

    PointFormat result;
    std::vector<bool> is_composed(physical.size(), false);

    for (const auto& desc : composed) {
        const std::size_t index = find_field(physical, desc.name);
        if (index == NPOS) {
            return fail(detail, Error::SchemaMismatch, desc.name);
        }
        if (is_composed[index] || desc.sub_fields.empty() ||
            !dtype_is_integer(physical[index].dtype)) {
            return fail(detail, Error::InvalidArg, desc.name);
        }
        is_composed[index] = true;

        ComposedField field;
        field.name = desc.name;
        field.dtype = physical[index].dtype;
        field.physical_index = index;

        mask_t used = 0;
        for (const auto& sub_desc : desc.sub_fields) {
            if (sub_desc.name.empty()) {
                return fail(detail, Error::InvalidArg, desc.name);
            }

            SubField sub;
            auto err = resolve_sub_field(sub_desc, field.dtype, sub);
            if (err != Error::Ok) {
                return fail(detail, err, desc.name, sub_desc.name);
            }

#if !POINTPACK_ALLOW_OVERLAPPING_MASKS
            if ((used & sub.mask) != 0) {
                return fail(detail, Error::InvalidMask, desc.name, sub_desc.name);
            }
#endif
            used |= sub.mask;
            field.sub_fields.push_back(std::move(sub));
        }

        result.composed_.push_back(std::move(field));
    }

    std::sort(result.composed_.begin(), result.composed_.end(),
              [](const ComposedField& a, const ComposedField& b) {
                  return a.physical_index < b.physical_index;
              });

    // Expanded schema: composed fields replaced in place by their sub-fields
    std::unordered_set<std::string> expanded_names;
    auto next_composed = result.composed_.begin();
    for (std::size_t i = 0; i < physical.size(); ++i) {
        if (is_composed[i]) {
            for (auto& sub : next_composed->sub_fields) {
                if (!expanded_names.insert(sub.name).second) {
                    return fail(detail, Error::InvalidArg, next_composed->name, sub.name);
                }
                sub.expanded_index = result.expanded_.size();
                result.expanded_.push_back(FieldDescriptor{sub.name, sub.dtype});
            }
            ++next_composed;
        } else {
            if (!expanded_names.insert(physical[i].name).second) {
                return fail(detail, Error::InvalidArg, physical[i].name);
            }
            result.plain_.push_back(PlainField{i, result.expanded_.size()});
            result.expanded_.push_back(physical[i]);
        }
    }

    result.physical_ = std::move(physical);
    format = std::move(result);
    return Error::Ok;
}

#if !POINTPACK_NO_EXCEPTIONS
PointFormat PointFormat::make(Schema physical,
                              const std::vector<ComposedFieldDescriptor>& composed) {
    PointFormat format;
    ErrorDetail detail;
    if (create(std::move(physical), composed, format, &detail) != Error::Ok) {
        throw_error(detail);
    }
    return format;
}
#endif

const ComposedField* PointFormat::find_composed(const std::string& name) const noexcept {
    for (const auto& field : composed_) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

const SubField* PointFormat::find_sub_field(const std::string& name,
                                            const ComposedField** owner) const noexcept {
    for (const auto& field : composed_) {
        for (const auto& sub : field.sub_fields) {
            if (sub.name == name) {
                if (owner != nullptr) {
                    *owner = &field;
                }
                return &sub;
            }
        }
    }
    return nullptr;
}

} // namespace pointpack

/**
 * @file packing.cpp
 * @brief Column-level dispatch of the packing primitives.
 *
 * The element loops live in packing.hpp as templates; this unit maps the
 * runtime DType of each Column onto the matching instantiation.
 */

#include <pointpack/packing.hpp>

#include <utility>

namespace pointpack {

Error unpack_column(const Column& source, mask_t mask, Column& result) {
    if (result.size() != source.size()) {
        return Error::InvalidArg;
    }

    return dispatch_integer(source.dtype(), [&](auto src_tag) {
        using Src = typename decltype(src_tag)::type;
        return dispatch_integer(result.dtype(), [&](auto dst_tag) {
            using Dst = typename decltype(dst_tag)::type;
            return unpack(source.data<Src>(), source.size(), mask, result.data<Dst>());
        });
    });
}

Error pack_column_into(Column& dest, const Column& values, mask_t mask, RangeError* range) {
    if (dest.size() != values.size()) {
        return Error::InvalidArg;
    }

    return dispatch_integer(dest.dtype(), [&](auto dst_tag) {
        using Dst = typename decltype(dst_tag)::type;
        return dispatch_unsigned(values.dtype(), [&](auto sub_tag) {
            using Sub = typename decltype(sub_tag)::type;
            return pack_into(dest.data<Dst>(), values.data<Sub>(), dest.size(), mask, range);
        });
    });
}

Error pack_column(const Column& dest, const Column& values, mask_t mask, Column& result,
                  RangeError* range) {
    if (dest.size() != values.size()) {
        return Error::InvalidArg;
    }

    Column packed(dest.dtype(), dest.size());
    auto err = dispatch_integer(dest.dtype(), [&](auto dst_tag) {
        using Dst = typename decltype(dst_tag)::type;
        return dispatch_unsigned(values.dtype(), [&](auto sub_tag) {
            using Sub = typename decltype(sub_tag)::type;
            return pack(dest.data<Dst>(), values.data<Sub>(), dest.size(), mask,
                        packed.data<Dst>(), range);
        });
    });
    if (err != Error::Ok) {
        return err;
    }

    result = std::move(packed);
    return Error::Ok;
}

} // namespace pointpack

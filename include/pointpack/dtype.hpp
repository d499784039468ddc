/**
 * @file dtype.hpp
 * @brief Element types of record batch columns.
 *
 * Columns hold fixed-width elements in native byte order. DType is the
 * closed set of element types a point format may use; the helpers below
 * map between DType and the C++ type used to access a column.
 */

#ifndef POINTPACK_DTYPE_HPP
#define POINTPACK_DTYPE_HPP

#include "config.hpp"
#include "error.hpp"

#include <limits>
#include <type_traits>

namespace pointpack {

/**
 * @brief Column element type.
 */
enum class DType : std::uint8_t {
    UInt8,
    Int8,
    UInt16,
    Int16,
    UInt32,
    Int32,
    UInt64,
    Int64,
    Float32,
    Float64
};

/**
 * @brief Size of one element in bytes.
 */
[[nodiscard]] constexpr std::size_t dtype_size(DType type) noexcept {
    switch (type) {
    case DType::UInt8:
    case DType::Int8:
        return 1;
    case DType::UInt16:
    case DType::Int16:
        return 2;
    case DType::UInt32:
    case DType::Int32:
    case DType::Float32:
        return 4;
    case DType::UInt64:
    case DType::Int64:
    case DType::Float64:
        return 8;
    }
    return 0;
}

/**
 * @brief Size of one element in bits.
 */
[[nodiscard]] constexpr std::size_t dtype_bits(DType type) noexcept {
    return dtype_size(type) * 8U;
}

[[nodiscard]] constexpr bool dtype_is_integer(DType type) noexcept {
    return type != DType::Float32 && type != DType::Float64;
}

[[nodiscard]] constexpr bool dtype_is_unsigned(DType type) noexcept {
    return type == DType::UInt8 || type == DType::UInt16 || type == DType::UInt32 ||
           type == DType::UInt64;
}

/**
 * @brief Largest value representable by an unsigned integer type.
 * @return Maximum value, 0 for non-unsigned types
 */
[[nodiscard]] constexpr std::uint64_t dtype_unsigned_max(DType type) noexcept {
    if (!dtype_is_unsigned(type)) {
        return 0;
    }
    std::size_t bits = dtype_bits(type);
    if (bits >= 64) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return (std::uint64_t{1} << bits) - 1U;
}

/**
 * @brief Short type name (u8, i16, f64, ...).
 */
inline const char* dtype_name(DType type) noexcept {
    switch (type) {
    case DType::UInt8:
        return "u8";
    case DType::Int8:
        return "i8";
    case DType::UInt16:
        return "u16";
    case DType::Int16:
        return "i16";
    case DType::UInt32:
        return "u32";
    case DType::Int32:
        return "i32";
    case DType::UInt64:
        return "u64";
    case DType::Int64:
        return "i64";
    case DType::Float32:
        return "f32";
    case DType::Float64:
        return "f64";
    }
    return "?";
}

/**
 * @brief DType of a C++ element type.
 */
template <typename T> constexpr DType dtype_of() noexcept {
    if constexpr (std::is_same_v<T, std::uint8_t>) {
        return DType::UInt8;
    } else if constexpr (std::is_same_v<T, std::int8_t>) {
        return DType::Int8;
    } else if constexpr (std::is_same_v<T, std::uint16_t>) {
        return DType::UInt16;
    } else if constexpr (std::is_same_v<T, std::int16_t>) {
        return DType::Int16;
    } else if constexpr (std::is_same_v<T, std::uint32_t>) {
        return DType::UInt32;
    } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return DType::Int32;
    } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return DType::UInt64;
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return DType::Int64;
    } else if constexpr (std::is_same_v<T, float>) {
        return DType::Float32;
    } else {
        static_assert(std::is_same_v<T, double>, "unsupported column element type");
        return DType::Float64;
    }
}

/// Carries an element type through a runtime dispatch.
template <typename T> struct TypeTag {
    using type = T;
};

/**
 * @brief Call f(TypeTag<T>{}) for the integer type matching a DType.
 *
 * @param type Element type
 * @param f Callable returning Error
 * @return Result of f, or Error::InvalidArg for floating point types
 */
template <typename F> Error dispatch_integer(DType type, F&& f) {
    switch (type) {
    case DType::UInt8:
        return f(TypeTag<std::uint8_t>{});
    case DType::Int8:
        return f(TypeTag<std::int8_t>{});
    case DType::UInt16:
        return f(TypeTag<std::uint16_t>{});
    case DType::Int16:
        return f(TypeTag<std::int16_t>{});
    case DType::UInt32:
        return f(TypeTag<std::uint32_t>{});
    case DType::Int32:
        return f(TypeTag<std::int32_t>{});
    case DType::UInt64:
        return f(TypeTag<std::uint64_t>{});
    case DType::Int64:
        return f(TypeTag<std::int64_t>{});
    default:
        return Error::InvalidArg;
    }
}

/**
 * @brief Call f(TypeTag<T>{}) for the unsigned integer type matching a DType.
 *
 * @return Result of f, or Error::InvalidArg for other types
 */
template <typename F> Error dispatch_unsigned(DType type, F&& f) {
    switch (type) {
    case DType::UInt8:
        return f(TypeTag<std::uint8_t>{});
    case DType::UInt16:
        return f(TypeTag<std::uint16_t>{});
    case DType::UInt32:
        return f(TypeTag<std::uint32_t>{});
    case DType::UInt64:
        return f(TypeTag<std::uint64_t>{});
    default:
        return Error::InvalidArg;
    }
}

} // namespace pointpack

#endif // POINTPACK_DTYPE_HPP

/**
 * @file record_batch.hpp
 * @brief Columnar buffer of fixed-length point records.
 *
 * A RecordBatch holds N records as one Column per schema field. Columns
 * store their elements contiguously in native byte order and are
 * zero-initialised on construction.
 *
 * The same batch type carries both schema variants:
 * - physical: composed fields present, as laid out in a file
 * - expanded: every sub-field is its own column, composed fields absent
 */

#ifndef POINTPACK_RECORD_BATCH_HPP
#define POINTPACK_RECORD_BATCH_HPP

#include "config.hpp"
#include "dtype.hpp"
#include "error.hpp"

#include <cstddef>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace pointpack {

/**
 * @brief One named field of a schema.
 */
struct FieldDescriptor {
    std::string name;
    DType dtype = DType::UInt8;

    bool operator==(const FieldDescriptor& other) const {
        return name == other.name && dtype == other.dtype;
    }
    bool operator!=(const FieldDescriptor& other) const {
        return !(*this == other);
    }
};

/// Ordered field list of a record layout.
using Schema = std::vector<FieldDescriptor>;

/**
 * @brief Size in bytes of one tightly packed record of a schema.
 */
std::size_t record_size(const Schema& schema) noexcept;

/**
 * @brief Index of a field in a schema.
 * @return Field index, or NPOS if absent
 */
std::size_t find_field(const Schema& schema, const std::string& name) noexcept;

/**
 * @brief Homogeneous column of fixed-width elements.
 *
 * Elements live in a std::byte array from new[], aligned for every DType;
 * typed access relies on the objects implicitly created in it.
 */
class Column {
public:
    Column() = default;

    /**
     * @brief Construct a zero-filled column.
     * @param type Element type
     * @param length Number of elements
     */
    Column(DType type, std::size_t length);

    Column(const Column& other);
    Column& operator=(const Column& other);
    Column(Column&& other) noexcept;
    Column& operator=(Column&& other) noexcept;
    ~Column() = default;

    [[nodiscard]] DType dtype() const noexcept { return type_; }
    [[nodiscard]] std::size_t size() const noexcept { return length_; }
    [[nodiscard]] std::size_t size_bytes() const noexcept { return length_ * dtype_size(type_); }

    /**
     * @brief Typed element access.
     * @return Pointer to the first element, nullptr if T does not match dtype()
     */
    template <typename T> [[nodiscard]] T* data() noexcept {
        if (dtype_of<T>() != type_) [[unlikely]]
            return nullptr;
        return std::launder(reinterpret_cast<T*>(storage_.get()));
    }

    template <typename T> [[nodiscard]] const T* data() const noexcept {
        if (dtype_of<T>() != type_) [[unlikely]]
            return nullptr;
        return std::launder(reinterpret_cast<const T*>(storage_.get()));
    }

    /**
     * @brief Raw byte access (native byte order).
     */
    [[nodiscard]] std::uint8_t* bytes() noexcept {
        return reinterpret_cast<std::uint8_t*>(storage_.get());
    }

    [[nodiscard]] const std::uint8_t* bytes() const noexcept {
        return reinterpret_cast<const std::uint8_t*>(storage_.get());
    }

    /**
     * @brief Set all elements to zero.
     */
    void zero() noexcept;

    /**
     * @brief Bit-identical comparison (type, length and element bytes).
     */
    [[nodiscard]] bool operator==(const Column& other) const noexcept;
    [[nodiscard]] bool operator!=(const Column& other) const noexcept { return !(*this == other); }

private:
    DType type_ = DType::UInt8;
    std::size_t length_ = 0;
    std::unique_ptr<std::byte[]> storage_;
};

/**
 * @brief Columnar buffer of N records sharing one schema.
 */
class RecordBatch {
public:
    RecordBatch() = default;

    /**
     * @brief Construct a zero-initialised batch.
     * @param schema Field list, one column per entry
     * @param num_records Number of records N
     */
    RecordBatch(Schema schema, std::size_t num_records);

    /**
     * @brief Build a batch from tightly packed fixed-length records.
     *
     * Records are laid out back to back, each field at its schema offset,
     * elements in native byte order.
     *
     * @param schema Record layout
     * @param records Source bytes
     * @param size Number of source bytes (multiple of record_size(schema))
     * @param[out] batch Resulting batch
     * @return Error::Ok on success, Error::InvalidArg on a partial record
     *         or an empty schema
     */
    static Error from_records(const Schema& schema, const std::uint8_t* records, std::size_t size,
                              RecordBatch& batch);

    /**
     * @brief Write the batch back as tightly packed fixed-length records.
     *
     * @param records Destination bytes
     * @param size Destination capacity in bytes
     * @return Error::Ok on success, Error::InvalidArg if size is too small
     *         or a column does not hold num_records() elements
     */
    Error to_records(std::uint8_t* records, std::size_t size) const noexcept;

    [[nodiscard]] const Schema& schema() const noexcept { return schema_; }
    [[nodiscard]] std::size_t num_records() const noexcept { return num_records_; }
    [[nodiscard]] std::size_t num_fields() const noexcept { return columns_.size(); }

    /**
     * @brief Index of a column by name.
     * @return Column index, or NPOS if absent
     */
    [[nodiscard]] std::size_t find(const std::string& name) const noexcept {
        return find_field(schema_, name);
    }

    [[nodiscard]] Column& column(std::size_t index) { return columns_.at(index); }
    [[nodiscard]] const Column& column(std::size_t index) const { return columns_.at(index); }

    /**
     * @brief Column by name.
     * @return Pointer to the column, nullptr if absent
     */
    [[nodiscard]] Column* column(const std::string& name) noexcept;
    [[nodiscard]] const Column* column(const std::string& name) const noexcept;

    [[nodiscard]] bool operator==(const RecordBatch& other) const noexcept;
    [[nodiscard]] bool operator!=(const RecordBatch& other) const noexcept {
        return !(*this == other);
    }

private:
    Schema schema_;
    std::size_t num_records_ = 0;
    std::vector<Column> columns_;
};

} // namespace pointpack

#endif // POINTPACK_RECORD_BATCH_HPP

/**
 * @file record_batch.cpp
 * @brief Column and RecordBatch implementation.
 */

#include <pointpack/record_batch.hpp>

#include <cstring>
#include <utility>

namespace pointpack {

std::size_t record_size(const Schema& schema) noexcept {
    std::size_t size = 0;
    for (const auto& field : schema) {
        size += dtype_size(field.dtype);
    }
    return size;
}

std::size_t find_field(const Schema& schema, const std::string& name) noexcept {
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (schema[i].name == name) {
            return i;
        }
    }
    return NPOS;
}

Column::Column(DType type, std::size_t length)
    : type_(type), length_(length),
      storage_(std::make_unique<std::byte[]>(length * dtype_size(type))) {}

Column::Column(const Column& other)
    : type_(other.type_), length_(other.length_),
      storage_(std::make_unique<std::byte[]>(other.size_bytes())) {
    if (size_bytes() > 0) {
        std::memcpy(storage_.get(), other.storage_.get(), size_bytes());
    }
}

Column& Column::operator=(const Column& other) {
    if (this != &other) {
        Column copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Column::Column(Column&& other) noexcept
    : type_(other.type_), length_(other.length_), storage_(std::move(other.storage_)) {
    other.length_ = 0;
}

Column& Column::operator=(Column&& other) noexcept {
    if (this != &other) {
        type_ = other.type_;
        length_ = other.length_;
        storage_ = std::move(other.storage_);
        other.length_ = 0;
    }
    return *this;
}

void Column::zero() noexcept {
    if (size_bytes() > 0) {
        std::memset(storage_.get(), 0, size_bytes());
    }
}

bool Column::operator==(const Column& other) const noexcept {
    if (type_ != other.type_ || length_ != other.length_) {
        return false;
    }
    if (size_bytes() == 0) {
        return true;
    }
    return std::memcmp(bytes(), other.bytes(), size_bytes()) == 0;
}

RecordBatch::RecordBatch(Schema schema, std::size_t num_records)
    : schema_(std::move(schema)), num_records_(num_records) {
    columns_.reserve(schema_.size());
    for (const auto& field : schema_) {
        columns_.emplace_back(field.dtype, num_records_);
    }
}

Error RecordBatch::from_records(const Schema& schema, const std::uint8_t* records,
                                std::size_t size, RecordBatch& batch) {
    const std::size_t stride = record_size(schema);
    if (stride == 0 || (size % stride) != 0) {
        return Error::InvalidArg;
    }
    if (size > 0 && records == nullptr) {
        return Error::InvalidArg;
    }

    RecordBatch result(schema, size / stride);

    // Gather each field into its column
    std::size_t offset = 0;
    for (std::size_t f = 0; f < result.columns_.size(); ++f) {
        Column& col = result.columns_[f];
        const std::size_t width = dtype_size(col.dtype());
        std::uint8_t* out = col.bytes();
        for (std::size_t r = 0; r < result.num_records_; ++r) {
            std::memcpy(out + r * width, records + r * stride + offset, width);
        }
        offset += width;
    }

    batch = std::move(result);
    return Error::Ok;
}

Error RecordBatch::to_records(std::uint8_t* records, std::size_t size) const noexcept {
    const std::size_t stride = record_size(schema_);
    if (size < stride * num_records_) {
        return Error::InvalidArg;
    }
    if (num_records_ > 0 && records == nullptr) {
        return Error::InvalidArg;
    }
    for (std::size_t f = 0; f < columns_.size(); ++f) {
        if (columns_[f].size() != num_records_ || columns_[f].dtype() != schema_[f].dtype) {
            return Error::InvalidArg;
        }
    }

    // Scatter each column to its field offset
    std::size_t offset = 0;
    for (const auto& col : columns_) {
        const std::size_t width = dtype_size(col.dtype());
        const std::uint8_t* in = col.bytes();
        for (std::size_t r = 0; r < num_records_; ++r) {
            std::memcpy(records + r * stride + offset, in + r * width, width);
        }
        offset += width;
    }

    return Error::Ok;
}

Column* RecordBatch::column(const std::string& name) noexcept {
    std::size_t index = find(name);
    return index == NPOS ? nullptr : &columns_[index];
}

const Column* RecordBatch::column(const std::string& name) const noexcept {
    std::size_t index = find(name);
    return index == NPOS ? nullptr : &columns_[index];
}

bool RecordBatch::operator==(const RecordBatch& other) const noexcept {
    return num_records_ == other.num_records_ && schema_ == other.schema_ &&
           columns_ == other.columns_;
}

} // namespace pointpack

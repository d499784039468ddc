/**
 * @file las_formats.cpp
 * @brief Standard LAS point data record formats.
 */

#include <pointpack/las_formats.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace pointpack {

namespace {

// Fields shared by formats 0-5
const Schema LEGACY_BASE = {
    {"X", DType::Int32},
    {"Y", DType::Int32},
    {"Z", DType::Int32},
    {"intensity", DType::UInt16},
    {"bit_fields", DType::UInt8},
    {"raw_classification", DType::UInt8},
    {"scan_angle_rank", DType::Int8},
    {"user_data", DType::UInt8},
    {"point_source_id", DType::UInt16},
};

// Fields shared by formats 6-10
const Schema EXTENDED_BASE = {
    {"X", DType::Int32},
    {"Y", DType::Int32},
    {"Z", DType::Int32},
    {"intensity", DType::UInt16},
    {"bit_fields", DType::UInt8},
    {"classification_flags", DType::UInt8},
    {"classification", DType::UInt8},
    {"user_data", DType::UInt8},
    {"scan_angle", DType::Int16},
    {"point_source_id", DType::UInt16},
    {"gps_time", DType::Float64},
};

const Schema GPS_TIME = {
    {"gps_time", DType::Float64},
};

const Schema RGB = {
    {"red", DType::UInt16},
    {"green", DType::UInt16},
    {"blue", DType::UInt16},
};

const Schema NIR = {
    {"nir", DType::UInt16},
};

const Schema WAVE_PACKET = {
    {"wavepacket_index", DType::UInt8},
    {"wavepacket_offset", DType::UInt64},
    {"wavepacket_size", DType::UInt32},
    {"return_point_wave_location", DType::Float32},
    {"x_t", DType::Float32},
    {"y_t", DType::Float32},
    {"z_t", DType::Float32},
};

const std::vector<ComposedFieldDescriptor> LEGACY_COMPOSED = {
    {"bit_fields",
     {
         {"return_number", 0b00000111},
         {"number_of_returns", 0b00111000},
         {"scan_direction_flag", 0b01000000},
         {"edge_of_flight_line", 0b10000000},
     }},
    {"raw_classification",
     {
         {"classification", 0b00011111},
         {"synthetic", 0b00100000},
         {"key_point", 0b01000000},
         {"withheld", 0b10000000},
     }},
};

const std::vector<ComposedFieldDescriptor> EXTENDED_COMPOSED = {
    {"bit_fields",
     {
         {"return_number", 0b00001111},
         {"number_of_returns", 0b11110000},
     }},
    {"classification_flags",
     {
         {"synthetic", 0b00000001},
         {"key_point", 0b00000010},
         {"withheld", 0b00000100},
         {"overlap", 0b00001000},
         {"scanner_channel", 0b00110000},
         {"scan_direction_flag", 0b01000000},
         {"edge_of_flight_line", 0b10000000},
     }},
};

Schema concat(std::initializer_list<const Schema*> parts) {
    Schema schema;
    for (const Schema* part : parts) {
        schema.insert(schema.end(), part->begin(), part->end());
    }
    return schema;
}

Schema las_schema(int id) {
    switch (id) {
    case 0:
        return LEGACY_BASE;
    case 1:
        return concat({&LEGACY_BASE, &GPS_TIME});
    case 2:
        return concat({&LEGACY_BASE, &RGB});
    case 3:
        return concat({&LEGACY_BASE, &GPS_TIME, &RGB});
    case 4:
        return concat({&LEGACY_BASE, &GPS_TIME, &WAVE_PACKET});
    case 5:
        return concat({&LEGACY_BASE, &GPS_TIME, &RGB, &WAVE_PACKET});
    case 6:
        return EXTENDED_BASE;
    case 7:
        return concat({&EXTENDED_BASE, &RGB});
    case 8:
        return concat({&EXTENDED_BASE, &RGB, &NIR});
    case 9:
        return concat({&EXTENDED_BASE, &WAVE_PACKET});
    default:
        return concat({&EXTENDED_BASE, &RGB, &NIR, &WAVE_PACKET});
    }
}

} // namespace

Error las_point_format(int id, PointFormat& format) {
    if (id < 0 || id >= LAS_POINT_FORMAT_COUNT) {
        return Error::InvalidArg;
    }
    return PointFormat::create(las_schema(id), id < 6 ? LEGACY_COMPOSED : EXTENDED_COMPOSED,
                               format);
}

#if !POINTPACK_NO_EXCEPTIONS
PointFormat las_point_format(int id) {
    PointFormat format;
    auto err = las_point_format(id, format);
    if (err != Error::Ok) {
        throw InvalidArgumentException("unknown LAS point format: " + std::to_string(id));
    }
    return format;
}
#endif

} // namespace pointpack

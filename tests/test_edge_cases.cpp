/**
 * @file test_edge_cases.cpp
 * @brief Edge case tests for pointpack.
 *
 * Tests boundary conditions, corner cases, and stress scenarios.
 */

#include <catch2/catch.hpp>
#include <pointpack/pointpack.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace pointpack;

namespace {

PointFormat wide_format() {
    return PointFormat::make(
        {
            {"word", DType::UInt64},
            {"signed", DType::Int16},
        },
        {
            {"word",
             {
                 {"top", 0x8000000000000000ULL},
                 {"body", 0x7FFFFFFFFFFFFFFFULL, DType::UInt64},
             }},
            {"signed",
             {
                 {"sign", 0x8000},
                 {"magnitude", 0x7FFF, DType::UInt16},
             }},
        });
}

} // namespace

// ============================================================================
// Container Width Edge Cases
// ============================================================================

TEST_CASE("64-bit container edge cases", "[edge][wide]") {
    auto format = wide_format();
    RecordBatch physical(format.physical_schema(), 3);
    auto* word = physical.column(0).data<std::uint64_t>();
    word[0] = 0x8000000000000001ULL;
    word[1] = 0x7FFFFFFFFFFFFFFFULL;
    word[2] = 0;

    SECTION("top bit") {
        auto expanded = unpack_sub_fields(physical, format);
        const auto* top = expanded.column("top")->data<std::uint8_t>();
        const auto* body = expanded.column("body")->data<std::uint64_t>();
        REQUIRE(top[0] == 1);
        REQUIRE(body[0] == 1);
        REQUIRE(top[1] == 0);
        REQUIRE(body[1] == 0x7FFFFFFFFFFFFFFFULL);
        REQUIRE(top[2] == 0);
        REQUIRE(body[2] == 0);
    }

    SECTION("round trip") {
        auto repacked = repack_sub_fields(unpack_sub_fields(physical, format), format);
        REQUIRE(repacked == physical);
    }

    SECTION("value one past the 63-bit maximum") {
        auto expanded = unpack_sub_fields(physical, format);
        expanded.column("body")->data<std::uint64_t>()[2] = 0x8000000000000000ULL;

        RecordBatch out;
        ErrorDetail detail;
        REQUIRE(repack_sub_fields(expanded, format, out, &detail) == Error::RangeViolation);
        REQUIRE(detail.value == 0x8000000000000000ULL);
        REQUIRE(detail.max_allowed == 0x7FFFFFFFFFFFFFFFULL);
    }
}

TEST_CASE("Signed container edge cases", "[edge][signed]") {
    auto format = wide_format();
    RecordBatch physical(format.physical_schema(), 3);
    auto* value = physical.column(1).data<std::int16_t>();
    value[0] = -1;
    value[1] = std::numeric_limits<std::int16_t>::min();
    value[2] = std::numeric_limits<std::int16_t>::max();

    auto expanded = unpack_sub_fields(physical, format);
    const auto* sign = expanded.column("sign")->data<std::uint8_t>();
    const auto* magnitude = expanded.column("magnitude")->data<std::uint16_t>();
    REQUIRE(sign[0] == 1);
    REQUIRE(magnitude[0] == 0x7FFF);
    REQUIRE(sign[1] == 1);
    REQUIRE(magnitude[1] == 0);
    REQUIRE(sign[2] == 0);
    REQUIRE(magnitude[2] == 0x7FFF);

    REQUIRE(repack_sub_fields(expanded, format) == physical);
}

TEST_CASE("Sub-field wider than its container", "[edge][wide]") {
    auto format = PointFormat::make({{"byte", DType::UInt8}},
                                    {{"byte", {{"all", 0xFF, DType::UInt32}}}});
    RecordBatch expanded(format.expanded_schema(), 2);
    auto* all = expanded.column("all")->data<std::uint32_t>();
    all[0] = 255;
    all[1] = 256;

    RecordBatch physical;
    ErrorDetail detail;
    REQUIRE(repack_sub_fields(expanded, format, physical, &detail) == Error::RangeViolation);
    REQUIRE(detail.value == 256);
    REQUIRE(detail.max_allowed == 255);

    all[1] = 1;
    REQUIRE(repack_sub_fields(expanded, format, physical) == Error::Ok);
    REQUIRE(physical.column(0).data<std::uint8_t>()[0] == 255);
    REQUIRE(physical.column(0).data<std::uint8_t>()[1] == 1);
}

// ============================================================================
// Batch Shape Edge Cases
// ============================================================================

TEST_CASE("Batch shape edge cases", "[edge][batch]") {
    auto format = las_point_format(7);

    SECTION("single record") {
        RecordBatch physical(format.physical_schema(), 1);
        physical.column("bit_fields")->data<std::uint8_t>()[0] = 0x21;

        auto expanded = unpack_sub_fields(physical, format);
        REQUIRE(expanded.num_records() == 1);
        REQUIRE(expanded.column("return_number")->data<std::uint8_t>()[0] == 1);
        REQUIRE(expanded.column("number_of_returns")->data<std::uint8_t>()[0] == 2);
    }

    SECTION("empty expanded batch") {
        RecordBatch expanded(format.expanded_schema(), 0);
        RecordBatch physical;
        REQUIRE(repack_sub_fields(expanded, format, physical) == Error::Ok);
        REQUIRE(physical.num_records() == 0);
        REQUIRE(physical.schema() == format.physical_schema());
    }

    SECTION("large batch") {
        const std::size_t n = 1U << 16;
        RecordBatch physical(format.physical_schema(), n);
        auto* bits = physical.column("bit_fields")->data<std::uint8_t>();
        auto* flags = physical.column("classification_flags")->data<std::uint8_t>();
        for (std::size_t i = 0; i < n; ++i) {
            bits[i] = static_cast<std::uint8_t>(i);
            flags[i] = static_cast<std::uint8_t>(i >> 8);
        }

        auto expanded = unpack_sub_fields(physical, format);
        const auto* channel = expanded.column("scanner_channel")->data<std::uint8_t>();
        REQUIRE(channel[0x3000] == 3);
        REQUIRE(channel[0x2FFF] == 2);
        REQUIRE(repack_sub_fields(expanded, format) == physical);
    }
}

TEST_CASE("Format made only of composed fields", "[edge][format]") {
    auto format = PointFormat::make({{"a", DType::UInt8}, {"b", DType::UInt16}},
                                    {
                                        {"b", {{"b_lo", 0x00FF}, {"b_hi", 0xFF00}}},
                                        {"a", {{"a_bit", 0x01}}},
                                    });
    REQUIRE(format.plain_fields().empty());
    REQUIRE(format.expanded_schema().size() == 3);
    REQUIRE(format.expanded_schema()[0].name == "a_bit");

    RecordBatch physical(format.physical_schema(), 2);
    physical.column(0).data<std::uint8_t>()[1] = 0xFF;
    physical.column(1).data<std::uint16_t>()[0] = 0xBEEF;

    auto expanded = unpack_sub_fields(physical, format);
    REQUIRE(expanded.column("a_bit")->data<std::uint8_t>()[1] == 1);
    REQUIRE(expanded.column("b_lo")->data<std::uint8_t>()[0] == 0xEF);
    REQUIRE(expanded.column("b_hi")->data<std::uint8_t>()[0] == 0xBE);

    // Bits outside every mask are dropped by the round trip
    auto repacked = repack_sub_fields(expanded, format);
    REQUIRE(repacked.column(0).data<std::uint8_t>()[1] == 0x01);
    REQUIRE(repacked.column(1) == physical.column(1));
}

TEST_CASE("Format without composed fields passes batches through", "[edge][format]") {
    auto format = PointFormat::make({{"v", DType::Float32}}, {});
    RecordBatch physical(format.physical_schema(), 2);
    physical.column(0).data<float>()[0] = -0.5F;

    auto expanded = unpack_sub_fields(physical, format);
    REQUIRE(expanded == physical);
    REQUIRE(repack_sub_fields(expanded, format) == physical);
}

TEST_CASE("Version string", "[edge]") {
    REQUIRE(std::string(version()) == "1.0.0");
}

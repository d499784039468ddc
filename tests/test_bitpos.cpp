/**
 * @file test_bitpos.cpp
 * @brief Unit tests for mask bit position helpers.
 */

#include <catch2/catch.hpp>
#include <pointpack/bitpos.hpp>

using namespace pointpack;

// ============================================================================
// Lowest Set Bit
// ============================================================================

TEST_CASE("Lowest set bit of low mask", "[bitpos]") {
    unsigned shift = 99;
    REQUIRE(lowest_set_bit(0b00001111, shift) == Error::Ok);
    REQUIRE(shift == 0);
}

TEST_CASE("Lowest set bit of high nibble", "[bitpos]") {
    unsigned shift = 0;
    REQUIRE(lowest_set_bit(0b11110000, shift) == Error::Ok);
    REQUIRE(shift == 4);
}

TEST_CASE("Lowest set bit of single bits", "[bitpos]") {
    for (unsigned bit = 0; bit < 64; ++bit) {
        unsigned shift = 0;
        REQUIRE(lowest_set_bit(mask_t{1} << bit, shift) == Error::Ok);
        REQUIRE(shift == bit);
    }
}

TEST_CASE("Lowest set bit ignores higher bits", "[bitpos]") {
    unsigned shift = 0;
    REQUIRE(lowest_set_bit(0x8000000000000100ULL, shift) == Error::Ok);
    REQUIRE(shift == 8);
}

TEST_CASE("Zero mask has no position", "[bitpos]") {
    unsigned shift = 7;
    REQUIRE(lowest_set_bit(0, shift) == Error::InvalidMask);
    // Output untouched on failure
    REQUIRE(shift == 7);
}

// ============================================================================
// Max Value / Span / Fit
// ============================================================================

TEST_CASE("Max value of masks", "[bitpos][max]") {
    REQUIRE(max_value(0b00001111, 0) == 15);
    REQUIRE(max_value(0b11110000, 4) == 15);
    REQUIRE(max_value(0b00111000, 3) == 7);
    REQUIRE(max_value(0b10000000, 7) == 1);
    REQUIRE(max_value(0xFFFFFFFFFFFFFFFFULL, 0) == 0xFFFFFFFFFFFFFFFFULL);
}

TEST_CASE("Bit span of masks", "[bitpos][span]") {
    REQUIRE(bit_span(0) == 0);
    REQUIRE(bit_span(0b1) == 1);
    REQUIRE(bit_span(0b00111000) == 3);
    REQUIRE(bit_span(0b10000001) == 8);
    REQUIRE(bit_span(0xFFFFFFFFFFFFFFFFULL) == 64);
}

TEST_CASE("Mask fits container width", "[bitpos][fit]") {
    REQUIRE(mask_fits(0xFF, 8));
    REQUIRE_FALSE(mask_fits(0x100, 8));
    REQUIRE(mask_fits(0xFFFF, 16));
    REQUIRE_FALSE(mask_fits(0x10000, 16));
    REQUIRE(mask_fits(0x8000000000000000ULL, 64));
}

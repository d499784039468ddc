/**
 * @file test_point_format.cpp
 * @brief Unit tests for point format validation and resolution.
 */

#include <catch2/catch.hpp>
#include <pointpack/point_format.hpp>

#include <vector>

using namespace pointpack;

static Schema sample_schema() {
    return {
        {"X", DType::Int32},
        {"flags", DType::UInt8},
        {"intensity", DType::UInt16},
        {"packed", DType::UInt16},
    };
}

static std::vector<ComposedFieldDescriptor> sample_composed() {
    return {
        {"packed",
         {
             {"low", 0x000F},
             {"mid", 0x0FF0, DType::UInt8},
             {"high", 0xF000, DType::UInt16},
         }},
        {"flags",
         {
             {"a", 0x01},
             {"b", 0xFE},
         }},
    };
}

// ============================================================================
// Resolution
// ============================================================================

TEST_CASE("Format resolves composed fields in physical order", "[format]") {
    PointFormat format;
    REQUIRE(PointFormat::create(sample_schema(), sample_composed(), format) == Error::Ok);

    const auto& composed = format.composed_fields();
    REQUIRE(composed.size() == 2);
    REQUIRE(composed[0].name == "flags");
    REQUIRE(composed[0].physical_index == 1);
    REQUIRE(composed[0].dtype == DType::UInt8);
    REQUIRE(composed[1].name == "packed");
    REQUIRE(composed[1].physical_index == 3);
    REQUIRE(composed[1].dtype == DType::UInt16);
}

TEST_CASE("Format precomputes shift and maximum", "[format]") {
    PointFormat format;
    REQUIRE(PointFormat::create(sample_schema(), sample_composed(), format) == Error::Ok);

    const ComposedField* owner = nullptr;
    const SubField* mid = format.find_sub_field("mid", &owner);
    REQUIRE(mid != nullptr);
    REQUIRE(owner != nullptr);
    REQUIRE(owner->name == "packed");
    REQUIRE(mid->shift == 4);
    REQUIRE(mid->max_value == 0xFF);
    REQUIRE(mid->bit_width == 8);
    REQUIRE(mid->dtype == DType::UInt8);

    const SubField* b = format.find_sub_field("b");
    REQUIRE(b != nullptr);
    REQUIRE(b->shift == 1);
    REQUIRE(b->max_value == 0x7F);

    REQUIRE(format.find_sub_field("nope") == nullptr);
    REQUIRE(format.find_composed("packed") == &format.composed_fields()[1]);
    REQUIRE(format.find_composed("X") == nullptr);
}

TEST_CASE("Expanded schema replaces composed fields in place", "[format][expanded]") {
    PointFormat format;
    REQUIRE(PointFormat::create(sample_schema(), sample_composed(), format) == Error::Ok);

    const Schema expected = {
        {"X", DType::Int32},
        {"a", DType::UInt8},
        {"b", DType::UInt8},
        {"intensity", DType::UInt16},
        {"low", DType::UInt8},
        {"mid", DType::UInt8},
        {"high", DType::UInt16},
    };
    REQUIRE(format.expanded_schema() == expected);
    REQUIRE(format.physical_schema() == sample_schema());

    // Indices point at the matching expanded column
    for (const auto& field : format.composed_fields()) {
        for (const auto& sub : field.sub_fields) {
            REQUIRE(format.expanded_schema()[sub.expanded_index].name == sub.name);
        }
    }

    const auto& plain = format.plain_fields();
    REQUIRE(plain.size() == 2);
    REQUIRE(plain[0].physical_index == 0);
    REQUIRE(plain[0].expanded_index == 0);
    REQUIRE(plain[1].physical_index == 2);
    REQUIRE(plain[1].expanded_index == 3);
}

TEST_CASE("Format without composed fields", "[format]") {
    PointFormat format;
    REQUIRE(PointFormat::create(sample_schema(), {}, format) == Error::Ok);
    REQUIRE(format.expanded_schema() == format.physical_schema());
    REQUIRE(format.composed_fields().empty());
    REQUIRE(format.plain_fields().size() == 4);
    REQUIRE(format.record_size() == 9);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("Zero mask is rejected", "[format][error]") {
    PointFormat format;
    ErrorDetail detail;
    auto composed = sample_composed();
    composed[0].sub_fields[1].mask = 0;

    REQUIRE(PointFormat::create(sample_schema(), composed, format, &detail) ==
            Error::InvalidMask);
    REQUIRE(detail.code == Error::InvalidMask);
    REQUIRE(detail.field == "packed");
    REQUIRE(detail.sub_field == "mid");
}

TEST_CASE("Mask wider than container is rejected", "[format][error]") {
    PointFormat format;
    ErrorDetail detail;
    auto composed = sample_composed();
    composed[1].sub_fields[1].mask = 0x1FE;

    REQUIRE(PointFormat::create(sample_schema(), composed, format, &detail) ==
            Error::InvalidMask);
    REQUIRE(detail.field == "flags");
    REQUIRE(detail.sub_field == "b");
}

#if !POINTPACK_ALLOW_OVERLAPPING_MASKS
TEST_CASE("Overlapping masks are rejected", "[format][error]") {
    PointFormat format;
    ErrorDetail detail;
    auto composed = sample_composed();
    composed[0].sub_fields[2].mask = 0xF800;

    REQUIRE(PointFormat::create(sample_schema(), composed, format, &detail) ==
            Error::InvalidMask);
    REQUIRE(detail.field == "packed");
    REQUIRE(detail.sub_field == "high");
}
#endif

TEST_CASE("Sub-field type too narrow for its mask is rejected", "[format][error]") {
    PointFormat format;
    ErrorDetail detail;
    auto composed = sample_composed();
    composed[0].sub_fields[1].mask = 0x1FF0;
    composed[0].sub_fields[2].mask = 0xE000;

    REQUIRE(PointFormat::create(sample_schema(), composed, format, &detail) ==
            Error::InvalidArg);
    REQUIRE(detail.sub_field == "mid");
}

TEST_CASE("Signed sub-field type is rejected", "[format][error]") {
    PointFormat format;
    auto composed = sample_composed();
    composed[1].sub_fields[0].dtype = DType::Int8;
    REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
}

TEST_CASE("Composed field missing from schema", "[format][error]") {
    PointFormat format;
    ErrorDetail detail;
    std::vector<ComposedFieldDescriptor> composed = {{"classification", {{"c", 0x1F}}}};

    REQUIRE(PointFormat::create(sample_schema(), composed, format, &detail) ==
            Error::SchemaMismatch);
    REQUIRE(detail.field == "classification");
}

TEST_CASE("Invalid composed declarations", "[format][error]") {
    PointFormat format;

    SECTION("floating point container") {
        Schema schema = {{"f", DType::Float32}};
        std::vector<ComposedFieldDescriptor> composed = {{"f", {{"s", 0x1}}}};
        REQUIRE(PointFormat::create(schema, composed, format) == Error::InvalidArg);
    }

    SECTION("declared twice") {
        auto composed = sample_composed();
        composed.push_back(composed[1]);
        REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
    }

    SECTION("no sub-fields") {
        std::vector<ComposedFieldDescriptor> composed = {{"flags", {}}};
        REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
    }

    SECTION("unnamed sub-field") {
        std::vector<ComposedFieldDescriptor> composed = {{"flags", {{"", 0x1}}}};
        REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
    }
}

TEST_CASE("Duplicate names are rejected", "[format][error]") {
    PointFormat format;

    SECTION("physical fields") {
        Schema schema = sample_schema();
        schema.push_back({"X", DType::Int32});
        REQUIRE(PointFormat::create(schema, {}, format) == Error::InvalidArg);
    }

    SECTION("sub-field shadows a plain field") {
        auto composed = sample_composed();
        composed[1].sub_fields[0].name = "intensity";
        REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
    }

    SECTION("sub-field names across composed fields") {
        auto composed = sample_composed();
        composed[1].sub_fields[0].name = "low";
        REQUIRE(PointFormat::create(sample_schema(), composed, format) == Error::InvalidArg);
    }
}

TEST_CASE("Failed create leaves format untouched", "[format][error]") {
    PointFormat format;
    REQUIRE(PointFormat::create(sample_schema(), sample_composed(), format) == Error::Ok);

    auto composed = sample_composed();
    composed[0].sub_fields[0].mask = 0;
    REQUIRE(PointFormat::create(Schema{{"only", DType::UInt8}}, composed, format) != Error::Ok);
    REQUIRE(format.physical_schema() == sample_schema());
}

TEST_CASE("Throwing create", "[format][error]") {
    REQUIRE_NOTHROW(PointFormat::make(sample_schema(), sample_composed()));

    auto composed = sample_composed();
    composed[0].sub_fields[0].mask = 0;
    REQUIRE_THROWS_AS(PointFormat::make(sample_schema(), composed), InvalidMaskException);

    std::vector<ComposedFieldDescriptor> missing = {{"nope", {{"n", 0x1}}}};
    REQUIRE_THROWS_AS(PointFormat::make(sample_schema(), missing), SchemaMismatchException);
}

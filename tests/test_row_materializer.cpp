#include <catch2/catch_test_macros.hpp>
#include "db/result_set.hpp"
#include "mapper/plan_resolver.hpp"
#include "mapper/row_materializer.hpp"
#include "mapper/type_registry.hpp"

#include <stdexcept>

using namespace rowmap;

namespace {

struct Reading {
    int32_t sensor = -1;
    double value = 0.0;
    std::optional<std::string> note;
    std::string unit = "C";
    bool flagged = false;

    std::string summary() const { return unit; }
};

struct NoDefault {
    explicit NoDefault(int32_t v) : value(v) {}
    int32_t value;
};

struct Fragile {
    Fragile() { throw std::runtime_error("boom"); }
    int32_t value = 0;
};

struct Opaque {
    std::vector<int> parts;
};

// Registry with no converters at all: every entry uses passthrough
class NoConverters : public IConverterRegistry {
public:
    std::optional<Converter> find_converter(std::type_index) const override {
        return std::nullopt;
    }
};

struct Fixture {
    std::shared_ptr<TypeRegistry> types = std::make_shared<TypeRegistry>();
    std::shared_ptr<PlanResolver> resolver;
    ConverterRegistry converters;
    MappingConfig config;

    Fixture() {
        types->register_type<Reading>("Reading")
            .property("sensor", &Reading::sensor)
            .property("value", &Reading::value)
            .property("note", &Reading::note)
            .property("unit", &Reading::unit)
            .property("flagged", &Reading::flagged)
            .read_only("summary", &Reading::summary);
        types->register_type<NoDefault>("NoDefault").property("value", &NoDefault::value);
        types->register_type<Fragile>("Fragile").property("value", &Fragile::value);
        types->register_type<Opaque>("Opaque").property("parts", &Opaque::parts);
        resolver = std::make_shared<PlanResolver>(std::make_shared<PropertyCatalog>(
            std::make_shared<RegisteredTypeIntrospector>(types)));
    }

    template<typename T>
    std::shared_ptr<const MappingPlan> plan_for(const ResultSet& rs,
                                                const IConverterRegistry& registry) {
        return resolver->resolve(std::type_index(typeid(T)), "", rs.signature(), config,
                                 registry);
    }

    template<typename T>
    std::shared_ptr<const MappingPlan> plan_for(const ResultSet& rs) {
        return plan_for<T>(rs, converters);
    }
};

} // anonymous namespace

TEST_CASE("RowMaterializer", "[row_materializer]") {
    Fixture f;

    SECTION("Writes mapped columns and leaves the rest at defaults") {
        const ResultSet rs({"sensor", "value"}, {{int64_t{3}, 21.5}});
        auto r = RowMaterializer::materialize_as<Reading>(*f.plan_for<Reading>(rs), rs.row(0));
        REQUIRE(r.sensor == 3);
        REQUIRE(r.value == 21.5);
        REQUIRE(r.unit == "C");
        REQUIRE_FALSE(r.note.has_value());
    }

    SECTION("NULL into an optional slot") {
        const ResultSet rs({"sensor", "note"},
                           {{int64_t{1}, std::monostate{}},
                            {int64_t{2}, std::string("calibrated")}});
        auto plan = f.plan_for<Reading>(rs);
        auto first = RowMaterializer::materialize_as<Reading>(*plan, rs.row(0));
        auto second = RowMaterializer::materialize_as<Reading>(*plan, rs.row(1));
        REQUIRE_FALSE(first.note.has_value());
        REQUIRE(second.note == std::optional<std::string>("calibrated"));
    }

    SECTION("NULL into a non-optional slot is a distinct failure") {
        const ResultSet rs({"sensor", "value"}, {{int64_t{1}, std::monostate{}}});
        auto plan = f.plan_for<Reading>(rs);
        try {
            (void)RowMaterializer::materialize(*plan, rs.row(0));
            FAIL("expected NullValueError");
        } catch (const NullValueError& e) {
            REQUIRE(e.property() == "value");
            REQUIRE(e.category() == ErrorCategory::NULL_VALUE);
        }
    }

    SECTION("Unconvertible value names the property") {
        const ResultSet rs({"sensor"}, {{std::string("north")}});
        auto plan = f.plan_for<Reading>(rs);
        try {
            (void)RowMaterializer::materialize(*plan, rs.row(0));
            FAIL("expected PropertyWriteError");
        } catch (const PropertyWriteError& e) {
            REQUIRE(e.property() == "sensor");
            REQUIRE(e.category() == ErrorCategory::PROPERTY_WRITE);
            REQUIRE_FALSE(e.cause().empty());
        }
    }

    SECTION("A failed row leaves the plan usable") {
        const ResultSet rs({"sensor"}, {{std::string("north")}, {int64_t{9}}});
        auto plan = f.plan_for<Reading>(rs);
        REQUIRE_THROWS_AS(RowMaterializer::materialize(*plan, rs.row(0)), PropertyWriteError);
        REQUIRE(RowMaterializer::materialize_as<Reading>(*plan, rs.row(1)).sensor == 9);
    }

    SECTION("Read-only property fails per row") {
        const ResultSet rs({"sensor", "summary"}, {{int64_t{1}, std::string("x")}});
        auto plan = f.plan_for<Reading>(rs);
        REQUIRE(plan->size() == 2);
        try {
            (void)RowMaterializer::materialize(*plan, rs.row(0));
            FAIL("expected PropertyWriteError");
        } catch (const PropertyWriteError& e) {
            REQUIRE(e.property() == "summary");
        }
    }

    SECTION("Passthrough values are coerced on assignment") {
        NoConverters none;
        const ResultSet rs({"sensor", "value", "note", "flagged"},
                           {{std::string("12"), int64_t{4}, std::string("ok"), std::string("t")}});
        auto plan = f.plan_for<Reading>(rs, none);
        auto r = RowMaterializer::materialize_as<Reading>(*plan, rs.row(0));
        REQUIRE(r.sensor == 12);
        REQUIRE(r.value == 4.0);
        REQUIRE(r.note == std::optional<std::string>("ok"));
        REQUIRE(r.flagged);
    }

    SECTION("Passthrough into a type with no conversion fails on write") {
        const ResultSet rs({"parts"}, {{std::string("1,2,3")}});
        auto plan = f.plan_for<Opaque>(rs);
        REQUIRE_FALSE(plan->entries()[0].typed_converter);
        REQUIRE_THROWS_AS(RowMaterializer::materialize(*plan, rs.row(0)), PropertyWriteError);
    }

    SECTION("Type without default constructor") {
        const ResultSet rs({"value"}, {{int64_t{1}}});
        auto plan = f.plan_for<NoDefault>(rs);
        REQUIRE_THROWS_AS(RowMaterializer::materialize(*plan, rs.row(0)), InstantiationError);
    }

    SECTION("Throwing constructor") {
        const ResultSet rs({"value"}, {{int64_t{1}}});
        auto plan = f.plan_for<Fragile>(rs);
        REQUIRE_THROWS_AS(RowMaterializer::materialize(*plan, rs.row(0)), InstantiationError);
    }

    SECTION("Row narrower than the plan") {
        const ResultSet wide({"sensor", "value"}, {{int64_t{1}, 2.0}});
        const ResultSet narrow({"sensor"}, {{int64_t{1}}});
        auto plan = f.plan_for<Reading>(wide);
        try {
            (void)RowMaterializer::materialize(*plan, narrow.row(0));
            FAIL("expected MappingError");
        } catch (const MappingError& e) {
            REQUIRE(e.category() == ErrorCategory::SIGNATURE_MISMATCH);
        }
    }

    SECTION("Typed access checks the target type") {
        const ResultSet rs({"value"}, {{int64_t{1}}});
        auto plan = f.plan_for<Reading>(rs);
        REQUIRE_THROWS_AS(RowMaterializer::materialize_as<NoDefault>(*plan, rs.row(0)),
                          MappingError);
    }

    SECTION("Each call allocates a new instance") {
        const ResultSet rs({"sensor"}, {{int64_t{1}}});
        auto plan = f.plan_for<Reading>(rs);
        auto a = RowMaterializer::materialize(*plan, rs.row(0));
        auto b = RowMaterializer::materialize(*plan, rs.row(0));
        REQUIRE(a.get() != b.get());
    }
}

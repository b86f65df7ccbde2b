#include <catch2/catch_test_macros.hpp>
#include "mapper/row_mapper.hpp"
#include "mapper/type_registry.hpp"

using namespace rowmap;

namespace {

struct Sample {
    std::string name;
    int32_t value = 0;
    Uuid uuid;

    // Accessor pair, like a bean property
    int32_t get_value() const { return value; }
    void set_value(int32_t v) { value = v; }
};

struct Order {
    int64_t id = 0;
    std::string status;
};

struct Unmapped {
    int32_t x = 0;
};

std::shared_ptr<TypeRegistry> make_registry() {
    auto registry = std::make_shared<TypeRegistry>();
    registry->register_type<Sample>("Sample")
        .property("name", &Sample::name)
        .property("value", &Sample::get_value, &Sample::set_value)
        .property("uuid", &Sample::uuid).column("something");
    registry->register_type<Order>("Order")
        .property("id", &Order::id)
        .property("status", &Order::status);
    return registry;
}

const Uuid kUuid = Uuid::from_parts(42, 42);

// Fixed-answer factory for registry ordering tests
class OrderOnlyFactory : public RowMapperFactory {
public:
    explicit OrderOnlyFactory(BeanMapperFactory delegate) : delegate_(std::move(delegate)) {}

    bool supports(std::type_index type) const override {
        return type == std::type_index(typeid(Order));
    }

    std::shared_ptr<const RowMapper> build(std::type_index type) const override {
        ++builds;
        return delegate_.build(type);
    }

    mutable int builds = 0;

private:
    BeanMapperFactory delegate_;
};

// Builds Sample mappers after looking up Order in the registry it serves
class DependentFactory : public RowMapperFactory {
public:
    DependentFactory(BeanMapperFactory delegate, MapperRegistry& registry)
        : delegate_(std::move(delegate)), registry_(registry) {}

    bool supports(std::type_index type) const override {
        return type == std::type_index(typeid(Sample));
    }

    std::shared_ptr<const RowMapper> build(std::type_index type) const override {
        dependency = registry_.find_mapper(std::type_index(typeid(Order)));
        return delegate_.build(type);
    }

    mutable std::shared_ptr<const RowMapper> dependency;

private:
    BeanMapperFactory delegate_;
    MapperRegistry& registry_;
};

} // anonymous namespace

TEST_CASE("BeanMapper", "[row_mapper]") {
    auto context = MapperContext::create(make_registry());
    BeanMapperFactory factory(context);

    const ResultSet rs({"name", "value", "something"},
                       {{std::string("alice"), int64_t{42}, kUuid.to_string()},
                        {std::string("bob"), int64_t{7}, kUuid.to_string()}});

    SECTION("Maps name, value and a renamed uuid column") {
        auto mapper = factory.build<Sample>();
        auto sample = mapper.map(rs.row(0));
        REQUIRE(sample.name == "alice");
        REQUIRE(sample.value == 42);
        REQUIRE(sample.uuid == kUuid);
    }

    SECTION("Plan has one entry per column") {
        BeanMapper mapper(std::type_index(typeid(Sample)), "", context);
        auto plan = mapper.resolve(rs.signature());
        REQUIRE(plan->size() == 3);
        REQUIRE(plan->entry_for("uuid")->column_label == "something");
    }

    SECTION("Specialized mapper reuses its plan") {
        auto mapper = factory.build<Sample>().specialize(rs.signature());
        auto before = context.resolver->get_stats();
        auto a = mapper.map(rs.row(0));
        auto b = mapper.map(rs.row(1));
        auto after = context.resolver->get_stats();
        REQUIRE(a.name == "alice");
        REQUIRE(b.name == "bob");
        REQUIRE(after.hits == before.hits);
        REQUIRE(after.misses == before.misses);
    }

    SECTION("Specialized mapper falls back for another signature") {
        auto mapper = factory.build<Sample>().specialize(rs.signature());
        const ResultSet other({"NAME"}, {{std::string("carol")}});
        REQUIRE(mapper.map(other.row(0)).name == "carol");
    }

    SECTION("Specialize surfaces resolution errors eagerly") {
        context.config.set_strict_matching(true);
        BeanMapperFactory strict(context);
        auto mapper = strict.build<Sample>();
        REQUIRE_THROWS_AS(mapper.specialize({"name", "extra"}), IncompleteMappingError);
    }

    SECTION("map_all maps every row") {
        auto all = map_all(factory.build<Sample>(), rs);
        REQUIRE(all.size() == 2);
        REQUIRE(all[1].name == "bob");
        REQUIRE(all[1].value == 7);

        const ResultSet empty({"name"}, {});
        REQUIRE(map_all(factory.build<Sample>(), empty).empty());
    }

    SECTION("Prefix splits a joined row") {
        const ResultSet joined({"o_id", "o_status", "s_name", "s_value"},
                               {{int64_t{10}, std::string("open"), std::string("dan"),
                                 int64_t{3}}});
        auto orders = BeanMapperFactory(context, "o_").build<Order>();
        auto samples = BeanMapperFactory(context, "s_").build<Sample>();
        auto o = orders.map(joined.row(0));
        auto s = samples.map(joined.row(0));
        REQUIRE(o.id == 10);
        REQUIRE(o.status == "open");
        REQUIRE(s.name == "dan");
        REQUIRE(s.value == 3);
    }

    SECTION("Factory rejects unknown types") {
        REQUIRE_FALSE(factory.supports(std::type_index(typeid(Unmapped))));
        REQUIRE(factory.supports(std::type_index(typeid(Sample))));
        REQUIRE_THROWS_AS(factory.build(std::type_index(typeid(Unmapped))), IntrospectionError);
    }

    SECTION("Typed mapper checks the target type") {
        REQUIRE_THROWS_AS(TypedRowMapper<Order>(factory.build(std::type_index(typeid(Sample)))),
                          MappingError);
    }
}

TEST_CASE("MapperRegistry", "[row_mapper]") {
    auto context = MapperContext::create(make_registry());
    MapperRegistry registry;

    SECTION("No factory, no mapper") {
        REQUIRE_FALSE(registry.find_mapper<Sample>().has_value());
    }

    SECTION("Mappers are memoized per type") {
        auto order_factory = std::make_shared<OrderOnlyFactory>(BeanMapperFactory(context));
        registry.register_factory(order_factory);

        auto first = registry.find_mapper(std::type_index(typeid(Order)));
        auto second = registry.find_mapper(std::type_index(typeid(Order)));
        REQUIRE(first != nullptr);
        REQUIRE(first == second);
        REQUIRE(order_factory->builds == 1);
        REQUIRE(registry.find_mapper(std::type_index(typeid(Sample))) == nullptr);
    }

    SECTION("Last registered factory wins") {
        auto order_factory = std::make_shared<OrderOnlyFactory>(BeanMapperFactory(context));
        registry.register_factory(std::make_shared<BeanMapperFactory>(context, "x_"));
        registry.register_factory(order_factory);
        REQUIRE(registry.factory_count() == 2);

        auto mapper = registry.find_mapper<Order>();
        REQUIRE(mapper.has_value());
        REQUIRE(order_factory->builds == 1);

        const ResultSet rs({"id", "status"}, {{int64_t{1}, std::string("new")}});
        REQUIRE(mapper->map(rs.row(0)).status == "new");

        // Sample is only supported by the earlier, prefixed factory
        auto sample = registry.find_mapper<Sample>();
        REQUIRE(sample.has_value());
        const ResultSet prefixed({"x_name"}, {{std::string("eve")}});
        REQUIRE(sample->map(prefixed.row(0)).name == "eve");
    }

    SECTION("A factory may look up other types while building") {
        auto order_factory = std::make_shared<OrderOnlyFactory>(BeanMapperFactory(context));
        auto sample_factory = std::make_shared<DependentFactory>(BeanMapperFactory(context), registry);
        registry.register_factory(order_factory);
        registry.register_factory(sample_factory);

        auto sample = registry.find_mapper<Sample>();
        REQUIRE(sample.has_value());
        REQUIRE(sample_factory->dependency != nullptr);
        REQUIRE(sample_factory->dependency == registry.find_mapper(std::type_index(typeid(Order))));
        REQUIRE(order_factory->builds == 1);
    }
}

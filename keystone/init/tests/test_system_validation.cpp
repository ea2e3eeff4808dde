#include <catch2/catch_test_macros.hpp>
#include <keystone/init/system_validation.hpp>
#include <keystone/init/errors.hpp>
#include <keystone/init/init_events.hpp>
#include <keystone/di/service_container.hpp>
#include "test_managers.hpp"

using namespace keystone;
using namespace keystone::init;
using namespace keystone::init::test;

namespace {

ManagerDescriptor describe(IManager& manager, const std::string& type_name = {}) {
    ManagerDescriptor descriptor;
    descriptor.manager = &manager;
    descriptor.type = typeid(manager);
    descriptor.type_name = type_name;
    descriptor.name = manager.name();
    descriptor.priority = manager.priority();
    descriptor.category = manager.category();
    descriptor.initialized = manager.is_initialized();
    return descriptor;
}

class InventoryManager : public ManagerBase, public IValidatable {
public:
    InventoryManager() : ManagerBase("Inventory") {}

    ValidationResult validate() const override {
        ValidationResult result;
        result.valid = stock >= 0;
        if (!result.valid) result.errors.push_back("negative stock");
        result.warnings.push_back("stock not audited");
        return result;
    }

    int stock = 0;

protected:
    bool on_initialize() override { return true; }
};

} // namespace

TEST_CASE("SystemValidation detects dependency cycles", "[init][validation]") {
    EconomyManager a("A", ManagerPriority::Normal, {"B"});
    WeatherManager b("B", ManagerPriority::Normal, {"C"});
    ResearchManager c("C", ManagerPriority::Normal, {"A"});
    HudManager d("D", ManagerPriority::Low, {"A"});

    SECTION("a three node cycle is reported once, closing on its first node") {
        std::vector<ManagerDescriptor> descriptors{describe(b), describe(a), describe(c), describe(d)};
        auto cycles = SystemValidationService::detect_cycles(descriptors);

        REQUIRE(cycles.size() == 1);
        REQUIRE(cycles[0] == std::vector<std::string>{"A", "B", "C", "A"});
        REQUIRE(std::string(DependencyCycleError(cycles[0]).what()) ==
                "Circular dependency detected: A -> B -> C -> A");
    }

    SECTION("an acyclic graph has no cycles") {
        WeatherManager b2("B", ManagerPriority::Normal, {"C"});
        ResearchManager c2("C");
        std::vector<ManagerDescriptor> descriptors{describe(a), describe(b2), describe(c2)};
        REQUIRE(SystemValidationService::detect_cycles(descriptors).empty());
    }

    SECTION("a self dependency is a cycle") {
        SaveManager self("Save", ManagerPriority::Low, {"Save"});
        std::vector<ManagerDescriptor> descriptors{describe(self)};
        auto cycles = SystemValidationService::detect_cycles(descriptors);
        REQUIRE(cycles.size() == 1);
        REQUIRE(cycles[0] == std::vector<std::string>{"Save", "Save"});
    }
}

TEST_CASE("SystemValidation resolves dependencies by name or type name", "[init][validation]") {
    EconomyManager economy("Economy");
    WeatherManager weather("Weather", ManagerPriority::Normal, {"EconomyManager", "Ghost"});

    std::vector<ManagerDescriptor> descriptors{
        describe(economy, "keystone::init::test::EconomyManager"),
        describe(weather, "keystone::init::test::WeatherManager"),
    };

    REQUIRE(SystemValidationService::resolve_dependency(descriptors, "Economy") == 0);
    REQUIRE(SystemValidationService::resolve_dependency(descriptors, "EconomyManager") == 0);
    REQUIRE(SystemValidationService::resolve_dependency(descriptors, "keystone::init::test::WeatherManager") == 1);
    REQUIRE(SystemValidationService::resolve_dependency(descriptors, "Ghost") == -1);

    auto missing = SystemValidationService::find_missing(descriptors);
    REQUIRE(missing.size() == 1);
    REQUIRE(missing[0].first == "Weather");
    REQUIRE(missing[0].second == "Ghost");
}

TEST_CASE("SystemValidation validate_all", "[init][validation]") {
    core::EventDispatcher events;
    std::vector<ManagerValidatedEvent> validated;
    std::vector<ValidationCompletedEvent> completed;
    auto c1 = events.subscribe<ManagerValidatedEvent>([&](const ManagerValidatedEvent& e) { validated.push_back(e); });
    auto c2 = events.subscribe<ValidationCompletedEvent>([&](const ValidationCompletedEvent& e) { completed.push_back(e); });

    SECTION("healthy managers pass, with a warning when no container is attached") {
        EconomyManager economy("Economy");
        REQUIRE(economy.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(economy)};

        SystemValidationService validation(events, false);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(summary.overall_valid);
        REQUIRE(summary.total == 1);
        REQUIRE(summary.valid == 1);
        REQUIRE(summary.all_errors.empty());
        REQUIRE(summary.warnings.size() == 1);
        REQUIRE(validated.size() == 1);
        REQUIRE(validated[0].valid);
        REQUIRE(completed.size() == 1);
        REQUIRE(completed[0].overall_valid);
    }

    SECTION("recovery gives an unfinished manager one more attempt") {
        WeatherManager weather("Weather", ManagerPriority::Normal, {}, 1);
        REQUIRE_FALSE(weather.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(weather)};
        descriptors[0].attempts = 1;

        SystemValidationService validation(events, false, true, true);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(weather.is_initialized());
        REQUIRE(descriptors[0].initialized);
        REQUIRE(descriptors[0].attempts == 2);
        REQUIRE(summary.valid == 1);
    }

    SECTION("without recovery an unfinished manager is invalid") {
        WeatherManager weather("Weather", ManagerPriority::Normal, {}, 1);
        std::vector<ManagerDescriptor> descriptors{describe(weather)};

        SystemValidationService validation(events, false, true, false);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(weather.calls == 0);
        REQUIRE(summary.invalid == 1);
        REQUIRE_FALSE(summary.overall_valid);
        REQUIRE(summary.all_errors == std::vector<std::string>{"Weather is not initialized"});
    }

    SECTION("self checks are merged into the summary") {
        InventoryManager inventory;
        REQUIRE(inventory.initialize());
        inventory.stock = -4;
        std::vector<ManagerDescriptor> descriptors{describe(inventory)};

        SystemValidationService validation(events, false);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(summary.invalid == 1);
        REQUIRE(summary.all_errors == std::vector<std::string>{"Inventory: negative stock"});
        REQUIRE(validated.size() == 1);
        REQUIRE_FALSE(validated[0].valid);
        REQUIRE(validated[0].errors == std::vector<std::string>{"Inventory: negative stock"});
    }

    SECTION("dependency findings are errors") {
        EconomyManager a("A", ManagerPriority::Normal, {"B"});
        WeatherManager b("B", ManagerPriority::Normal, {"A", "Ghost"});
        REQUIRE(a.initialize());
        REQUIRE(b.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(a), describe(b)};

        SystemValidationService validation(events, false);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE_FALSE(summary.dependency_validation_passed);
        REQUIRE_FALSE(summary.overall_valid);
        REQUIRE(summary.cycles.size() == 1);
        REQUIRE(summary.missing_dependencies.size() == 1);
        REQUIRE(summary.all_errors.size() == 2);
        REQUIRE(summary.all_errors[0] == "Circular dependency detected: A -> B -> A");
        REQUIRE(summary.all_errors[1] == "Manager 'B' depends on missing manager 'Ghost'");
        REQUIRE(summary.valid == 1);
        REQUIRE(summary.invalid == 1);

        REQUIRE(validated.size() == 2);
        REQUIRE(validated[1].name == "B");
        REQUIRE(validated[1].errors == std::vector<std::string>{"B is missing dependency Ghost"});
    }

    SECTION("a missing dependency is counted once") {
        EconomyManager a("A", ManagerPriority::Normal, {"Ghost"});
        REQUIRE(a.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(a)};

        SystemValidationService validation(events, false);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(summary.missing_dependencies.size() == 1);
        REQUIRE(summary.all_errors == std::vector<std::string>{"Manager 'A' depends on missing manager 'Ghost'"});
        REQUIRE(summary.invalid == 1);
        REQUIRE_FALSE(validated[0].valid);
    }

    SECTION("dependency checks can be disabled") {
        EconomyManager a("A", ManagerPriority::Normal, {"Ghost"});
        REQUIRE(a.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(a)};

        SystemValidationService validation(events, false, false);
        ValidationSummary summary = validation.validate_all(descriptors);
        REQUIRE(summary.overall_valid);
        REQUIRE(summary.missing_dependencies.empty());
    }

    SECTION("managers missing from the container are warnings") {
        di::ServiceContainer container;
        container.register_singleton<std::string>(std::make_shared<std::string>("ledger"));
        EconomyManager economy("Economy");
        REQUIRE(economy.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(economy)};

        SystemValidationService validation(events, false);
        validation.set_container(&container);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE(summary.overall_valid);
        REQUIRE(summary.service_container_valid);
        REQUIRE(summary.warnings.size() == 1);
        REQUIRE(summary.warnings[0] == "Economy is not registered in the service container");
    }

    SECTION("a broken container binding fails validation") {
        di::ServiceContainer container;
        container.register_singleton<std::string>([](di::IServiceResolver&) { return std::shared_ptr<std::string>{}; });
        EconomyManager economy("Economy");
        REQUIRE(economy.initialize());
        std::vector<ManagerDescriptor> descriptors{describe(economy)};

        SystemValidationService validation(events, false);
        validation.set_container(&container);
        ValidationSummary summary = validation.validate_all(descriptors);

        REQUIRE_FALSE(summary.service_container_valid);
        REQUIRE_FALSE(summary.overall_valid);
        REQUIRE(summary.valid == 1);
        REQUIRE(summary.all_errors.size() == 1);
        REQUIRE(summary.all_errors[0].rfind("Service container: ", 0) == 0);
        REQUIRE(completed.size() == 1);
        REQUIRE_FALSE(completed[0].overall_valid);
    }
}

#include <catch2/catch_test_macros.hpp>
#include <keystone/di/container_builder.hpp>
#include <keystone/core/log.hpp>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace keystone::di;

namespace {

class IMarket {
public:
    virtual ~IMarket() = default;
    virtual int price() const = 0;
};

class SpotMarket : public IMarket {
public:
    int price() const override { return 10; }
};

class FuturesMarket : public IMarket {
public:
    int price() const override { return 12; }
};

struct Ledger {};

// Records the order of configure/initialize calls across modules
class RecordingModule : public IServiceModule {
public:
    RecordingModule(std::string name, std::vector<std::string>* log, std::vector<std::string> deps = {})
        : m_name(std::move(name)), m_log(log), m_deps(std::move(deps)) {}

    std::string name() const override { return m_name; }
    std::vector<std::string> dependencies() const override { return m_deps; }

    void configure_services(ServiceContainer&) override { m_log->push_back("configure:" + m_name); }
    void initialize(ServiceContainer&) override { m_log->push_back("initialize:" + m_name); }

private:
    std::string m_name;
    std::vector<std::string>* m_log;
    std::vector<std::string> m_deps;
};

class MarketModule : public IServiceModule {
public:
    std::string name() const override { return "market"; }
    std::string version() const override { return "2.1.0"; }
    void configure_services(ServiceContainer& container) override {
        container.register_singleton<IMarket, SpotMarket>();
    }
    void initialize(ServiceContainer& container) override {
        initialized_price = container.resolve<IMarket>()->price();
    }
    static inline int initialized_price = 0;
};

class BrokenModule : public IServiceModule {
public:
    std::string name() const override { return "broken"; }
    void configure_services(ServiceContainer&) override {
        throw std::runtime_error("bad configuration");
    }
};

class SlowModule : public IServiceModule {
public:
    std::string name() const override { return "slow"; }
    std::chrono::milliseconds initialization_timeout() const override {
        return std::chrono::milliseconds(1);
    }
    void configure_services(ServiceContainer&) override {}
    void initialize(ServiceContainer&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
};

} // namespace

TEST_CASE("ContainerBuilder applies registrations on build", "[di][builder]") {
    ServiceContainer container;
    ContainerBuilder builder(container);

    builder.add_singleton<IMarket, SpotMarket>()
           .add_transient<Ledger>();

    SECTION("Nothing is registered before build") {
        REQUIRE_FALSE(container.is_registered<IMarket>());
        REQUIRE_FALSE(builder.is_built());
    }

    SECTION("Build registers everything") {
        ServiceContainer& built = builder.build();
        REQUIRE(&built == &container);
        REQUIRE(container.resolve<IMarket>()->price() == 10);
        REQUIRE(container.resolve<Ledger>() != container.resolve<Ledger>());
        REQUIRE(builder.is_built());
    }

    SECTION("Second build is a no-op") {
        keystone::core::set_console_output(false);
        builder.build();
        REQUIRE_NOTHROW(builder.build());
        REQUIRE(container.statistics().total_registrations == 2);
        keystone::core::set_console_output(true);
    }
}

TEST_CASE("ContainerBuilder advanced registrations", "[di][builder]") {
    ServiceContainer container;
    ContainerBuilder builder(container);

    SECTION("Named, collection and decorator actions run in order") {
        builder.add_collection<IMarket, SpotMarket, FuturesMarket>()
               .add_named<IMarket, FuturesMarket>("futures")
               .add_decorator<IMarket>([](std::shared_ptr<IMarket> inner, IServiceResolver&) {
                   return inner;
               })
               .build();

        REQUIRE(container.resolve_all<IMarket>().size() == 2);
        REQUIRE(container.resolve_named<IMarket>("futures")->price() == 12);
        REQUIRE(container.resolve<IMarket>()->price() == 12);
    }

    SECTION("Conditional registration sees earlier actions") {
        builder.add_singleton<Ledger>()
               .add_conditional<IMarket, SpotMarket>([](IServiceResolver& r) { return r.is_registered<Ledger>(); })
               .build();
        REQUIRE(container.is_registered<IMarket>());
    }

    SECTION("configure_if only applies when the condition holds") {
        builder.configure_if(false, [](ContainerBuilder& b) { b.add_singleton<Ledger>(); })
               .configure_if(true, [](ContainerBuilder& b) { b.add_singleton<IMarket, SpotMarket>(); })
               .build();
        REQUIRE_FALSE(container.is_registered<Ledger>());
        REQUIRE(container.is_registered<IMarket>());
    }

    SECTION("Registration errors abort the build") {
        builder.add_singleton<IMarket, SpotMarket>()
               .add_singleton<IMarket, FuturesMarket>();
        REQUIRE_THROWS_AS(builder.build(), DuplicateRegistrationError);
        REQUIRE_FALSE(builder.is_built());
    }
}

TEST_CASE("ContainerBuilder modules", "[di][builder]") {
    keystone::core::set_console_output(false);
    ServiceContainer container;
    ContainerBuilder builder(container);
    std::vector<std::string> calls;

    SECTION("Configure pass completes before the initialize pass") {
        builder.add_modules({
            std::make_shared<RecordingModule>("a", &calls),
            std::make_shared<RecordingModule>("b", &calls),
        }).build();

        REQUIRE(calls == std::vector<std::string>{
            "configure:a", "configure:b", "initialize:a", "initialize:b"
        });
    }

    SECTION("Dependencies run first") {
        builder.add_module(std::make_shared<RecordingModule>("economy", &calls, std::vector<std::string>{"genetics"}))
               .add_module(std::make_shared<RecordingModule>("genetics", &calls, std::vector<std::string>{"core"}))
               .add_module(std::make_shared<RecordingModule>("core", &calls));

        REQUIRE(builder.module_order() == std::vector<std::string>{"core", "genetics", "economy"});
        builder.build();
        REQUIRE(calls.front() == "configure:core");
        REQUIRE(calls.back() == "initialize:economy");
    }

    SECTION("Module registrations are visible during initialize") {
        MarketModule::initialized_price = 0;
        builder.add_module<MarketModule>().build();
        REQUIRE(MarketModule::initialized_price == 10);
    }

    SECTION("Module failures are wrapped") {
        builder.add_module<BrokenModule>();
        try {
            builder.build();
            FAIL("build should throw");
        } catch (const ModuleConfigurationError& e) {
            REQUIRE(e.module() == "broken");
            REQUIRE(std::string(e.what()).find("bad configuration") != std::string::npos);
        }
    }

    SECTION("Unknown dependency is a configuration error") {
        builder.add_module(std::make_shared<RecordingModule>("ui", &calls, std::vector<std::string>{"missing"}));
        REQUIRE_THROWS_AS(builder.build(), ModuleConfigurationError);
        REQUIRE(calls.empty());
    }

    SECTION("Dependency cycles are rejected before anything runs") {
        builder.add_module(std::make_shared<RecordingModule>("x", &calls, std::vector<std::string>{"y"}))
               .add_module(std::make_shared<RecordingModule>("y", &calls, std::vector<std::string>{"x"}))
               .add_singleton<Ledger>();
        REQUIRE_THROWS_AS(builder.build(), ModuleConfigurationError);
        REQUIRE(calls.empty());
        REQUIRE_FALSE(container.is_registered<Ledger>());
    }

    SECTION("Duplicate module names are rejected") {
        builder.add_module(std::make_shared<RecordingModule>("a", &calls))
               .add_module(std::make_shared<RecordingModule>("a", &calls));
        REQUIRE_THROWS_AS(builder.build(), ModuleConfigurationError);
    }

    SECTION("Initialization past the timeout aborts the build") {
        builder.add_module<SlowModule>();
        REQUIRE_THROWS_AS(builder.build(), ModuleConfigurationError);
    }

    SECTION("Builder default timeout applies to modules without their own") {
        class DefaultTimeoutModule : public IServiceModule {
        public:
            std::string name() const override { return "default"; }
            void configure_services(ServiceContainer&) override {}
            void initialize(ServiceContainer&) override {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        };
        builder.set_module_timeout(std::chrono::milliseconds(1))
               .add_module(std::make_shared<DefaultTimeoutModule>());
        REQUIRE_THROWS_AS(builder.build(), ModuleConfigurationError);
    }

    keystone::core::set_console_output(true);
}

TEST_CASE("ContainerBuilder validation", "[di][builder]") {
    ServiceContainer container;
    ContainerBuilder builder(container);

    SECTION("Missing required service fails the build") {
        builder.add_singleton<Ledger>()
               .require<Ledger>()
               .require<IMarket>()
               .validate();
        try {
            builder.build();
            FAIL("build should throw");
        } catch (const ContainerValidationError& e) {
            std::string message = e.what();
            REQUIRE(message.find("IMarket") != std::string::npos);
            REQUIRE(message.find("Ledger") == std::string::npos);
        }
    }

    SECTION("Validation runs after modules") {
        builder.add_module<MarketModule>()
               .require<IMarket>()
               .validate();
        REQUIRE_NOTHROW(builder.build());
    }

    SECTION("Requirements without validate() are not enforced") {
        builder.require<IMarket>();
        REQUIRE_NOTHROW(builder.build());
    }
}

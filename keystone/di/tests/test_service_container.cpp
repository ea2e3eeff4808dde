#include <catch2/catch_test_macros.hpp>
#include <keystone/di/service_container.hpp>
#include <keystone/core/log.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keystone::di;

namespace {

class IGreeter {
public:
    virtual ~IGreeter() = default;
    virtual std::string greet() const = 0;
};

class EnglishGreeter : public IGreeter {
public:
    std::string greet() const override { return "hello"; }
};

class FrenchGreeter : public IGreeter {
public:
    std::string greet() const override { return "bonjour"; }
};

class LoudGreeter : public IGreeter {
public:
    explicit LoudGreeter(std::shared_ptr<IGreeter> inner) : m_inner(std::move(inner)) {}
    std::string greet() const override { return m_inner->greet() + "!"; }

private:
    std::shared_ptr<IGreeter> m_inner;
};

struct Counter {
    static inline int constructed = 0;
    Counter() { ++constructed; }
};

class Resource : public IDisposable {
public:
    void dispose() override { ++disposals; }
    int disposals = 0;
};

class IClock {
public:
    virtual ~IClock() = default;
};

class ResourceClock : public IClock, public IDisposable {
public:
    void dispose() override { ++disposals; }
    int disposals = 0;
};

struct NeedsGreeter {
    explicit NeedsGreeter(std::shared_ptr<IGreeter> g) : greeter(std::move(g)) {}
    std::shared_ptr<IGreeter> greeter;
};

} // namespace

TEST_CASE("ServiceContainer singleton registration", "[di][container]") {
    ServiceContainer container;

    SECTION("Instance registration resolves to the same object") {
        auto greeter = std::make_shared<EnglishGreeter>();
        container.register_singleton<IGreeter>(greeter);

        auto a = container.resolve<IGreeter>();
        auto b = container.resolve<IGreeter>();
        REQUIRE(a.get() == greeter.get());
        REQUIRE(a == b);
    }

    SECTION("Implementation registration constructs lazily, once") {
        Counter::constructed = 0;
        container.register_singleton<Counter>();
        REQUIRE(Counter::constructed == 0);

        auto a = container.resolve<Counter>();
        auto b = container.resolve<Counter>();
        REQUIRE(Counter::constructed == 1);
        REQUIRE(a == b);
    }

    SECTION("Factory receives the resolver") {
        container.register_singleton<IGreeter, FrenchGreeter>();
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        auto needs = container.resolve<NeedsGreeter>();
        REQUIRE(needs->greeter->greet() == "bonjour");
        REQUIRE(needs == container.resolve<NeedsGreeter>());
    }

    SECTION("Null instance is rejected") {
        REQUIRE_THROWS_AS(container.register_singleton<IGreeter>(std::shared_ptr<IGreeter>{}), ServiceError);
    }
}

TEST_CASE("ServiceContainer transient and scoped lifetimes", "[di][container]") {
    ServiceContainer container;

    SECTION("Transient yields a new instance per resolution") {
        container.register_transient<IGreeter, EnglishGreeter>();
        auto a = container.resolve<IGreeter>();
        auto b = container.resolve<IGreeter>();
        REQUIRE(a != b);
        REQUIRE(a->greet() == "hello");
    }

    SECTION("Factory registration is transient") {
        int calls = 0;
        container.register_factory<IGreeter>([&calls](IServiceResolver&) {
            ++calls;
            return std::make_shared<FrenchGreeter>();
        });
        container.resolve<IGreeter>();
        container.resolve<IGreeter>();
        REQUIRE(calls == 2);
    }

    SECTION("Scoped behaves as singleton within a container") {
        container.register_scoped<IGreeter, EnglishGreeter>();
        REQUIRE(container.resolve<IGreeter>() == container.resolve<IGreeter>());
    }

    SECTION("Default-constructible concrete types resolve directly") {
        container.register_transient<Counter>();
        REQUIRE(container.resolve<Counter>() != nullptr);
    }
}

TEST_CASE("ServiceContainer duplicate policy", "[di][container]") {
    SECTION("Strict rejects a second binding and keeps the first") {
        ServiceContainer container(DuplicatePolicy::Strict);
        container.register_singleton<IGreeter, EnglishGreeter>();
        REQUIRE_THROWS_AS((container.register_singleton<IGreeter, FrenchGreeter>()), DuplicateRegistrationError);
        REQUIRE(container.resolve<IGreeter>()->greet() == "hello");
    }

    SECTION("LastWins overwrites") {
        keystone::core::set_console_output(false);
        ServiceContainer container(DuplicatePolicy::LastWins);
        container.register_singleton<IGreeter, EnglishGreeter>();
        REQUIRE_NOTHROW(container.register_singleton<IGreeter, FrenchGreeter>());
        REQUIRE(container.resolve<IGreeter>()->greet() == "bonjour");
        REQUIRE(container.statistics().total_registrations == 1);
        keystone::core::set_console_output(true);
    }

    SECTION("Policy can be changed after construction") {
        ServiceContainer container;
        container.set_duplicate_policy(DuplicatePolicy::LastWins);
        REQUIRE(container.duplicate_policy() == DuplicatePolicy::LastWins);
    }

    SECTION("Policy names parse") {
        REQUIRE(parse_duplicate_policy("strict") == DuplicatePolicy::Strict);
        REQUIRE(parse_duplicate_policy("last_wins") == DuplicatePolicy::LastWins);
        REQUIRE(std::string(to_string(DuplicatePolicy::LastWins)) == "last_wins");
    }
}

TEST_CASE("ServiceContainer resolution failures", "[di][container]") {
    ServiceContainer container;

    SECTION("resolve throws for a missing binding") {
        REQUIRE_THROWS_AS(container.resolve<IGreeter>(), UnresolvedServiceError);
    }

    SECTION("try_resolve returns empty for a missing binding") {
        REQUIRE(container.try_resolve<IGreeter>() == nullptr);
    }

    SECTION("A factory returning null is a resolution failure") {
        container.register_singleton<IGreeter>([](IServiceResolver&) { return std::shared_ptr<IGreeter>{}; });
        REQUIRE_THROWS_AS(container.resolve<IGreeter>(), UnresolvedServiceError);
        REQUIRE(container.try_resolve<IGreeter>() == nullptr);
    }

    SECTION("Failures are counted and published") {
        std::vector<std::string> failed;
        auto conn = container.events().subscribe<ResolutionFailedEvent>([&](const ResolutionFailedEvent& e) {
            failed.push_back(e.capability_name);
        });

        (void)container.try_resolve<IGreeter>();
        REQUIRE(failed.size() == 1);
        REQUIRE(failed[0].find("IGreeter") != std::string::npos);
        REQUIRE(container.statistics().failed_resolutions == 1);
    }
}

TEST_CASE("ServiceContainer named and conditional bindings", "[di][container]") {
    ServiceContainer container;

    SECTION("Named bindings are independent of the default binding") {
        container.register_named<IGreeter, EnglishGreeter>("en");
        container.register_named<IGreeter>("fr", std::make_shared<FrenchGreeter>());

        REQUIRE(container.resolve_named<IGreeter>("en")->greet() == "hello");
        REQUIRE(container.resolve_named<IGreeter>("fr")->greet() == "bonjour");
        REQUIRE_FALSE(container.is_registered<IGreeter>());
        REQUIRE(container.is_registered_named<IGreeter>("fr"));
        REQUIRE(container.try_resolve_named<IGreeter>("de") == nullptr);
    }

    SECTION("Duplicate names follow the policy") {
        container.register_named<IGreeter, EnglishGreeter>("en");
        REQUIRE_THROWS_AS((container.register_named<IGreeter, FrenchGreeter>("en")), DuplicateRegistrationError);
    }

    SECTION("Conditional registration evaluates the predicate once, at registration") {
        int evaluations = 0;
        bool bound = container.register_conditional<IGreeter, EnglishGreeter>([&](IServiceResolver&) {
            ++evaluations;
            return false;
        });
        REQUIRE_FALSE(bound);
        REQUIRE_FALSE(container.is_registered<IGreeter>());

        bound = container.register_conditional<IGreeter, FrenchGreeter>([&](IServiceResolver& r) {
            ++evaluations;
            return !r.is_registered<IGreeter>();
        });
        REQUIRE(bound);
        container.resolve<IGreeter>();
        container.resolve<IGreeter>();
        REQUIRE(evaluations == 2);
    }
}

TEST_CASE("ServiceContainer decorators", "[di][container]") {
    ServiceContainer container;

    SECTION("Decorator wraps the current binding") {
        container.register_singleton<IGreeter, EnglishGreeter>();
        container.register_decorator<IGreeter>([](std::shared_ptr<IGreeter> inner, IServiceResolver&) {
            return std::make_shared<LoudGreeter>(std::move(inner));
        });

        auto greeter = container.resolve<IGreeter>();
        REQUIRE(greeter->greet() == "hello!");
        REQUIRE(greeter == container.resolve<IGreeter>());
        REQUIRE(container.registrations().front().decorated);
    }

    SECTION("Decorators keep a transient lifetime") {
        container.register_transient<IGreeter, FrenchGreeter>();
        container.register_decorator<IGreeter>([](std::shared_ptr<IGreeter> inner, IServiceResolver&) {
            return std::make_shared<LoudGreeter>(std::move(inner));
        });
        REQUIRE(container.resolve<IGreeter>() != container.resolve<IGreeter>());
    }

    SECTION("Decorating an unbound capability fails") {
        REQUIRE_THROWS_AS(container.register_decorator<IGreeter>(
            [](std::shared_ptr<IGreeter> inner, IServiceResolver&) { return inner; }),
            UnresolvedServiceError);
    }
}

TEST_CASE("ServiceContainer collections", "[di][container]") {
    ServiceContainer container;
    container.register_collection<IGreeter, EnglishGreeter, FrenchGreeter>();

    SECTION("resolve returns the last member") {
        REQUIRE(container.resolve<IGreeter>()->greet() == "bonjour");
    }

    SECTION("resolve_all returns every member in order") {
        auto all = container.resolve_all<IGreeter>();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0]->greet() == "hello");
        REQUIRE(all[1]->greet() == "bonjour");
        REQUIRE(all[1] == container.resolve<IGreeter>());
    }

    SECTION("resolve_all over a plain binding has one element") {
        ServiceContainer plain;
        plain.register_singleton<IGreeter, EnglishGreeter>();
        REQUIRE(plain.resolve_all<IGreeter>().size() == 1);
        REQUIRE(plain.resolve_all<Counter>().empty());
    }
}

TEST_CASE("ServiceContainer child containers", "[di][container]") {
    ServiceContainer parent;
    parent.register_singleton<IGreeter, EnglishGreeter>();
    auto child = parent.create_child_container();

    SECTION("Child falls back to the parent") {
        REQUIRE(child->is_registered<IGreeter>());
        REQUIRE(child->resolve<IGreeter>() == parent.resolve<IGreeter>());
        REQUIRE(child->parent() == &parent);
    }

    SECTION("Child bindings shadow the parent") {
        child->register_singleton<IGreeter, FrenchGreeter>();
        REQUIRE(child->resolve<IGreeter>()->greet() == "bonjour");
        REQUIRE(parent.resolve<IGreeter>()->greet() == "hello");
    }

    SECTION("Parent does not see child bindings") {
        child->register_singleton<Counter>();
        REQUIRE_FALSE(parent.is_registered<Counter>());
    }
}

TEST_CASE("ServiceContainer introspection", "[di][container]") {
    ServiceContainer container;

    SECTION("Empty container verifies with a warning") {
        auto result = container.verify();
        REQUIRE(result.is_valid);
        REQUIRE(result.warnings.size() == 1);
    }

    container.register_singleton<IGreeter, EnglishGreeter>();
    container.register_transient<Counter>();
    container.register_scoped<Resource>();

    SECTION("registered_types lists capabilities in registration order") {
        auto types = container.registered_types();
        REQUIRE(types.size() == 3);
        REQUIRE(types[0] == std::type_index(typeid(IGreeter)));
    }

    SECTION("statistics counts lifetimes and resolutions") {
        container.resolve<IGreeter>();
        container.resolve<IGreeter>();
        auto stats = container.statistics();
        REQUIRE(stats.total_registrations == 3);
        REQUIRE(stats.singleton_services == 1);
        REQUIRE(stats.transient_services == 1);
        REQUIRE(stats.scoped_services == 1);
        REQUIRE(stats.resolutions == 2);
    }

    SECTION("registrations report materialization and runtime type") {
        container.resolve<IGreeter>();
        auto infos = container.registrations();
        REQUIRE(infos[0].materialized);
        REQUIRE(infos[0].implementation_name.find("EnglishGreeter") != std::string::npos);
        REQUIRE_FALSE(infos[1].materialized);
    }

    SECTION("unregister and clear") {
        REQUIRE(container.unregister<Counter>());
        REQUIRE_FALSE(container.unregister<Counter>());
        container.clear();
        REQUIRE(container.registered_types().empty());
        REQUIRE(container.verify().services_validated == 0);
    }

    SECTION("resolve_or_create registers on first use") {
        auto created = container.resolve_or_create<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });
        REQUIRE(created == container.resolve<NeedsGreeter>());
    }

    SECTION("Registration events carry the lifetime") {
        std::vector<ServiceLifetime> lifetimes;
        auto conn = container.events().subscribe<ServiceRegisteredEvent>([&](const ServiceRegisteredEvent& e) {
            lifetimes.push_back(e.lifetime);
        });
        container.register_transient<IClock, ResourceClock>();
        REQUIRE(lifetimes == std::vector<ServiceLifetime>{ServiceLifetime::Transient});
    }

    SECTION("Resolution events flag cache hits") {
        std::vector<bool> cached;
        auto conn = container.events().subscribe<ServiceResolvedEvent>([&](const ServiceResolvedEvent& e) {
            cached.push_back(e.from_cache);
        });
        container.resolve<IGreeter>();
        container.resolve<IGreeter>();
        REQUIRE(cached == std::vector<bool>{false, true});
    }
}

TEST_CASE("ServiceContainer disposal", "[di][container]") {
    SECTION("Materialized disposables are disposed exactly once") {
        auto resource = std::make_shared<Resource>();
        auto clock = std::make_shared<ResourceClock>();
        {
            ServiceContainer container;
            container.register_singleton<Resource>(resource);
            container.register_singleton<IClock>(clock);
            container.register_named<IClock>("again", std::shared_ptr<IClock>(clock));

            container.dispose();
            container.dispose();
            REQUIRE(container.is_disposed());
        }
        REQUIRE(resource->disposals == 1);
        REQUIRE(clock->disposals == 1);
    }

    SECTION("Destruction disposes") {
        auto resource = std::make_shared<Resource>();
        {
            ServiceContainer container;
            container.register_singleton<Resource>(resource);
        }
        REQUIRE(resource->disposals == 1);
    }

    SECTION("Disposed container rejects use") {
        ServiceContainer container;
        container.register_singleton<IGreeter, EnglishGreeter>();
        container.dispose();

        REQUIRE_THROWS_AS(container.resolve<IGreeter>(), ContainerDisposedError);
        REQUIRE(container.try_resolve<IGreeter>() == nullptr);
        REQUIRE_THROWS_AS((container.register_singleton<IGreeter, FrenchGreeter>()), ContainerDisposedError);
        REQUIRE_FALSE(container.verify().is_valid);
    }

    SECTION("Unmaterialized singletons are never constructed for disposal") {
        Counter::constructed = 0;
        {
            ServiceContainer container;
            container.register_singleton<Counter>();
        }
        REQUIRE(Counter::constructed == 0);
    }
}

TEST_CASE("ServiceContainer verification builds every binding", "[di][container]") {
    keystone::core::set_console_output(false);
    ServiceContainer container;

    auto has_error = [](const ContainerValidationResult& result, const std::string& text) {
        for (const auto& error : result.errors) {
            if (error.find(text) != std::string::npos) return true;
        }
        return false;
    };

    SECTION("A healthy container stays untouched") {
        container.register_singleton<IGreeter, EnglishGreeter>();
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        auto result = container.verify();
        REQUIRE(result.is_valid);
        REQUIRE(result.errors.empty());
        REQUIRE(result.services_validated == 2);
        for (const auto& info : container.registrations()) {
            REQUIRE_FALSE(info.materialized);
        }
        REQUIRE(container.statistics().resolutions == 0);
    }

    SECTION("A factory needing an unbound service is an error") {
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        auto result = container.verify();
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors.size() == 1);
        REQUIRE(has_error(result, "NeedsGreeter"));
        REQUIRE(has_error(result, "IGreeter"));
    }

    SECTION("Optional lookups inside a factory may come back empty") {
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.try_resolve<IGreeter>());
        });
        REQUIRE(container.verify().is_valid);
    }

    SECTION("Null and throwing factories are errors") {
        container.register_singleton<IGreeter>([](IServiceResolver&) { return std::shared_ptr<IGreeter>{}; });
        container.register_transient<IClock>([](IServiceResolver&) -> std::shared_ptr<IClock> {
            throw std::runtime_error("clock hardware missing");
        });

        auto result = container.verify();
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(has_error(result, "factory returned null"));
        REQUIRE(has_error(result, "clock hardware missing"));
    }

    SECTION("Bindings that need each other are reported without resolving") {
        container.register_singleton<IGreeter>([](IServiceResolver& r) -> std::shared_ptr<IGreeter> {
            r.resolve<NeedsGreeter>();
            return std::make_shared<EnglishGreeter>();
        });
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        auto result = container.verify();
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(result.errors.size() == 2);
        REQUIRE(has_error(result, "circular dependency"));
    }

    SECTION("A decorated binding is checked through the binding it wraps") {
        container.register_singleton<IGreeter>([](IServiceResolver&) { return std::shared_ptr<IGreeter>{}; });
        container.register_decorator<IGreeter>([](std::shared_ptr<IGreeter> inner, IServiceResolver&) {
            return std::make_shared<LoudGreeter>(std::move(inner));
        });

        auto result = container.verify();
        REQUIRE_FALSE(result.is_valid);
        REQUIRE(has_error(result, "factory returned null"));
    }

    SECTION("A singleton built from a transient is a warning") {
        container.register_transient<IGreeter, EnglishGreeter>();
        container.register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        auto result = container.verify();
        REQUIRE(result.is_valid);
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(result.warnings[0].find("depends on Transient") != std::string::npos);
    }

    SECTION("Collection members are each built") {
        container.register_collection<IGreeter, EnglishGreeter, FrenchGreeter>();
        auto result = container.verify();
        REQUIRE(result.is_valid);
        REQUIRE(result.services_validated == 2);
    }

    SECTION("A child verifies against its parent's bindings") {
        container.register_singleton<IGreeter, EnglishGreeter>();
        auto child = container.create_child_container();
        child->register_singleton<NeedsGreeter>([](IServiceResolver& r) {
            return std::make_shared<NeedsGreeter>(r.resolve<IGreeter>());
        });

        REQUIRE(child->find_registration(ServiceKey::of<IGreeter>()) != nullptr);
        REQUIRE(child->verify().is_valid);
    }

    keystone::core::set_console_output(true);
}

TEST_CASE("ServiceContainer register_if_absent", "[di][container]") {
    ServiceContainer container;
    auto english = std::make_shared<EnglishGreeter>();

    REQUIRE(container.register_if_absent<IGreeter>(english));
    REQUIRE_FALSE(container.register_if_absent<IGreeter>(std::make_shared<FrenchGreeter>()));
    REQUIRE(container.resolve<IGreeter>() == english);

    auto child = container.create_child_container();
    REQUIRE_FALSE(child->register_if_absent<IGreeter>(std::make_shared<FrenchGreeter>()));
    REQUIRE(child->resolve<IGreeter>()->greet() == "hello");
}

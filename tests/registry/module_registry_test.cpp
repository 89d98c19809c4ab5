#include "../test_config.h"

#include "Registrar/Registry/ModuleRegistry.hpp"

#include <future>

namespace Registrar::Test {

using namespace Registry;

class ModuleRegistryTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        Journal::Archivist::instance().set_min_severity(Journal::Severity::NONE);
    }

    void TearDown() override
    {
        registry.clear();
        Journal::Archivist::instance().set_min_severity(Journal::Severity::INFO);
    }

    ModuleRegistry registry;
};

//-------------------------------------------------------------------------
// Registration and lookup
//-------------------------------------------------------------------------

TEST_F(ModuleRegistryTest, RegisterThenQuery)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));

    EXPECT_TRUE(registry.has_module("echo"));
    EXPECT_EQ(registry.count(), 1U);

    auto metadata = registry.get_metadata("echo");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->name, "echo");
    EXPECT_EQ(metadata->module_type, "plugin");
    EXPECT_EQ(metadata->instantiate_fn_name, "factory");
    EXPECT_NE(metadata->module_path.find("module_registry_test.cpp"), std::string::npos)
        << "module_path should point at the registration site";

    EXPECT_EQ(registry.list_modules(), std::vector<std::string> { "echo" });
}

TEST_F(ModuleRegistryTest, MetadataNameAndTypeFollowArguments)
{
    ModuleMetadata metadata;
    metadata.name = "something-else";
    metadata.module_type = "other";
    metadata.struct_name = "EchoPlugin";
    metadata.capabilities = { "text" };

    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>(), metadata));

    auto stored = registry.get_metadata("echo");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->name, "echo");
    EXPECT_EQ(stored->module_type, "plugin");
    EXPECT_EQ(stored->struct_name, "EchoPlugin");
    EXPECT_TRUE(stored->has_capability("text"));
}

TEST_F(ModuleRegistryTest, ListIsSortedLexically)
{
    for (const auto* name : { "zeta", "alpha", "mid", "beta" }) {
        ASSERT_TRUE(registry.register_module(name, "plugin", make_factory<Plugin, EchoPlugin>()));
    }

    EXPECT_EQ(registry.list_modules(), (std::vector<std::string> { "alpha", "beta", "mid", "zeta" }));
}

TEST_F(ModuleRegistryTest, UnknownNameIsNotFound)
{
    EXPECT_FALSE(registry.has_module("nonexistent"));
    EXPECT_FALSE(registry.get_metadata("nonexistent").has_value());

    auto handle = registry.create_any("nonexistent");
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::NotFound);
    EXPECT_EQ(handle.error().module_name, "nonexistent");

    auto typed = registry.create<Plugin>("nonexistent");
    ASSERT_FALSE(typed.has_value());
    EXPECT_EQ(typed.error().code, ErrorCode::NotFound);
}

TEST_F(ModuleRegistryTest, DuplicateNameIsRejectedAndOriginalKept)
{
    ASSERT_TRUE(registry.register_module("shared", "plugin", make_factory<Plugin, EchoPlugin>()));

    auto second = registry.register_module("shared", "plugin", make_factory<Plugin, ReversePlugin>());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, ErrorCode::DuplicateName);
    EXPECT_EQ(registry.count(), 1U);

    auto plugin = registry.create<Plugin>("shared");
    ASSERT_TRUE(plugin.has_value());
    EXPECT_EQ((*plugin)->execute("abc"), "Echo: abc");
}

TEST_F(ModuleRegistryTest, ReplacementIsUnregisterThenRegister)
{
    ASSERT_TRUE(registry.register_module("slot", "plugin", make_factory<Plugin, EchoPlugin>()));
    ASSERT_TRUE(registry.unregister_module("slot"));
    ASSERT_TRUE(registry.register_module("slot", "plugin", make_factory<Plugin, ReversePlugin>()));

    auto plugin = registry.create<Plugin>("slot");
    ASSERT_TRUE(plugin.has_value());
    EXPECT_EQ((*plugin)->execute("abc"), "cba");
}

TEST_F(ModuleRegistryTest, UnregisterUnknownIsNotFound)
{
    auto result = registry.unregister_module("ghost");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_F(ModuleRegistryTest, InvalidArgumentsAreRejected)
{
    EXPECT_EQ(registry.register_module("", "plugin", make_factory<Plugin, EchoPlugin>()).error().code,
        ErrorCode::InvalidArgument);
    EXPECT_EQ(registry.register_module("name", "", make_factory<Plugin, EchoPlugin>()).error().code,
        ErrorCode::InvalidArgument);
    EXPECT_EQ(registry.register_module("name", "plugin", ModuleFactory {}).error().code,
        ErrorCode::InvalidArgument);

    EXPECT_EQ(registry.count(), 0U);
}

TEST_F(ModuleRegistryTest, LimitsComeFromConfig)
{
    ModuleRegistry limited(RegistryConfig { .max_name_length = 8, .max_type_length = 4, .max_path_length = 16 });
    EXPECT_EQ(limited.config().max_name_length, 8U);

    EXPECT_TRUE(limited.register_module("eightchr", "abcd", make_factory<Plugin, EchoPlugin>(),
        ModuleMetadata { .module_path = "short.cpp:1" }));

    EXPECT_EQ(limited.register_module("ninechars", "abcd", make_factory<Plugin, EchoPlugin>(),
                         ModuleMetadata { .module_path = "short.cpp:1" })
                  .error()
                  .code,
        ErrorCode::InvalidArgument);

    EXPECT_EQ(limited.register_module("name", "abcde", make_factory<Plugin, EchoPlugin>(),
                         ModuleMetadata { .module_path = "short.cpp:1" })
                  .error()
                  .code,
        ErrorCode::InvalidArgument);

    EXPECT_EQ(limited.register_module("name", "abcd", make_factory<Plugin, EchoPlugin>(),
                         ModuleMetadata { .module_path = std::string(17, 'p') })
                  .error()
                  .code,
        ErrorCode::InvalidArgument);

    EXPECT_EQ(limited.count(), 1U);
}

TEST_F(ModuleRegistryTest, DefaultNameLimitIs256Bytes)
{
    EXPECT_TRUE(registry.register_module(std::string(256, 'n'), "plugin", make_factory<Plugin, EchoPlugin>()));
    EXPECT_FALSE(registry.register_module(std::string(257, 'n'), "plugin", make_factory<Plugin, EchoPlugin>()));
}

TEST_F(ModuleRegistryTest, ClearDropsEverything)
{
    ASSERT_TRUE(registry.register_module("a", "plugin", make_factory<Plugin, EchoPlugin>()));
    ASSERT_TRUE(registry.register_module("b", "plugin", make_factory<Plugin, EchoPlugin>()));

    registry.clear();

    EXPECT_EQ(registry.count(), 0U);
    EXPECT_TRUE(registry.list_modules().empty());
    EXPECT_FALSE(registry.has_module("a"));
}

//-------------------------------------------------------------------------
// Construction
//-------------------------------------------------------------------------

TEST_F(ModuleRegistryTest, EachCreateRunsTheFactory)
{
    auto calls = std::make_shared<std::atomic<int>>(0);
    ASSERT_TRUE(registry.register_module("counted", "plugin", [calls]() -> FactoryResult {
        calls->fetch_add(1);
        return ModuleHandle::make<Plugin>(std::make_unique<EchoPlugin>());
    }));

    auto first = registry.create<Plugin>("counted");
    auto second = registry.create<Plugin>("counted");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(calls->load(), 2);
    EXPECT_NE(first->get(), second->get()) << "Each create must produce a distinct instance";
}

TEST_F(ModuleRegistryTest, FactoryArgumentsAreCopiedPerInstance)
{
    ASSERT_TRUE(registry.register_module("prefixed", "plugin", make_factory<Plugin, EchoPlugin>(std::string("> "))));

    auto plugin = registry.create<Plugin>("prefixed");
    ASSERT_TRUE(plugin.has_value());
    EXPECT_EQ((*plugin)->execute("x"), "> x");
}

TEST_F(ModuleRegistryTest, WrongInterfaceIsTypeMismatch)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));

    auto storage = registry.create<StorageBackend>("echo");
    ASSERT_FALSE(storage.has_value());
    EXPECT_EQ(storage.error().code, ErrorCode::TypeMismatch);
    EXPECT_EQ(storage.error().module_name, "echo");
}

TEST_F(ModuleRegistryTest, ReturnedFactoryErrorIsFactoryFailed)
{
    ASSERT_TRUE(registry.register_module("broken", "plugin", []() -> FactoryResult {
        return std::unexpected(FactoryError("backend unavailable"));
    }));

    auto handle = registry.create_any("broken");
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::FactoryFailed);
    EXPECT_NE(handle.error().message.find("backend unavailable"), std::string::npos);
}

TEST_F(ModuleRegistryTest, ThrowingFactoryKeepsTheCause)
{
    ASSERT_TRUE(registry.register_module("throws", "plugin", []() -> FactoryResult {
        throw std::runtime_error("constructor exploded");
    }));

    auto handle = registry.create_any("throws");
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::FactoryFailed);
    ASSERT_TRUE(handle.error().cause);
    EXPECT_THROW(std::rethrow_exception(handle.error().cause), std::runtime_error);
}

TEST_F(ModuleRegistryTest, EmptyHandleFromFactoryIsFactoryFailed)
{
    ASSERT_TRUE(registry.register_module("hollow", "plugin", []() -> FactoryResult { return ModuleHandle {}; }));

    auto handle = registry.create_any("hollow");
    ASSERT_FALSE(handle.has_value());
    EXPECT_EQ(handle.error().code, ErrorCode::FactoryFailed);
}

TEST_F(ModuleRegistryTest, InstancesOutliveUnregisterAndClear)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));

    auto plugin = registry.create<Plugin>("echo");
    ASSERT_TRUE(plugin.has_value());

    ASSERT_TRUE(registry.unregister_module("echo"));
    registry.clear();

    EXPECT_EQ((*plugin)->execute("still here"), "Echo: still here");
}

TEST_F(ModuleRegistryTest, FactoryMayReadTheRegistry)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));
    ASSERT_TRUE(registry.register_module("introspective", "plugin", [this]() -> FactoryResult {
        if (!registry.has_module("echo")) {
            return std::unexpected(FactoryError("dependency missing"));
        }
        return ModuleHandle::make<Plugin>(std::make_unique<ReversePlugin>());
    }));

    EXPECT_TRUE(registry.create<Plugin>("introspective").has_value());
}

TEST_F(ModuleRegistryTest, ForEachVisitsEveryRecord)
{
    ASSERT_TRUE(registry.register_module("a", "plugin", make_factory<Plugin, EchoPlugin>()));
    ASSERT_TRUE(registry.register_module("b", "storage", make_factory<StorageBackend, MemoryStorage>()));

    std::set<std::string> seen;
    registry.for_each_module([&seen](const ModuleMetadata& metadata) { seen.insert(metadata.name); });

    EXPECT_EQ(seen, (std::set<std::string> { "a", "b" }));
}

TEST_F(ModuleRegistryTest, SummaryDescribesTheRecord)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));

    auto metadata = registry.get_metadata("echo");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->summary(),
        "Module: echo (type: plugin) - signature: false, approved: false, supply_chain: false, sandbox: true");
}

//-------------------------------------------------------------------------
// Logging
//-------------------------------------------------------------------------

TEST_F(ModuleRegistryTest, DuplicateAndFactoryFailuresAreLogged)
{
    ScopedLogCapture capture;

    ASSERT_TRUE(registry.register_module("dup", "plugin", make_factory<Plugin, EchoPlugin>()));
    EXPECT_FALSE(registry.register_module("dup", "plugin", make_factory<Plugin, EchoPlugin>()));
    ASSERT_TRUE(registry.register_module("broken", "plugin", []() -> FactoryResult {
        return std::unexpected(FactoryError("nope"));
    }));
    EXPECT_FALSE(registry.create_any("broken"));

    EXPECT_GE(capture.count(Journal::Severity::WARN), 1U);
    EXPECT_GE(capture.count(Journal::Severity::ERROR), 1U);
    EXPECT_TRUE(capture.contains("already registered"));
}

namespace {

    /**
     * @brief Sink whose warnings blow up, so every rejection path throws
     */
    class ThrowOnWarnSink : public Journal::Sink {
    public:
        void write(const Journal::JournalEntry& entry) override
        {
            if (entry.severity == Journal::Severity::WARN) {
                throw std::runtime_error("sink failure");
            }
        }

        void flush() override { }

        [[nodiscard]] bool is_available() const override { return true; }
    };

} // namespace

TEST_F(ModuleRegistryTest, BatchKeepsFirstOfEachName)
{
    std::vector<RegistrationRecord> batch;
    batch.push_back({ .name = "echo", .module_type = "plugin", .factory = make_factory<Plugin, EchoPlugin>(), .metadata = {} });
    batch.push_back({ .name = "echo", .module_type = "plugin", .factory = make_factory<Plugin, ReversePlugin>(), .metadata = {} });
    batch.push_back({ .name = "memory", .module_type = "storage", .factory = make_factory<StorageBackend, MemoryStorage>(), .metadata = {} });

    EXPECT_EQ(registry.register_batch(std::move(batch)), 2U);

    auto plugin = registry.create<Plugin>("echo");
    ASSERT_TRUE(plugin.has_value());
    EXPECT_EQ((*plugin)->execute("x"), "Echo: x");
    EXPECT_TRUE(registry.has_module("memory"));
}

TEST_F(ModuleRegistryTest, BatchContinuesPastThrowingRecords)
{
    ScopedLogCapture capture;
    Journal::Archivist::instance().add_sink(std::make_unique<ThrowOnWarnSink>());

    std::vector<RegistrationRecord> batch;
    batch.push_back({ .name = "first", .module_type = "plugin", .factory = make_factory<Plugin, EchoPlugin>(), .metadata = {} });
    batch.push_back({ .name = "first", .module_type = "plugin", .factory = make_factory<Plugin, EchoPlugin>(), .metadata = {} });
    batch.push_back({ .name = "", .module_type = "plugin", .factory = make_factory<Plugin, EchoPlugin>(), .metadata = {} });
    batch.push_back({ .name = "last", .module_type = "plugin", .factory = make_factory<Plugin, ReversePlugin>(), .metadata = {} });

    size_t accepted = 0;
    EXPECT_NO_THROW(accepted = registry.register_batch(std::move(batch)));

    EXPECT_EQ(accepted, 2U);
    EXPECT_EQ(registry.list_modules(), (std::vector<std::string> { "first", "last" }));
    EXPECT_EQ(capture.count(Journal::Severity::ERROR), 2U);
    EXPECT_TRUE(capture.contains("threw and was skipped"));
}

//-------------------------------------------------------------------------
// Concurrency
//-------------------------------------------------------------------------

TEST_F(ModuleRegistryTest, ConcurrentRegistrationOfDistinctNames)
{
    std::vector<std::thread> threads;
    std::atomic<size_t> failures { 0 };

    for (size_t t = 0; t < TestConfig::THREAD_COUNT; ++t) {
        threads.emplace_back([this, t, &failures]() {
            for (size_t i = 0; i < TestConfig::NAMES_PER_THREAD; ++i) {
                auto name = "module_" + std::to_string(t) + "_" + std::to_string(i);
                if (!registry.register_module(name, "plugin", make_factory<Plugin, EchoPlugin>())) {
                    failures.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0U);
    EXPECT_EQ(registry.count(), TestConfig::THREAD_COUNT * TestConfig::NAMES_PER_THREAD);

    for (size_t t = 0; t < TestConfig::THREAD_COUNT; ++t) {
        for (size_t i = 0; i < TestConfig::NAMES_PER_THREAD; ++i) {
            EXPECT_TRUE(registry.has_module("module_" + std::to_string(t) + "_" + std::to_string(i)));
        }
    }
}

TEST_F(ModuleRegistryTest, ConcurrentRegistrationOfOneNameHasOneWinner)
{
    std::vector<std::thread> threads;
    std::atomic<size_t> successes { 0 };
    std::atomic<size_t> duplicates { 0 };

    for (size_t t = 0; t < TestConfig::THREAD_COUNT; ++t) {
        threads.emplace_back([this, &successes, &duplicates]() {
            auto result = registry.register_module("contested", "plugin", make_factory<Plugin, EchoPlugin>());
            if (result) {
                successes.fetch_add(1);
            } else if (result.error().code == ErrorCode::DuplicateName) {
                duplicates.fetch_add(1);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(successes.load(), 1U);
    EXPECT_EQ(duplicates.load(), TestConfig::THREAD_COUNT - 1);
}

TEST_F(ModuleRegistryTest, ConcurrentCreateProducesDistinctInstances)
{
    ASSERT_TRUE(registry.register_module("echo", "plugin", make_factory<Plugin, EchoPlugin>()));

    std::vector<std::thread> threads;
    std::atomic<size_t> created { 0 };

    for (size_t t = 0; t < TestConfig::THREAD_COUNT; ++t) {
        threads.emplace_back([this, &created]() {
            for (size_t i = 0; i < TestConfig::CREATES_PER_THREAD; ++i) {
                auto plugin = registry.create<Plugin>("echo");
                if (plugin && (*plugin)->execute("x") == "Echo: x") {
                    created.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(created.load(), TestConfig::THREAD_COUNT * TestConfig::CREATES_PER_THREAD);
}

TEST_F(ModuleRegistryTest, ReadersProceedWhileAFactoryBlocks)
{
    std::promise<void> release;
    auto gate = release.get_future().share();

    ASSERT_TRUE(registry.register_module("slow", "plugin", [gate]() -> FactoryResult {
        gate.wait();
        return ModuleHandle::make<Plugin>(std::make_unique<EchoPlugin>());
    }));

    auto pending = std::async(std::launch::async, [this]() { return registry.create<Plugin>("slow"); });

    // Factory holds no lock: writes and reads complete while it is parked.
    EXPECT_TRUE(registry.register_module("fast", "plugin", make_factory<Plugin, EchoPlugin>()));
    EXPECT_TRUE(registry.has_module("fast"));

    release.set_value();
    auto slow = pending.get();
    EXPECT_TRUE(slow.has_value());
}

}

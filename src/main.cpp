#include "Registrar/Registrar.hpp"

using namespace Registrar;
using namespace Registrar::Registry;

namespace {

class Plugin : public Module {
public:
    [[nodiscard]] virtual std::string_view version() const = 0;
    [[nodiscard]] virtual std::string execute(std::string_view input) const = 0;
};

class EchoPlugin : public Plugin {
public:
    [[nodiscard]] std::string_view name() const override { return "echo"; }
    [[nodiscard]] std::string_view module_type() const override { return "plugin"; }
    [[nodiscard]] std::string_view version() const override { return "1.0.0"; }

    [[nodiscard]] std::string execute(std::string_view input) const override
    {
        return "Echo: " + std::string(input);
    }
};

class ReversePlugin : public Plugin {
public:
    [[nodiscard]] std::string_view name() const override { return "reverse"; }
    [[nodiscard]] std::string_view module_type() const override { return "plugin"; }
    [[nodiscard]] std::string_view version() const override { return "1.0.0"; }

    [[nodiscard]] std::string execute(std::string_view input) const override
    {
        return { input.rbegin(), input.rend() };
    }
};

} // namespace

REGISTRAR_REGISTER_MODULE("echo", "plugin", Plugin, EchoPlugin, "text")

namespace {

void print_usage()
{
    std::cout << "Usage: registrar_demo [--log-level <trace|debug|info|warn|error|none>] [--help]\n"
              << "--log-level overrides the REGISTRAR_LOG_LEVEL environment variable.\n";
}

struct DemoOptions {
    bool show_help {};
    std::optional<Journal::Severity> log_level;
};

DemoOptions parse_arguments(int argc, char** argv)
{
    DemoOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }

        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                Journal::error<std::invalid_argument>(Journal::Component::USER, Journal::Context::Configuration,
                    std::source_location::current(), "--log-level requires a value");
            }

            std::string_view value = argv[++i];
            options.log_level = Utils::string_to_enum_case_insensitive<Journal::Severity>(value);
            if (!options.log_level) {
                Journal::error<std::invalid_argument>(Journal::Component::USER, Journal::Context::Configuration,
                    std::source_location::current(), "Unknown log level '{}'", value);
            }
            continue;
        }

        Journal::error<std::invalid_argument>(Journal::Component::USER, Journal::Context::Configuration,
            std::source_location::current(), "Unknown argument '{}'", arg);
    }
    return options;
}

void run_plugin(const ModuleRegistry& registry, std::string_view name, std::string_view input)
{
    auto plugin = registry.create<Plugin>(name);
    if (!plugin) {
        RG_ERROR(Journal::Component::USER, Journal::Context::UserCode,
            "Could not create '{}': {}", name, plugin.error().describe());
        return;
    }

    RG_PRINT(Journal::Component::USER, Journal::Context::UserCode,
        "{} v{} -> {}", (*plugin)->name(), (*plugin)->version(), (*plugin)->execute(input));
}

} // namespace

int main(int argc, char** argv)
{
    try {
        auto options = parse_arguments(argc, argv);
        if (options.show_help) {
            print_usage();
            return 0;
        }

        auto& registry = Init(options.log_level);

        RG_PRINT(Journal::Component::USER, Journal::Context::Init, "=== Registrar Plugin Demo ===");

        auto registered = registry.register_module("reverse", "plugin",
            make_factory<Plugin, ReversePlugin>(),
            ModuleMetadata { .struct_name = "ReversePlugin", .capabilities = { "text", "transform" } });
        if (!registered) {
            RG_ERROR(Journal::Component::USER, Journal::Context::Registration,
                "{}", registered.error().describe());
            return 1;
        }

        RG_PRINT(Journal::Component::USER, Journal::Context::Lookup, "Registered modules:");
        for (const auto& name : registry.list_modules()) {
            if (auto metadata = registry.get_metadata(name)) {
                RG_PRINT(Journal::Component::USER, Journal::Context::Lookup, "  {}", metadata->summary());
            }
        }

        run_plugin(registry, "echo", "hello registry");
        run_plugin(registry, "reverse", "hello registry");
        run_plugin(registry, "missing", "hello registry");

        auto transformers = Discovery::with_capabilities(registry, { "text" }, { "transform" });
        RG_PRINT(Journal::Component::USER, Journal::Context::Discovery,
            "Modules tagged 'text': {}", transformers.size());

        for (const auto& [name, result] : registry.security_audit()) {
            RG_PRINT(Journal::Component::USER, Journal::Context::SecurityCheck, "  {}: {}", name, result.summary());
        }

        End();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n'
                  << std::flush;
        return 1;
    }

    return 0;
}

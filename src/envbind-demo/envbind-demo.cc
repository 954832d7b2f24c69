#include "envbind/bind/bind.hh"
#include "envbind/bind/fragment.hh"
#include "envbind/bind/text-encoding.hh"
#include "envbind/util/ansicolor.hh"
#include "envbind/util/logging.hh"
#include "envbind/util/strings.hh"

#include <algorithm>
#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

namespace envbind {

/**
 * Verbosity levels by name (`error`, `warn`, ..., `vomit`) or by number.
 */
template<>
struct EnvDecoder<Verbosity>
{
    static Verbosity decode(std::string_view text)
    {
        static const std::array<std::string_view, lvlVomit + 1> names = {
            "error", "warn", "notice", "info", "talkative", "chatty", "debug", "vomit"};
        auto name = toLower(std::string(text));
        for (size_t i = 0; i < names.size(); ++i)
            if (name == names[i])
                return (Verbosity) i;
        if (auto n = string2Int<unsigned int>(text); n && *n <= lvlVomit)
            return (Verbosity) *n;
        throw DecodeError("'%s' is not a verbosity level", text);
    }
};

} // namespace envbind

namespace envbind::demo {

/**
 * Settings of the demo program itself.
 */
struct DemoSettings
{
    Verbosity verbosity = lvlInfo;

    /**
     * The prefix under which `Settings` is bound.
     */
    std::string prefix = "TEST_PREFIX_";

    static const Schema<DemoSettings> & envSchema()
    {
        static const Schema<DemoSettings> schema{
            .prefix = "ENVBIND_DEMO_",
            .fields =
                {
                    scalarField(toEnvFragment("verbosity"), &DemoSettings::verbosity),
                    scalarField(toEnvFragment("prefix"), &DemoSettings::prefix),
                },
        };
        return schema;
    }
};

struct Unparsable
{
};

struct SubStruct
{
    uint16_t port = 0;

    static const Schema<SubStruct> & envSchema()
    {
        static const Schema<SubStruct> schema{
            .fields =
                {
                    scalarField(toEnvFragment("port"), &SubStruct::port),
                },
        };
        return schema;
    }
};

struct Settings
{
    std::string name;
    Unparsable ignored;
    SubStruct sub;
    std::vector<uint8_t> array;
    std::vector<std::string> arrayStrings;
    std::vector<SubStruct> subStructs;
    std::optional<std::string> optional;
    TextEncoding encoding = TextEncoding::Utf8;

    static const Schema<Settings> & envSchema()
    {
        static const Schema<Settings> schema{
            .fields =
                {
                    scalarField(toEnvFragment("name"), &Settings::name),
                    ignoredField<Settings>(toEnvFragment("ignored")),
                    nestedField(toEnvFragment("sub"), &Settings::sub),
                    sequenceField(toEnvFragment("array"), &Settings::array),
                    sequenceField(toEnvFragment("arrayStrings"), &Settings::arrayStrings),
                    nestedSequenceField(toEnvFragment("subStructs"), &Settings::subStructs),
                    optionalField(toEnvFragment("optional"), &Settings::optional),
                    scalarField(toEnvFragment("encoding"), &Settings::encoding),
                },
        };
        return schema;
    }
};

static void showHelp(const std::string & programName)
{
    logger->cout(
        "Usage: %1% [--help]\n"
        "\n"
        "Binds a settings record to the variables under $ENVBIND_DEMO_PREFIX\n"
        "(default 'TEST_PREFIX_') and prints it as JSON. The verbosity is\n"
        "taken from $ENVBIND_DEMO_VERBOSITY.",
        programName);
}

static void run(const std::string & programName, const Strings & args)
{
    for (auto & arg : args) {
        if (arg == "--help") {
            showHelp(programName);
            return;
        }
        throw UsageError("unrecognised argument '%s'", arg);
    }

    auto demoSettings = fromEnv<DemoSettings>();
    verbosity = demoSettings.verbosity;

    Settings settings;
    settings.name = "unnamed";

    if (!bindWithPrefix(settings, demoSettings.prefix))
        warn("no variables starting with '%s' are set, using defaults", demoSettings.prefix);

    logger->writeToStdout(toJSON(settings).dump(2));
}

static int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = std::filesystem::path(programName).filename().string();

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace envbind::demo

int main(int argc, char ** argv)
{
    using namespace envbind::demo;

    std::string programName = argc > 0 ? argv[0] : "envbind-demo";
    envbind::Strings args(argv + std::min(argc, 1), argv + argc);

    return handleExceptions(programName, [&]() { run(programName, args); });
}

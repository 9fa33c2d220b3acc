/**
 * @file command.cpp
 * @brief marginalia-id command dispatch implementation
 */

#include <marginalia/cli/command.hpp>
#include <marginalia/core/config.hpp>
#include <marginalia/core/logger.hpp>
#include <marginalia/core/uuid.hpp>
#include <marginalia/ids/url_safe_id.hpp>
#include <marginalia/selectors/null_escape.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <istream>
#include <optional>
#include <ostream>

namespace marginalia::cli {

namespace {

constexpr const char* kProgramName = "marginalia-id";

struct Options {
    std::string configFile;
    std::optional<std::string> logLevel;
    std::string command;
    std::vector<std::string> args;
    bool help = false;
};

void printUsage(std::ostream& os) {
    fmt::print(os,
        "Usage: {} [--config FILE] [--log-level LEVEL] COMMAND [ARGS...]\n"
        "\n"
        "Commands:\n"
        "  decode ID...       URL-safe identifier -> 32-digit hex UUID\n"
        "  encode UUID...     hex UUID -> URL-safe identifier\n"
        "  inspect VALUE...   show kind and every form of an identifier or UUID\n"
        "  escape [FILE]      escape NUL in text quote selectors of a JSON document\n"
        "  unescape [FILE]    reverse of escape\n"
        "\n"
        "Documents are read from FILE, or stdin when FILE is omitted.\n"
        "LEVEL is one of trace, debug, info, warn, error, critical, off.\n",
        kProgramName);
}

std::optional<Options> parseArgs(const std::vector<std::string>& argv, std::ostream& err) {
    Options options;

    for (std::size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config" || arg == "--log-level") {
            if (i + 1 >= argv.size()) {
                fmt::print(err, "{}: option {} requires a value\n", kProgramName, arg);
                return std::nullopt;
            }
            if (arg == "--config") {
                options.configFile = argv[++i];
            } else {
                options.logLevel = argv[++i];
            }
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }
    return options;
}

void reportError(std::ostream& err, const Error& error) {
    fmt::print(err, "{}: {}\n", kProgramName, error.what());
}

template<typename Convert>
int convertEach(const std::vector<std::string>& values, std::ostream& out, std::ostream& err, Convert convert) {
    int status = kExitOk;
    for (const auto& value : values) {
        auto converted = convert(value);
        if (converted) {
            fmt::print(out, "{}\n", converted.value());
        } else {
            reportError(err, converted.error());
            status = kExitInvalid;
        }
    }
    return status;
}

/// URL-safe identifiers go by length; anything else must be UUID text
Result<UUID> parseAny(const std::string& value) {
    if (value.size() == ids::kUuidIdLength || value.size() == ids::kFlakeIdLength) {
        return ids::parse(value);
    }
    return UUID::fromString(value);
}

std::string describe(const UUID& id) {
    const std::vector<std::string> fields = {
        fmt::format("kind={}", ids::idKindToString(ids::classify(id))),
        fmt::format("hex={}", id.toHex()),
        fmt::format("uuid={}", id.toString()),
        fmt::format("id={}", ids::format(id)),
    };
    return fmt::format("{}", fmt::join(fields, " "));
}

int inspect(const std::vector<std::string>& values, std::ostream& out, std::ostream& err) {
    int status = kExitOk;
    for (const auto& value : values) {
        auto description = parseAny(value).map(describe);
        if (!description) {
            reportError(err, description.error());
            status = kExitInvalid;
            continue;
        }
        fmt::print(out, "{}: {}\n", value, description.value());
    }
    return status;
}

int transformDocument(const std::vector<std::string>& args, bool escaping,
                      std::istream& in, std::ostream& out, std::ostream& err) {
    if (args.size() > 1) {
        fmt::print(err, "{}: {} takes at most one FILE\n", kProgramName, escaping ? "escape" : "unescape");
        return kExitUsage;
    }

    nlohmann::json document;
    try {
        if (args.empty()) {
            document = nlohmann::json::parse(in);
        } else {
            std::ifstream file(args.front());
            if (!file.is_open()) {
                fmt::print(err, "{}: cannot open {}\n", kProgramName, args.front());
                return kExitInvalid;
            }
            document = nlohmann::json::parse(file);
        }
    } catch (const nlohmann::json::parse_error& e) {
        fmt::print(err, "{}: invalid JSON document: {}\n", kProgramName, e.what());
        return kExitInvalid;
    }

    const auto transformed = escaping ? selectors::escape(document) : selectors::unescape(document);
    fmt::print(out, "{}\n", transformed.dump(2));
    return kExitOk;
}

} // anonymous namespace

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    auto options = parseArgs(args, err);
    if (!options) {
        printUsage(err);
        return kExitUsage;
    }
    if (options->help) {
        printUsage(out);
        return kExitOk;
    }

    // Console logging until the configuration says otherwise
    initLogging(kProgramName, spdlog::level::warn);

    auto& config = Config::getInstance();
    if (!options->configFile.empty()) {
        auto loaded = config.loadFromFile(options->configFile);
        if (!loaded) {
            reportError(err, loaded.error());
            return kExitUsage;
        }
    }

    auto settings = LoggingSettings::fromConfig(config);
    settings.name = kProgramName;
    if (!config.has("logging.level")) {
        settings.level = spdlog::level::warn;
    }
    if (options->logLevel) {
        auto level = parseLogLevel(*options->logLevel);
        if (!level) {
            fmt::print(err, "{}: unknown log level '{}'\n", kProgramName, *options->logLevel);
            return kExitUsage;
        }
        settings.level = *level;
    }
    initLogging(settings);

    MARGINALIA_LOG_DEBUG("Running '{}' with {} argument(s)", options->command, options->args.size());

    const auto& command = options->command;
    const auto& values = options->args;

    if (command == "decode" || command == "encode" || command == "inspect") {
        if (values.empty()) {
            fmt::print(err, "{}: {} needs at least one value\n", kProgramName, command);
            return kExitUsage;
        }
    }

    if (command == "decode") {
        return convertEach(values, out, err, [](const std::string& id) { return ids::decode(id); });
    }
    if (command == "encode") {
        return convertEach(values, out, err, [](const std::string& uuid) { return ids::encode(uuid); });
    }
    if (command == "inspect") {
        return inspect(values, out, err);
    }
    if (command == "escape" || command == "unescape") {
        return transformDocument(values, command == "escape", in, out, err);
    }

    if (command.empty()) {
        fmt::print(err, "{}: no command given\n", kProgramName);
    } else {
        fmt::print(err, "{}: unknown command '{}'\n", kProgramName, command);
    }
    printUsage(err);
    return kExitUsage;
}

} // namespace marginalia::cli

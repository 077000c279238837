/**
 * @file geokit_cli.cpp
 * @brief Command-line front end for the geohash, distance and geo URI routines
 *
 * Usage:
 *   geokit <command> [arguments] [options]
 *
 * Exit codes:
 *   0  success
 *   1  usage error (unknown command, wrong argument count, bad option)
 *   2  input error (malformed geohash, coordinate or URI)
 */

#include "config/Config.hpp"
#include "core/GeoError.hpp"
#include "core/Logger.hpp"
#include "geohash/Geohash.hpp"
#include "location/Accuracy.hpp"
#include "location/Distance.hpp"
#include "uri/GeoUri.hpp"
#include "utils/StringUtils.hpp"

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace GeoKit;
using StringUtils::FormatNumber;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitInput = 2;

// ============================================================================
// Configuration
// ============================================================================

struct ToolConfig {
    std::string command;
    std::vector<std::string> args;

    std::string configFile;
    std::optional<int> zoom;
    std::optional<std::string> query;

    bool highAccuracy = false;
    bool verbose = false;
    bool showHelp = false;
};

/**
 * @brief Failure caused by the user's input rather than the invocation
 */
class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Helper Functions
// ============================================================================

void PrintUsage() {
    std::cout << R"(
geokit - Geohash, distance and geo: URI utilities

Usage:
  geokit <command> [arguments] [options]

Commands:
  encode <lat> <lon> [length]       Encode a coordinate as a geohash
  decode <hash>                     Centre of a geohash cell
  bounds <hash>                     Bounding box of a geohash cell
  bytes <hash>                      Alphabet index of each character
  distance <lat1> <lon1> <lat2> <lon2>
                                    Distance in meters
  accuracy <hash>                   Expected error of a geohash in meters
  length <meters>                   Shortest geohash length for an error bound
  uri <lat> <lon>                   Build a geo: URI
  parse-uri <uri>                   Print the parts of a geo: URI
  uri-to-hash <uri>                 Geohash sized by the URI's uncertainty
  hash-to-uri <hash>                geo: URI of a geohash cell centre

Options:
  --high-accuracy             Use the haversine formula for distance
  --zoom <level>              Zoom level for uri (1-21)
  --query <text>              Search text for uri
  --config <file>             Load settings from a JSON file
  --verbose                   Print debug logging
  --help                      Show this help
)";
}

bool ParseArguments(int argc, char* argv[], ToolConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        }
        else if (arg == "--high-accuracy") {
            config.highAccuracy = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        }
        else if (arg == "--config" && i + 1 < argc) {
            config.configFile = argv[++i];
        }
        else if (arg == "--query" && i + 1 < argc) {
            config.query = argv[++i];
        }
        else if (arg == "--zoom" && i + 1 < argc) {
            config.zoom = StringUtils::ParseInt(argv[++i]);
            if (!config.zoom) {
                std::cerr << "Invalid zoom level: " << argv[i] << "\n";
                return false;
            }
        }
        else if (StringUtils::StartsWith(arg, "--")) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
        else if (config.command.empty()) {
            config.command = arg;
        }
        else {
            config.args.push_back(arg);
        }
    }

    return config.showHelp || !config.command.empty();
}

double ParseNumberArg(const std::string& text, const char* what) {
    const auto value = StringUtils::ParseDouble(text);
    if (!value) {
        throw InputError(std::string("Invalid ") + what + ": " + text);
    }
    return *value;
}

// ============================================================================
// Commands
// ============================================================================

struct CommandContext {
    const ToolConfig& tool;
    const GeoKitSettings& settings;
};

struct Command {
    size_t minArgs;
    size_t maxArgs;
    std::function<void(const CommandContext&)> run;
};

void RunEncode(const CommandContext& ctx) {
    const auto& args = ctx.tool.args;
    const Coordinate coords = Location::CoerceCoordinate(args[0], args[1]);

    size_t length = ctx.settings.defaultGeohashLength;
    if (args.size() > 2) {
        const auto parsed = StringUtils::ParseInt(args[2]);
        if (!parsed || *parsed < 0) {
            throw InputError("Invalid geohash length: " + args[2]);
        }
        length = static_cast<size_t>(*parsed);
    }

    std::cout << Geohash::Encode(coords, length) << "\n";
}

void RunDecode(const CommandContext& ctx) {
    const Coordinate coords = Geohash::Decode(ctx.tool.args[0]);
    std::cout << FormatNumber(coords.latitude) << "," << FormatNumber(coords.longitude) << "\n";
}

void RunBounds(const CommandContext& ctx) {
    const auto bounds = Geohash::DecodeBounds(ctx.tool.args[0]);
    std::cout << "latitude:  " << FormatNumber(bounds.latitude.min) << " "
              << FormatNumber(bounds.latitude.max) << "\n";
    std::cout << "longitude: " << FormatNumber(bounds.longitude.min) << " "
              << FormatNumber(bounds.longitude.max) << "\n";
}

void RunBytes(const CommandContext& ctx) {
    const auto bytes = Geohash::ToBytes(ctx.tool.args[0]);
    for (size_t i = 0; i < bytes.size(); ++i) {
        std::cout << (i == 0 ? "" : " ") << static_cast<int>(bytes[i]);
    }
    std::cout << "\n";
}

void RunDistance(const CommandContext& ctx) {
    const auto& args = ctx.tool.args;
    const Coordinate from(ParseNumberArg(args[0], "latitude"), ParseNumberArg(args[1], "longitude"));
    const Coordinate to(ParseNumberArg(args[2], "latitude"), ParseNumberArg(args[3], "longitude"));

    Location::DistanceOptions options;
    options.highAccuracy = ctx.tool.highAccuracy || ctx.settings.distance.highAccuracy;

    const double meters = Location::GetDistance(from, to, options);
    APP_LOG_DEBUG("Distance computed with {} formula", options.highAccuracy ? "haversine" : "planar");
    std::cout << FormatNumber(meters) << "\n";
}

void RunAccuracy(const CommandContext& ctx) {
    std::cout << FormatNumber(Location::EstimateGeohashAccuracy(ctx.tool.args[0])) << "\n";
}

void RunLength(const CommandContext& ctx) {
    const double meters = ParseNumberArg(ctx.tool.args[0], "distance");
    const auto length = Location::CalculateGeohashLength(meters);
    if (!length) {
        throw InputError("Accuracy must be a non-negative number: " + ctx.tool.args[0]);
    }
    std::cout << *length << "\n";
}

void RunUri(const CommandContext& ctx) {
    Uri::GeoUriParams params;
    params.zoom = ctx.tool.zoom;
    params.query = ctx.tool.query;
    std::cout << Uri::CreateGeoUri(ctx.tool.args[0], ctx.tool.args[1], params) << "\n";
}

void RunParseUri(const CommandContext& ctx) {
    const auto parsed = Uri::ParseGeoUri(ctx.tool.args[0]);
    const auto& coords = parsed.coords;
    const auto& params = parsed.params;

    std::cout << "latitude: " << FormatNumber(coords.latitude) << "\n";
    std::cout << "longitude: " << FormatNumber(coords.longitude) << "\n";
    if (coords.altitude) {
        std::cout << "altitude: " << FormatNumber(*coords.altitude) << "\n";
    }
    if (coords.accuracy) {
        std::cout << "accuracy: " << FormatNumber(*coords.accuracy) << "\n";
    }
    if (params.zoom) {
        std::cout << "zoom: " << *params.zoom << "\n";
    }
    if (params.query) {
        std::cout << "query: " << *params.query << "\n";
    }
    if (params.type) {
        std::cout << "type: " << *params.type << "\n";
    }
    for (const auto& [key, value] : params.uriParameters) {
        std::cout << ";" << key << ": " << value << "\n";
    }
    for (const auto& [key, value] : params.extensions) {
        std::cout << key << ": " << value << "\n";
    }
}

void RunUriToHash(const CommandContext& ctx) {
    std::cout << Uri::GeoUriToGeohash(ctx.tool.args[0]) << "\n";
}

void RunHashToUri(const CommandContext& ctx) {
    Uri::GeohashUriOptions options;
    options.zoom = ctx.tool.zoom;
    std::cout << Uri::GeohashToGeoUri(ctx.tool.args[0], options) << "\n";
}

const std::map<std::string, Command>& Commands() {
    static const std::map<std::string, Command> commands = {
        {"encode",      {2, 3, RunEncode}},
        {"decode",      {1, 1, RunDecode}},
        {"bounds",      {1, 1, RunBounds}},
        {"bytes",       {1, 1, RunBytes}},
        {"distance",    {4, 4, RunDistance}},
        {"accuracy",    {1, 1, RunAccuracy}},
        {"length",      {1, 1, RunLength}},
        {"uri",         {2, 2, RunUri}},
        {"parse-uri",   {1, 1, RunParseUri}},
        {"uri-to-hash", {1, 1, RunUriToHash}},
        {"hash-to-uri", {1, 1, RunHashToUri}},
    };
    return commands;
}

} // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    ToolConfig config;
    if (!ParseArguments(argc, argv, config)) {
        PrintUsage();
        return kExitUsage;
    }

    if (config.showHelp) {
        PrintUsage();
        return kExitSuccess;
    }

    const auto command = Commands().find(config.command);
    if (command == Commands().end()) {
        std::cerr << "Unknown command: " << config.command << "\n";
        PrintUsage();
        return kExitUsage;
    }

    if (config.args.size() < command->second.minArgs || config.args.size() > command->second.maxArgs) {
        std::cerr << "Wrong number of arguments for '" << config.command << "'\n";
        PrintUsage();
        return kExitUsage;
    }

    if (!config.configFile.empty()) {
        if (auto loaded = Config::Instance().Load(config.configFile); !loaded) {
            std::cerr << "Error: Could not load config " << config.configFile << " ("
                      << ConfigErrorToString(loaded.error()) << ")\n";
            return kExitInput;
        }
    }

    const GeoKitSettings settings = LoadSettings();
    Logger::Initialize(settings.logFile);
    Logger::SetLevel(config.verbose ? spdlog::level::debug : settings.logLevel);

    APP_LOG_DEBUG("Running '{}' with {} argument(s)", config.command, config.args.size());

    try {
        command->second.run(CommandContext{config, settings});
    } catch (const GeoError& e) {
        std::cerr << "Error (" << GeoErrorCodeToString(e.GetCode()) << "): " << e.what() << "\n";
        Logger::Shutdown();
        return kExitInput;
    } catch (const InputError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::Shutdown();
        return kExitInput;
    }

    Logger::Shutdown();
    return kExitSuccess;
}

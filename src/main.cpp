#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "codec/codec_config.hpp"
#include "codec/geojson_codec.hpp"
#include "geometry/geometry_kind.hpp"
#include "io/command_line.hpp"
#include "io/spatial_reference_utils.hpp"

using namespace geocodec;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --input <path> [options]\n"
              << "\nRequired arguments:\n"
              << "  --input <path>               GeoJSON geometry file, '-' reads standard input\n"
              << "\nOptional arguments:\n"
              << "  --output <path>              Output file path (defaults to standard output)\n"
              << "  --decimal-places <n>         Fraction digits kept for coordinates (default: 8)\n"
              << "  --bbox <policy>              Bounding box policy: never, always, except_points, multi_geometry (default: never)\n"
              << "  --srid <code>                EPSG code stamped on decoded geometries (default: 4326)\n"
              << "  --expect-type <type>         Reject geometries that are not of this GeoJSON type\n"
              << "  --max-nesting-depth <n>      Maximum GeometryCollection nesting, 0 for unbounded (default: 0)\n"
              << "  --config <path>              JSON codec configuration file (command line options take precedence)\n"
              << "  --indent <n>                 Indentation width of the output (default: compact)\n"
              << "\nExamples:\n"
              << "  " << programName << " --input polygon.geojson --decimal-places 6 --bbox always\n"
              << "  " << programName << " --input - --expect-type Polygon --output polygon_rounded.geojson\n"
              << "\nUse --help for detailed parameter explanations and examples.\n"
              << "Use --version to display version information.\n";
}

void printDetailedHelp(const char* programName) {
    std::cout << "geocodec - GeoJSON Geometry Codec\n"
              << "=================================\n\n"
              << "Reads one GeoJSON geometry object, decodes it and writes it back re-encoded\n"
              << "with the configured coordinate precision and bounding box policy.\n\n"
              << "ARGUMENTS:\n"
              << "  --input <path>               GeoJSON geometry file, '-' reads standard input\n"
              << "  --output <path>              Output file path (defaults to standard output)\n"
              << "  --decimal-places <n>         Coordinates are rounded half-up to n fraction digits (default: 8)\n"
              << "  --bbox <policy>              Which geometries carry a \"bbox\" member:\n"
              << "                                 never           no geometry (default)\n"
              << "                                 always          every non-empty geometry\n"
              << "                                 except_points   every non-empty geometry except Point\n"
              << "                                 multi_geometry  MultiPoint, MultiLineString, MultiPolygon, GeometryCollection\n"
              << "  --srid <code>                EPSG code of the decoded geometries, checked against the EPSG registry (default: 4326)\n"
              << "  --expect-type <type>         One of Point, LineString, Polygon, MultiPoint, MultiLineString,\n"
              << "                               MultiPolygon, GeometryCollection. Multi types are accepted for GeometryCollection.\n"
              << "  --max-nesting-depth <n>      Maximum GeometryCollection nesting, 0 for unbounded (default: 0)\n"
              << "  --config <path>              JSON file with the keys srid, bbox, decimal_places, max_nesting_depth\n"
              << "  --indent <n>                 Indentation width of the output (default: compact)\n\n"
              << "CONFIGURATION FILE EXAMPLE:\n"
              << "  {\"srid\": 4326, \"bbox\": [\"Polygon\", \"MultiPolygon\"], \"decimal_places\": 6}\n\n"
              << "EXAMPLE:\n"
              << "  " << programName << " --input polygon.geojson --decimal-places 6 --bbox always --indent 2\n\n"
              << "OTHER OPTIONS:\n"
              << "  --help, -h     Show this detailed help message\n"
              << "  --version, -v  Show version information\n";
}

std::string readText(const std::string& path) {
    if (path == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

nlohmann::json buildConfigJson(const io::CommandLineArgs& args) {
    nlohmann::json config_json = nlohmann::json::object();

    if (args.count("config")) {
        std::string text = readText(args.at("config"));
        try {
            config_json = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Invalid configuration file " + args.at("config") + ": " + e.what());
        }
    }

    // Command line options override the configuration file
    if (args.count("srid")) config_json["srid"] = io::parseIntegerArg(args, "srid");
    if (args.count("bbox")) config_json["bbox"] = args.at("bbox");
    if (args.count("decimal-places")) config_json["decimal_places"] = io::parseIntegerArg(args, "decimal-places");
    if (args.count("max-nesting-depth")) config_json["max_nesting_depth"] = io::parseIntegerArg(args, "max-nesting-depth");

    return config_json;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        io::CommandLineArgs args = io::parseArgs(argc, argv);

        // Check for help flag first
        if (args.count("help") > 0 || args.count("h") > 0) {
            printDetailedHelp(argv[0]);
            return 0;
        }

        // Check for version flag
        if (args.count("version") > 0 || args.count("v") > 0) {
            std::cout << "geocodec v" << versionString() << "\n";
            std::cout << "GeoJSON Geometry Codec\n";
            return 0;
        }

        if (args.count("input") == 0 || args.at("input") == "true") {
            std::cerr << "Error: --input is required" << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        std::optional<geometry::GeometryKind> expected_kind;
        if (args.count("expect-type")) {
            expected_kind = geometry::geometryKindFromString(args.at("expect-type"));
            if (!expected_kind) {
                std::cerr << "Error: Unknown geometry type '" << args.at("expect-type") << "'" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        int indent = -1;
        if (args.count("indent")) {
            indent = io::parseIntegerArg(args, "indent");
        }

        codec::CodecConfig config = codec::parseCodecConfig(buildConfigJson(args));

        // Progress goes to stdout only when stdout does not carry the result
        bool to_file = args.count("output") > 0;
        std::ostream& log = to_file ? std::cout : std::cerr;

        int srid = config.geometry_factory ? config.geometry_factory->getSRID()
                                           : geometry::GeometryFactory::DEFAULT_SRID;
        if (!io::SpatialReferenceUtils::isKnownEPSG(srid)) {
            std::cerr << "Error: SRID " << srid << " is not a known EPSG code" << std::endl;
            return 1;
        }
        if (to_file) {
            log << "Using SRID " << srid << " (" << io::SpatialReferenceUtils::getEPSGName(srid) << ")" << std::endl;
            if (!io::SpatialReferenceUtils::isEPSG4326(srid)) {
                std::cerr << "Warning: GeoJSON coordinates are normally WGS84 (EPSG:4326), got EPSG:" << srid << std::endl;
            }
        }

        codec::GeoJsonCodec geojson_codec(config);

        codec::Json node = codec::GeoJsonCodec::parse(readText(args.at("input")));
        std::optional<geometry::Geometry> geometry_value = expected_kind
            ? geojson_codec.decodeAs(*expected_kind, node)
            : geojson_codec.decode(node);

        if (to_file) {
            if (geometry_value) {
                log << "Decoded " << geometry_value->getKind() << " geometry" << std::endl;
            } else {
                log << "Decoded null geometry" << std::endl;
            }
        }

        std::string result = geojson_codec.encode(geometry_value).dump(indent);

        if (to_file) {
            std::ofstream output(args.at("output"));
            if (!output.is_open()) {
                throw std::runtime_error("Cannot open output file: " + args.at("output"));
            }
            output << result << std::endl;
            log << "Wrote " << args.at("output") << std::endl;
        } else {
            std::cout << result << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

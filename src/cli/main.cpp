// =============================================================================
// geohash CLI - Command-Line Interface
// =============================================================================
//
// Usage:
//   geohash-cli [global options] <command> [args]
//
// Commands:
//   encode      Encode a latitude/longitude pair
//   decode      Decode a hash to its cell center
//   bbox        Decode a hash to its cell center and bounds
//   neighbor    Adjacent cell in one direction
//   neighbors   All eight adjacent cells
//   precisions  List precision levels
//   version     Show version information
//
// Examples:
//   geohash-cli encode 37.7749 -122.4194 -p city
//   geohash-cli neighbors 9q8yy
//   geohash-cli --csv bbox 9q8yyk8yp
//
// Exit status: 0 success, 1 usage error, 2 geohash error
//
// =============================================================================

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

#include "geohash/base32.hpp"
#include "geohash/config.hpp"
#include "geohash/geohash.hpp"
#include "geohash/logging.hpp"

namespace geohash::cli {
    int cmd_encode(int argc, char* argv[]);
    int cmd_decode(int argc, char* argv[]);
    int cmd_bbox(int argc, char* argv[]);
    int cmd_neighbor(int argc, char* argv[]);
    int cmd_neighbors(int argc, char* argv[]);
    int cmd_precisions(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define GEOHASH_VERSION_MAJOR 1
#define GEOHASH_VERSION_MINOR 0
#define GEOHASH_VERSION_PATCH 0
#define GEOHASH_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"encode",     "Encode <lat> <lon> [-p precision]", geohash::cli::cmd_encode},
    {"decode",     "Decode <hash> to its cell center", geohash::cli::cmd_decode},
    {"bbox",       "Decode <hash> to its cell center and bounds", geohash::cli::cmd_bbox},
    {"neighbor",   "Adjacent cell: <hash> <N|NE|E|SE|S|SW|W|NW>", geohash::cli::cmd_neighbor},
    {"neighbors",  "All eight adjacent cells of <hash>", geohash::cli::cmd_neighbors},
    {"precisions", "List precision levels and cell sizes", geohash::cli::cmd_precisions},
    {"version",    "Show version information", geohash::cli::cmd_version},
    {"help",       "Show this help message", geohash::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "geohash.env";
    bool verbose = false;
    bool quiet = false;
    bool csv = false;
};

static GlobalOptions g_options;

static constexpr int EXIT_USAGE = 1;
static constexpr int EXIT_GEOHASH = 2;

// Strict floating-point parse: the whole argument must be consumed
static double parse_coordinate(const char* text, const char* what) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    GEOHASH_CHECK_ARGUMENT(end != text && *end == '\0',
                           std::string("invalid ") + what + ": '" + text + "'");
    return value;
}

static void print_coordinate_pair(const geohash::LatLng& p) {
    std::cout << std::setprecision(10);
    if (g_options.csv) {
        std::cout << p.latitude << "," << p.longitude << "\n";
    } else {
        std::cout << p.latitude << " " << p.longitude << "\n";
    }
}

namespace geohash::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geohash - Geohash encoding toolkit\n";
    std::cout << "Version " << GEOHASH_VERSION_STRING << "\n\n";
    std::cout << "Usage: geohash-cli [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Config file (default: geohash.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only errors are logged\n";
    std::cout << "      --csv               Comma-separated output\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  GH_DEFAULT_PRECISION    Precision used by encode without -p (default: 9)\n";
    std::cout << "  GH_LOG_LEVEL            debug|info|warn|error|fatal\n";
    std::cout << "  GH_LOG_FILE             Append log lines to this file\n";
    std::cout << "  GH_OUTPUT               text|csv\n";
    std::cout << "\nExamples:\n";
    std::cout << "  geohash-cli encode 37.7749 -122.4194 -p city\n";
    std::cout << "  geohash-cli neighbor 9q8yy NE\n";
    std::cout << "  geohash-cli --csv bbox 9q8yyk8yp\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "geohash " << GEOHASH_VERSION_STRING << "\n";
    std::cout << "Alphabet: " << GEOHASH_ALPHABET << "\n";
    std::cout << "Precision: " << MIN_HASH_LENGTH << ".." << MAX_HASH_LENGTH
              << " (" << BITS_PER_CHAR << " bits per symbol)\n";
    return 0;
}

// =============================================================================
// Encode / Decode Commands
// =============================================================================

int cmd_encode(int argc, char* argv[]) {
    Precision precision = Config::getInstance().default_precision();
    const char* positional[2] = {nullptr, nullptr};
    int n_positional = 0;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--precision") && i + 1 < argc) {
            precision = parse_precision(argv[++i]);
        } else if (n_positional < 2) {
            // Negative numbers are positional, not options
            positional[n_positional++] = argv[i];
        } else {
            std::cerr << "encode: unexpected argument '" << arg << "'\n";
            return EXIT_USAGE;
        }
    }

    if (n_positional != 2) {
        std::cerr << "Usage: geohash-cli encode <lat> <lon> [-p precision]\n";
        return EXIT_USAGE;
    }

    double lat = parse_coordinate(positional[0], "latitude");
    double lon = parse_coordinate(positional[1], "longitude");

    LOG_DEBUG("encode lat=", lat, " lon=", lon, " precision=", precision_name(precision));
    std::cout << Geohash::encode(lat, lon, precision) << "\n";
    return 0;
}

int cmd_decode(int argc, char* argv[]) {
    if (argc != 1) {
        std::cerr << "Usage: geohash-cli decode <hash>\n";
        return EXIT_USAGE;
    }

    print_coordinate_pair(Geohash::decode(argv[0]));
    return 0;
}

int cmd_bbox(int argc, char* argv[]) {
    if (argc != 1) {
        std::cerr << "Usage: geohash-cli bbox <hash>\n";
        return EXIT_USAGE;
    }

    DecodedCell cell = Geohash::decode_bbox(argv[0]);
    const BBox& b = cell.bbox;

    std::cout << std::setprecision(10);
    if (g_options.csv) {
        std::cout << "latitude,longitude,min_latitude,max_latitude,min_longitude,max_longitude\n";
        std::cout << cell.center.latitude << "," << cell.center.longitude << ","
                  << b.min_latitude << "," << b.max_latitude << ","
                  << b.min_longitude << "," << b.max_longitude << "\n";
    } else {
        std::cout << "center:    " << cell.center.latitude << " " << cell.center.longitude << "\n";
        std::cout << "latitude:  [" << b.min_latitude << ", " << b.max_latitude << "]\n";
        std::cout << "longitude: [" << b.min_longitude << ", " << b.max_longitude << "]\n";
    }
    return 0;
}

// =============================================================================
// Neighbor Commands
// =============================================================================

int cmd_neighbor(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: geohash-cli neighbor <hash> <direction>\n";
        return EXIT_USAGE;
    }

    Direction direction = parse_direction(argv[1]);
    std::cout << Geohash::neighbor(argv[0], direction) << "\n";
    return 0;
}

int cmd_neighbors(int argc, char* argv[]) {
    if (argc != 1) {
        std::cerr << "Usage: geohash-cli neighbors <hash>\n";
        return EXIT_USAGE;
    }

    NeighborList list = Geohash::neighbors(argv[0]);
    for (int i = 0; i < DIRECTION_COUNT; ++i) {
        std::string_view name = direction_name(static_cast<Direction>(i));
        if (g_options.csv) {
            std::cout << name << "," << list[static_cast<size_t>(i)] << "\n";
        } else {
            std::cout << std::left << std::setw(3) << name << " "
                      << list[static_cast<size_t>(i)] << "\n";
        }
    }
    return 0;
}

// =============================================================================
// Precisions Command
// =============================================================================

int cmd_precisions([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    for (unsigned p = MIN_HASH_LENGTH; p <= MAX_HASH_LENGTH; ++p) {
        Precision level = static_cast<Precision>(p);
        LatLng size = Geohash::cell_size(p);

        if (g_options.csv) {
            std::cout << p << "," << precision_name(level) << ","
                      << size.latitude << "," << size.longitude << "\n";
        } else {
            std::cout << std::right << std::setw(2) << p << "  "
                      << std::left << std::setw(9) << precision_name(level) << " "
                      << std::setw(18) << precision_description(level) << " "
                      << std::setprecision(6) << size.latitude << " x " << size.longitude
                      << " deg\n";
        }
    }
    return 0;
}

}  // namespace geohash::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else if (arg == "--csv") {
            g_options.csv = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return 0;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    // Results go to stdout, diagnostics to stderr (unless GH_LOG_FILE is set)
    geohash::set_log_output(std::cerr);

    if (!geohash::init_config(g_options.config_file)) {
        return EXIT_USAGE;
    }

    auto& config = geohash::Config::getInstance();
    if (config.get<std::string>("geohash.output") == "csv") {
        g_options.csv = true;
    }
    if (g_options.verbose) {
        geohash::set_log_level(geohash::LogLevel::DEBUG);
        config.print();
    } else if (g_options.quiet) {
        geohash::set_log_level(geohash::LogLevel::ERROR);
    }

    if (argc < 1) {
        geohash::cli::cmd_help(0, nullptr);
        return EXIT_USAGE;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const geohash::GeohashException& e) {
                LOG_DEBUG("command '", cmd_name, "' failed with ", geohash::error_code_name(e.code()));
                std::cerr << e.what() << "\n";
                return e.code() == geohash::ErrorCode::INVALID_ARGUMENT ? EXIT_USAGE : EXIT_GEOHASH;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'geohash-cli help' for usage.\n";
    return EXIT_USAGE;
}

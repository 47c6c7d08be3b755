/**
 * # build the command-line tool
 * cmake -S . -B build && cmake --build build
 * ./bin/geocell encode 52.205 0.119 7
 *
 * Examples with options:
 *   ./bin/geocell neighbours u120fxw --log=diag_geocell.txt
 *   ./bin/geocell encode 52.205 0.119 --prefix=6
 */

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "cli_options.hpp"
#include "decimal_format.hpp"
#include "diag_logger.hpp"
#include "geohash.hpp"

using namespace std;
using namespace geocell;

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " encode <lat> <lon> [precision]\n"
         << "  " << argv0 << " decode <geohash>\n"
         << "  " << argv0 << " bounds <geohash>\n"
         << "  " << argv0 << " adjacent <geohash> <n|s|e|w>\n"
         << "  " << argv0 << " neighbours <geohash>\n"
         << "\nOptions (any position):\n"
         << "  --log=PATH    append diagnostics to PATH\n"
         << "  --prefix=N    truncate printed geohashes to N characters\n"
         << "\nNotes:\n"
         << "  - Without a precision, encode picks the shortest hash that decodes back to the input.\n"
         << "  - Single-character hashes at the edge of the world are not wrapped by adjacent.\n";
}

static string join_args(const vector<string> &args) {
    string out;
    for (const auto &a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

// Writes the command's output to `out`, returns a one-line summary for the log.
static string run(const CliOptions &opts, ostream &out) {
    const auto &a = opts.args;

    switch (opts.command) {
    case Command::Encode: {
        optional<string> precision;
        if (a.size() == 3) precision = a[2];
        string hash = applyPrefix(Geohash::encode(a[0], a[1], precision), opts.prefix);
        out << hash << '\n';
        return hash;
    }
    case Command::Decode: {
        LatLon c = Geohash::decode(a[0]);
        string line = text::shortest(c.lat) + " " + text::shortest(c.lon);
        out << line << '\n';
        return line;
    }
    case Command::Bounds: {
        BoundingBox b = Geohash::bounds(a[0]);
        string line = text::shortest(b.southwest.lat) + " " + text::shortest(b.southwest.lon) + " " +
                      text::shortest(b.northeast.lat) + " " + text::shortest(b.northeast.lon);
        out << line << '\n';
        return line;
    }
    case Command::Adjacent: {
        string hash = applyPrefix(Geohash::adjacent(a[0], a[1]), opts.prefix);
        out << hash << '\n';
        // log the canonical letter, the user may have typed "North"
        return string(1, directionLetter(parseDirection(a[1]))) + "=" + hash;
    }
    case Command::Neighbours: {
        Neighbours nb = Geohash::neighbours(a[0]);
        const pair<const char *, const string *> rows[] = {
            {"n", &nb.n}, {"ne", &nb.ne}, {"e", &nb.e}, {"se", &nb.se},
            {"s", &nb.s}, {"sw", &nb.sw}, {"w", &nb.w}, {"nw", &nb.nw},
        };
        ostringstream summary;
        for (const auto &r : rows) {
            string hash = applyPrefix(*r.second, opts.prefix);
            out << r.first << ' ' << hash << '\n';
            summary << r.first << '=' << hash << ' ';
        }
        return summary.str();
    }
    }
    return string{};
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    if (argc < 2) { print_usage(argv[0]); return 1; }

    CliOptions opts;
    try {
        opts = parseCliOptions(argc, argv);
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // Optional diagnostics
    DiagLogger diag(opts.log_path);
    if (!opts.log_path.empty() && !diag.ok()) {
        cerr << "Warning: couldn't open log file: " << opts.log_path << "\n";
    }

    const string cmd_line = join_args(opts.args);
    try {
        string summary = run(opts, cout);
        diag.log(commandName(opts.command), cmd_line, summary);
        return 0;
    } catch (const exception &e) {
        diag.log("error", cmd_line, e.what());
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}

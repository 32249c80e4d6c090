#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "structdiff/Differ.hpp"
#include "structdiff/Errors.hpp"
#include "structdiff/Loader.hpp"
#include "structdiff/Logging.hpp"
#include "structdiff/Options.hpp"

using namespace structdiff;

namespace {

// Exit codes follow diff(1)
constexpr int kExitNoDiff = 0;
constexpr int kExitHasDiff = 1;
constexpr int kExitError = 2;

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("structdiff", "Compare JSON/YAML/TOML documents structurally");
        options.positional_help("LEFT RIGHT");

        options.add_options()
            ("f,format", "Diff format: unified, side-by-side, json-patch, semantic",
                cxxopts::value<std::string>()->default_value("unified"))
            ("o,output", "Output format (overrides --format)", cxxopts::value<std::string>()->default_value(""))
            ("side-by-side", "Show side-by-side comparison")
            ("semantic", "Semantic report with summary and impact")
            ("ignore-metadata", "Ignore metadata fields (timestamps, versions)")
            ("ignore-order", "Ignore order of arrays whose elements have id/name/key")
            ("context", "Number of context lines", cxxopts::value<int>()->default_value("3"))
            ("color", "Colorize output", cxxopts::value<bool>()->default_value("false"))
            ("q,quiet", "No output, just exit code")
            ("options", "Path to JSON/YAML/TOML file with diff options", cxxopts::value<std::string>())
            ("v,verbose", "Debug logging on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("files", "Documents to compare", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"files"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Exit codes: 0 no differences, 1 differences found, 2 error\n";
            return kExitNoDiff;
        }

        if (result.count("verbose")) {
            logger()->set_level(spdlog::level::debug);
        }

        std::vector<std::string> files;
        if (result.count("files")) {
            files = result["files"].as<std::vector<std::string>>();
        }
        if (files.size() != 2) {
            std::cerr << "Error: expected exactly two files to compare\n";
            return kExitError;
        }

        // Options document first, then flags
        DiffOptions opts;
        if (result.count("options")) {
            opts = options_from_value(load_document_file(result["options"].as<std::string>()));
        }
        if (result.count("format")) {
            opts.format = parse_format(result["format"].as<std::string>());
        }
        if (result.count("ignore-metadata")) opts.ignore_metadata = true;
        if (result.count("ignore-order")) opts.ignore_order = true;
        if (result.count("context")) opts.context_lines = result["context"].as<int>();
        if (result.count("color")) opts.colorize = result["color"].as<bool>();
        if (result.count("semantic")) opts.semantic = true;

        opts.format = resolve_format(opts.format,
                                     result["output"].as<std::string>(),
                                     result.count("side-by-side") > 0,
                                     opts.semantic);

        Differ differ(opts);
        DiffResult diff = differ.compare_files(files[0], files[1]);

        if (!result.count("quiet")) {
            std::cout << diff.patch;
            if (!diff.patch.empty() && diff.patch.back() != '\n') {
                std::cout << "\n";
            }
        }

        return diff.has_changes ? kExitHasDiff : kExitNoDiff;

    } catch (const DiffError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitError;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

#include "excelpic/ExcelPic.hpp"
#include "excelpic/cli/CliParser.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace excelpic;

    const std::string program = argc > 0 ? argv[0] : "excelpic";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    auto parsed = cli::parseArguments(args);
    if (!parsed) {
        std::cerr << program << ": " << parsed.error().message << "\n\n";
        cli::printUsage(std::cerr, program);
        return cli::kExitUsage;
    }

    const cli::CliOptions& options = *parsed;
    if (options.show_help) {
        cli::printUsage(std::cout, program);
        return cli::kExitSuccess;
    }
    if (options.show_version) {
        std::cout << "excelpic " << getVersion() << std::endl;
        return cli::kExitSuccess;
    }

    core::LogOptions log_options;
    log_options.log_file = options.log_file.value_or("");
    log_options.level = options.log_level;
    if (!initialize(log_options)) {
        std::cerr << program << ": cannot open log file " << log_options.log_file << std::endl;
    }

    core::ExportConfig config;
    if (options.temp_dir) {
        config.temp_dir = core::Path(*options.temp_dir);
    }
    if (options.renderer_path) {
        config.renderer_path = core::Path(*options.renderer_path);
    }

    auto result = exportImage(core::ExportSource::fromPath(core::Path(options.excel_file)),
                              core::Path(options.image_file),
                              options.page, options.range,
                              options.renderOptions(), config);

    int exit_code = cli::kExitSuccess;
    if (!result) {
        std::cerr << program << ": export failed [" << core::toString(result.error().code) << "] "
                  << result.error().fullMessage() << std::endl;
        exit_code = cli::kExitExportFailed;
    }

    cleanup();
    return exit_code;
}

#include "excelpic/cli/CliParser.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace excelpic {
namespace cli {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isKnownLevel(const std::string& text) {
    static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    const std::string lower = toLower(text);
    return std::find(std::begin(kLevels), std::end(kLevels), lower) != std::end(kLevels);
}

} // namespace

render::RenderOptions CliOptions::renderOptions() const {
    render::RenderOptions options = render::RenderOptions::defaults();
    if (format) {
        options.set("format", *format);
    }
    if (quality) {
        options.set("quality", *quality);
    }
    if (zoom) {
        options.set("zoom", *zoom);
    }
    return options;
}

core::Result<CliOptions> parseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    using FlagHandler = std::function<void(size_t&)>;
    std::unordered_map<std::string, FlagHandler> flag_map;

    // 取出选项的值，缺失时报错
    auto next_value = [&args](size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(fmt::format("{} requires a value", args[i]));
        }
        return args[++i];
    };

    flag_map["-h"] = [&](size_t&) { options.show_help = true; };
    flag_map["--help"] = flag_map["-h"];
    flag_map["--version"] = [&](size_t&) { options.show_version = true; };

    flag_map["-p"] = [&](size_t& i) { options.page = next_value(i); };
    flag_map["--page"] = flag_map["-p"];
    flag_map["-r"] = [&](size_t& i) { options.range = next_value(i); };
    flag_map["--range"] = flag_map["-r"];

    flag_map["--format"] = [&](size_t& i) {
        std::string value = next_value(i);
        if (value.empty()) {
            throw std::invalid_argument("--format must not be empty");
        }
        options.format = value;
    };

    flag_map["--quality"] = [&](size_t& i) {
        const std::string& value = next_value(i);
        size_t consumed = 0;
        int quality = 0;
        try {
            quality = std::stoi(value, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed != value.size() || value.empty() || quality < 0 || quality > 100) {
            throw std::invalid_argument(fmt::format("--quality expects an integer in 0..100, got '{}'", value));
        }
        options.quality = quality;
    };

    flag_map["--zoom"] = [&](size_t& i) {
        const std::string& value = next_value(i);
        size_t consumed = 0;
        double zoom = 0.0;
        try {
            zoom = std::stod(value, &consumed);
        } catch (const std::logic_error&) {
            consumed = 0;
        }
        if (consumed != value.size() || value.empty() || !(zoom > 0.0)) {
            throw std::invalid_argument(fmt::format("--zoom expects a positive number, got '{}'", value));
        }
        options.zoom = zoom;
    };

    flag_map["--renderer-path"] = [&](size_t& i) { options.renderer_path = next_value(i); };
    flag_map["--temp-dir"] = [&](size_t& i) { options.temp_dir = next_value(i); };
    flag_map["--log-file"] = [&](size_t& i) { options.log_file = next_value(i); };
    flag_map["--log-level"] = [&](size_t& i) {
        const std::string& value = next_value(i);
        if (!isKnownLevel(value)) {
            throw std::invalid_argument(fmt::format("Unknown log level: {}", value));
        }
        options.log_level = Logger::parseLevel(value);
    };

    try {
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (auto it = flag_map.find(arg); it != flag_map.end()) {
                it->second(i);
            } else if (arg.size() > 1 && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                positional.push_back(arg);
            }
        }
    } catch (const std::invalid_argument& e) {
        return core::makeError(core::ErrorCode::InvalidArgument, e.what());
    }

    if (options.show_help || options.show_version) {
        return options;
    }

    if (positional.size() != 2) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Expected <excel_filename> <image_filename>, got {} positional argument(s)",
                                           positional.size()));
    }

    options.excel_file = positional[0];
    options.image_file = positional[1];
    return options;
}

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage:\n"
        << "  " << program << " <excel_filename> <image_filename> [options]\n\n"
        << "Export a worksheet region of an Excel workbook as an image.\n\n"
        << "Options:\n"
        << "  -p, --page PAGE            Worksheet name. Defaults to the first worksheet.\n"
        << "  -r, --range RANGE          Cell range or named range, e.g. A1:U8 or Sheet2!B2.\n"
        << "                             Defaults to the used range of the worksheet.\n"
        << "  --format FORMAT            Image format (default: png).\n"
        << "  --quality N                Image quality 0..100 (default: 100).\n"
        << "  --zoom Z                   Zoom factor (default: 4).\n"
        << "  --renderer-path DIR        Directory containing wkhtmltoimage, searched before PATH.\n"
        << "  --temp-dir DIR             Directory for temporary HTML files.\n"
        << "  --log-file FILE            Write logs to FILE (default: no logging).\n"
        << "  --log-level LEVEL          trace, debug, info, warn, error, critical, off.\n"
        << "  --version                  Print version and exit.\n"
        << "  -h, --help                 Show this help message and exit.\n\n"
        << "Examples:\n"
        << "  " << program << " report.xlsx report.png\n"
        << "  " << program << " report.xlsx summary.png -p Sheet1 -r A1:U8\n"
        << "  " << program << " report.xlsx chart.jpg -r Totals --format jpg --quality 90\n";
}

}} // namespace excelpic::cli

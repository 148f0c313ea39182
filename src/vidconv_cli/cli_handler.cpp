#include "vidconv_cli/cli_handler.hpp"

#include <filesystem>

#include "vidconv_core/async/cancellation_token.hpp"
#include "vidconv_core/conversion/conversion_runner.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"

namespace vidconv_cli {

namespace {

const char* const kPresets[] = {"ultrafast", "superfast", "veryfast", "faster", "fast",
                                "medium",    "slow",      "slower",   "veryslow", "placebo"};

bool is_known_preset(const std::string& preset) {
    for (const char* known : kPresets) {
        if (preset == known) {
            return true;
        }
    }
    return false;
}

// Prints the runner's events the way a terminal user expects them.
class ConsoleProgressSink : public vidconv_core::ProgressSink {
public:
    explicit ConsoleProgressSink(std::ostream& out) : out_(out) {}

    void emit(const vidconv_core::ProgressEvent& event) override {
        switch (event.status) {
            case vidconv_core::ProgressStatus::PROGRESS:
                out_ << "\rProgress: " << event.progress.value_or(0) << "% " << std::flush;
                break;
            case vidconv_core::ProgressStatus::COMPLETED:
                out_ << "\nConversion completed successfully!" << std::endl;
                out_ << "Output file: " << event.output.value_or("") << std::endl;
                break;
            case vidconv_core::ProgressStatus::ERROR:
                out_ << "\nError: " << event.message.value_or("unknown error") << std::endl;
                break;
        }
    }

private:
    std::ostream& out_;
};

}  // namespace

CliHandler::CliHandler(vidconv_core::FfmpegToolchain& toolchain,
                       vidconv_core::ConversionRunner& runner,
                       std::ostream& out,
                       std::ostream& err)
    : toolchain_(toolchain), runner_(runner), out_(out), err_(err) {}

std::string CliHandler::default_output_path(const std::string& input_file) {
    std::filesystem::path path(input_file);
    path.replace_extension(".mp4");
    return path.string();
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Convert;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    bool check_ffmpeg = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.command = Command::Help;
            return options;
        }
        if (arg == "--check-ffmpeg") {
            check_ffmpeg = true;
            continue;
        }

        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw CliError("Option " + arg + " requires a value");
            }
            std::string value = argv[++i];

            if (arg == "--codec") {
                options.conversion.codec = value;
            } else if (arg == "--preset") {
                if (!is_known_preset(value)) {
                    throw CliError("Invalid preset: " + value +
                                   " (choose from ultrafast, superfast, veryfast, faster, fast, "
                                   "medium, slow, slower, veryslow, placebo)");
                }
                options.conversion.preset = value;
            } else if (arg == "--crf") {
                size_t consumed = 0;
                try {
                    int crf = std::stoi(value, &consumed);
                    if (consumed != value.size()) {
                        throw CliError("Invalid crf value: " + value);
                    }
                    options.conversion.crf = std::to_string(crf);
                } catch (const std::logic_error&) {
                    throw CliError("Invalid crf value: " + value);
                }
            } else if (arg == "--audio-codec") {
                options.conversion.audio_codec = value;
            } else if (arg == "--audio-bitrate") {
                options.conversion.audio_bitrate = value;
            } else if (arg == "--resolution") {
                options.conversion.resolution = value;
            } else {
                throw CliError("Unknown option: " + arg);
            }
            continue;
        }

        if (options.input_file.empty()) {
            options.input_file = arg;
        } else if (options.output_file.empty()) {
            options.output_file = arg;
        } else {
            throw CliError("Unexpected argument: " + arg);
        }
    }

    if (check_ffmpeg) {
        options.command = Command::CheckFfmpeg;
        return options;
    }
    if (options.input_file.empty()) {
        throw CliError("input_file is required");
    }
    if (options.output_file.empty()) {
        options.output_file = default_output_path(options.input_file);
    }
    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Convert:
            return handle_convert_command(options);
        case Command::CheckFfmpeg:
            return handle_check_ffmpeg_command();
        case Command::Help:
            return handle_help_command();
    }
    return 1;
}

int CliHandler::handle_convert_command(const CliOptions& options) {
    if (!std::filesystem::exists(options.input_file)) {
        print_error("Input file '" + options.input_file + "' does not exist");
        return 1;
    }
    if (!toolchain_.is_available()) {
        print_error(vidconv_core::FfmpegToolchain::availability_message(false));
        err_ << "Please install FFmpeg and add it to your system PATH" << std::endl;
        return 1;
    }

    vidconv_core::ConversionRequest request;
    request.input_file = options.input_file;
    request.output_file = options.output_file;
    request.options = options.conversion;

    out_ << "Converting " << request.input_file << " to " << request.output_file << "..."
         << std::endl;
    out_ << "Options: codec=" << request.options.codec << " preset=" << request.options.preset
         << " crf=" << request.options.crf << " audio_codec=" << request.options.audio_codec
         << " audio_bitrate=" << request.options.audio_bitrate;
    if (request.options.resolution) {
        out_ << " resolution=" << *request.options.resolution;
    }
    out_ << std::endl;

    ConsoleProgressSink sink(out_);
    vidconv_core::async::CancellationToken token;
    return runner_.run(request, sink, token) ? 0 : 1;
}

int CliHandler::handle_check_ffmpeg_command() {
    if (toolchain_.is_available()) {
        out_ << vidconv_core::FfmpegToolchain::availability_message(true) << std::endl;
        return 0;
    }
    out_ << vidconv_core::FfmpegToolchain::availability_message(false) << std::endl;
    out_ << "Please install FFmpeg and add it to your system PATH" << std::endl;
    return 1;
}

int CliHandler::handle_help_command() {
    print_help();
    return 0;
}

void CliHandler::print_error(const std::string& error) {
    err_ << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    out_ << "Convert various video formats to MP4\n\n"
         << "Usage: vidconv <input_file> [output_file] [options]\n\n"
         << "Options:\n"
         << "  --codec <codec>            Video codec (default: libx264)\n"
         << "  --preset <preset>          Encoding preset (default: medium)\n"
         << "  --crf <n>                  Constant Rate Factor (default: 23)\n"
         << "  --audio-codec <codec>      Audio codec (default: aac)\n"
         << "  --audio-bitrate <rate>     Audio bitrate (default: 128k)\n"
         << "  --resolution <WxH>         Video resolution (e.g., 1920x1080)\n"
         << "  --check-ffmpeg             Check if FFmpeg is installed\n"
         << "  -h, --help                 Show this help\n\n"
         << "The output defaults to the input path with an .mp4 extension." << std::endl;
}

}  // namespace vidconv_cli

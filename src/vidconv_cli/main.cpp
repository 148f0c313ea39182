#include "vidconv_cli/cli_handler.hpp"
#include "vidconv_core/conversion/conversion_runner.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"
#include "vidconv_core/process/process_launcher.hpp"
#include <iostream>
#include <cstdlib>

int main(int argc, char *argv[])
{
  try
  {
    // Tool locations can be overridden from the environment
    vidconv_core::ToolchainPaths paths;
    if (const char *ffmpeg = std::getenv("FFMPEG_PATH"))
    {
      paths.ffmpeg = ffmpeg;
    }
    if (const char *ffprobe = std::getenv("FFPROBE_PATH"))
    {
      paths.ffprobe = ffprobe;
    }

    vidconv_core::ProcessLauncher launcher;
    vidconv_core::FfmpegToolchain toolchain(launcher, paths);
    vidconv_core::ConversionRunner runner(toolchain);
    vidconv_cli::CliHandler handler(toolchain, runner);

    // Parse command line arguments
    vidconv_cli::CliOptions options = handler.parse_arguments(argc, argv);

    // Execute the command
    return handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

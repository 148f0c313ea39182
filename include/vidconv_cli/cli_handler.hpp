#pragma once

#include <iostream>
#include <optional>
#include <string>

#include "vidconv_core/types/conversion_request.hpp"

namespace vidconv_core
{
  class FfmpegToolchain;
  class ConversionRunner;
}

namespace vidconv_cli
{

  enum class Command
  {
    Convert,
    CheckFfmpeg,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string input_file;
    std::string output_file;
    vidconv_core::ConversionOptions conversion;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler(vidconv_core::FfmpegToolchain &toolchain,
               vidconv_core::ConversionRunner &runner,
               std::ostream &out = std::cout,
               std::ostream &err = std::cerr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments. Throws CliError on bad usage.
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command, returns the process exit code
    int execute_command(const CliOptions &options);

    // <input stem>.mp4 next to the input
    static std::string default_output_path(const std::string &input_file);

  private:
    vidconv_core::FfmpegToolchain &toolchain_;
    vidconv_core::ConversionRunner &runner_;
    std::ostream &out_;
    std::ostream &err_;

    // Command handlers
    int handle_convert_command(const CliOptions &options);
    int handle_check_ffmpeg_command();
    int handle_help_command();

    // Helper methods
    void print_error(const std::string &error);
    void print_help();
  };

}

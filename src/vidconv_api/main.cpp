#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>

#include "vidconv_api/config.hpp"
#include "vidconv_api/routes.hpp"
#include "vidconv_api/server.hpp"
#include "vidconv_core/async/worker_pool.hpp"
#include "vidconv_core/conversion/conversion_runner.hpp"
#include "vidconv_core/conversion/ffmpeg_toolchain.hpp"
#include "vidconv_core/process/process_launcher.hpp"
#include "vidconv_core/session/connection_manager.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

vidconv_api::Config load_config(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    std::cout << "Config file " << path << " not found, using defaults" << std::endl;
    return vidconv_api::Config::defaults();
  }
  return vidconv_api::Config::from_file(path);
}

int main(int argc, char* argv[]) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "vidconvrc.json";
    vidconv_api::Config config = load_config(config_path);

    std::cout << "Starting video conversion server..." << std::endl;
    std::cout << "Listening on: " << config.host << ":" << config.port << std::endl;
    std::cout << "Upload Directory: " << config.upload_dir << std::endl;
    std::cout << "FFmpeg: " << config.ffmpeg_path << " / " << config.ffprobe_path << std::endl;
    std::cout << "Workers: " << config.num_workers << std::endl;

    // --- 1. INITIALIZE CORE COMPONENTS ---
    vidconv_core::ProcessLauncher launcher;
    vidconv_core::FfmpegToolchain toolchain(
        launcher, vidconv_core::ToolchainPaths{config.ffmpeg_path, config.ffprobe_path});
    vidconv_core::ConversionRunner runner(toolchain);
    vidconv_core::async::WorkerPool worker_pool(static_cast<size_t>(config.num_workers));

    if (!toolchain.is_available()) {
      std::cerr << "Warning: " << vidconv_core::FfmpegToolchain::availability_message(false)
                << std::endl;
    }

    vidconv_core::SessionSettings settings;
    settings.uploads.upload_root = config.upload_dir;
    settings.uploads.keep_partial_uploads = config.keep_partial_uploads;
    settings.cancel_ack_timeout = std::chrono::milliseconds(config.cancel_ack_timeout_ms);
    vidconv_core::ConnectionManager connection_manager(worker_pool, runner, toolchain, settings);

    vidconv_api::Server server(config.host, config.port);
    server.set_log_level(config.log_level);
    vidconv_api::Routes routes(connection_manager);
    routes.register_routes(server);

    // --- 2. START BACKGROUND SERVICES ---
    server.get_app().signal_clear();

    worker_pool.start();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/4] Notifying clients..." << std::endl;
    size_t notified = connection_manager.broadcast({{"type", "server_shutdown"}});
    std::cout << "Notified " << notified << " client(s)" << std::endl;

    std::cout << "[2/4] Cancelling conversions and aborting uploads..." << std::endl;
    connection_manager.close_all();
    routes.close_connections("Server shutting down");

    std::cout << "[3/4] Stopping server..." << std::endl;
    server.stop();

    std::cout << "[4/4] Stopping worker pool..." << std::endl;
    worker_pool.stop();  // Blocks until all workers are done

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

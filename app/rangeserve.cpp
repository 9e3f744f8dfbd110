#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include "rangeserve/download-service.hpp"
#include "rangeserve/http-server.hpp"
#include "rangeserve/log.hpp"
#include "rangeserve/server-config.hpp"
#include "rangeserve/signal-handler.hpp"
#include "rangeserve/stream-config.hpp"

namespace {

int Usage(std::string_view programName) {
  std::cerr << "Usage: " << programName << " <share-root> [port] [maximum|balanced|conservative|tunnel]\n";
  return EXIT_FAILURE;
}

std::optional<uint16_t> ParsePort(std::string_view str) {
  uint16_t port;
  const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), port);
  if (str.empty() || ec != std::errc{} || ptr != str.data() + str.size()) {
    return std::nullopt;
  }
  return port;
}

void SetLogLevelFromEnv() {
  const char* levelStr = std::getenv("RANGESERVE_LOG_LEVEL");
  if (levelStr == nullptr) {
    return;
  }
  const auto level = rangeserve::log::level::from_str(levelStr);
  if (level == rangeserve::log::level::off && std::string_view(levelStr) != "off") {
    rangeserve::log::warn("Unknown log level '{}', keeping default", levelStr);
    return;
  }
  rangeserve::log::set_level(level);
}

}  // namespace

int main(int argc, char** argv) {
  using namespace rangeserve;

  if (argc < 2 || argc > 4) {
    return Usage(argv[0]);
  }
  SetLogLevelFromEnv();

  ServerConfig serverConfig;
  serverConfig.withPort(8000);
  if (argc > 2) {
    const auto port = ParsePort(argv[2]);
    if (!port) {
      std::cerr << "Invalid port '" << argv[2] << "'\n";
      return Usage(argv[0]);
    }
    serverConfig.withPort(*port);
  }

  auto preset = StreamConfig::Preset::Balanced;
  if (argc > 3) {
    const auto parsed = ParsePreset(argv[3]);
    if (!parsed) {
      std::cerr << "Unknown preset '" << argv[3] << "'\n";
      return Usage(argv[0]);
    }
    preset = *parsed;
  }

  SignalHandler::Enable(serverConfig.maxDrainPeriod);

  try {
    const auto streamConfig = StreamConfig::FromPreset(preset);
    log::info("Using preset '{}': chunks of {} bytes, socket buffers of {} bytes, {} max streams, {} ms chunk delay",
              PresetName(preset), streamConfig.chunkSize, streamConfig.socketBufferSize,
              streamConfig.maxConcurrentStreams, streamConfig.chunkDelay.count());

    HttpServer server(std::move(serverConfig), DownloadService(std::filesystem::path(argv[1]), streamConfig));
    std::cout << "Serving " << server.service().shareRoot() << " on port " << server.port() << '\n';
    server.run();
  } catch (const std::exception& ex) {
    log::critical("Error: {}", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

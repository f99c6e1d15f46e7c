// Relay discovery and TCP sessions between a LAN and an isolated IPTV segment.
#include "zappa/zappa.h"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <pthread.h>

namespace {

void PrintUsage() {
  std::cout << "Usage: zappa_gateway <lan ip> <iptv ip> [--tick-ms N] [--verbose]\n";
}

bool ParseTickMs(const std::string& text, long* out) {
  char* end = nullptr;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value <= 0) {
    return false;
  }
  *out = value;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  zappa::Config config;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose") {
      config.verbose = true;
      continue;
    }
    if (arg == "--tick-ms") {
      long tick_ms = 0;
      if (i + 1 >= argc || !ParseTickMs(argv[i + 1], &tick_ms)) {
        std::cerr << "--tick-ms expects a positive integer\n";
        return 1;
      }
      config.tick_interval = std::chrono::milliseconds(tick_ms);
      ++i;
      continue;
    }
    positional.push_back(arg);
  }
  if (positional.size() < 2) {
    PrintUsage();
    return 1;
  }
  config.lan_address = positional[0];
  config.iptv_address = positional[1];

  std::string error;
  if (!config.Validate(&error)) {
    std::cerr << "Invalid configuration: " << error << std::endl;
    return 1;
  }

  // Block termination signals before any thread exists so only sigwait sees them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  zappa::Gateway gateway(config);
  if (!gateway.Start()) {
    std::cerr << "Failed to start gateway: " << gateway.GetLastError() << std::endl;
    return 1;
  }

  int received = 0;
  sigwait(&signals, &received);
  std::cout << "Stopping..." << std::endl;
  gateway.Stop();

  const zappa::GatewayMetrics metrics = gateway.GetMetrics();
  std::cout << "sessions=" << metrics.sessions_created
            << " datagrams=" << metrics.datagrams_forwarded
            << " connections=" << metrics.connections_accepted
            << " to_client=" << metrics.bytes_to_client
            << " to_device=" << metrics.bytes_to_device << std::endl;
  return 0;
}

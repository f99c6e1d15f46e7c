#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace zappa {

class Gateway;

/**
 * Fixed discovery protocol constants.
 */
constexpr const char* kDiscoveryGroup = "239.16.16.195";
constexpr uint16_t kDiscoveryPort = 5555;

/**
 * Size of a single receive/forward operation for datagrams and relayed TCP data.
 */
constexpr size_t kRelayBufferSize = 4096;

/**
 * Session lifecycle. There is no terminal state: a disconnect returns the
 * session to kListening.
 */
enum class SessionState : uint8_t {
  kListening,
  kAccepted,
};

/**
 * Roles the scheduler keeps exactly one worker for.
 */
enum class WorkerRole : uint8_t {
  kDiscovery,
  kAccept,
  kForwardToClient,
  kForwardToDevice,
};

/**
 * Outcome a worker reports back to the scheduler when it ends.
 */
enum class WorkerStatus : uint8_t {
  kCompleted,
  kPeerClosed,
  kTransientError,
  kStopped,
};

struct WorkerResult {
  WorkerStatus status = WorkerStatus::kCompleted;
  /// Error text for kTransientError, empty otherwise.
  std::string detail;
};

#ifdef ZAPPA_TESTING
namespace test {
bool InjectDiscovery(Gateway& gateway,
                     const std::vector<uint8_t>& payload,
                     const std::string& source_address,
                     uint16_t source_port);
void SetForwardTarget(Gateway& gateway, const std::string& address,
                      uint16_t port);
void RunTick(Gateway& gateway);
uint64_t GetSpawnCount(Gateway& gateway, uint16_t source_port,
                       WorkerRole role);
}  // namespace test
#endif

/**
 * Snapshot of one relay session.
 */
struct SessionInfo {
  /// Source port of the discovery datagram; identity of the session.
  uint16_t source_port = 0;
  /// LAN-side address of the discovering client.
  std::string peer_address;
  SessionState state = SessionState::kListening;
  bool accept_running = false;
  bool forward_to_client_running = false;
  bool forward_to_device_running = false;
  uint64_t connections_accepted = 0;
  uint64_t disconnects = 0;
  uint64_t bytes_to_client = 0;
  uint64_t bytes_to_device = 0;
};

/**
 * Lightweight counters for relay traffic and error reporting.
 */
struct GatewayMetrics {
  uint64_t datagrams_received = 0;
  uint64_t datagrams_forwarded = 0;
  /// Datagrams sourced from the IPTV address (the gateway's own re-emissions).
  uint64_t datagrams_ignored = 0;
  uint64_t forward_errors = 0;
  uint64_t sessions_created = 0;
  uint64_t session_create_errors = 0;
  uint64_t connections_accepted = 0;
  uint64_t connect_failures = 0;
  uint64_t disconnects = 0;
  uint64_t bytes_to_client = 0;
  uint64_t bytes_to_device = 0;
  uint64_t workers_spawned = 0;
  uint64_t worker_errors = 0;
};

/**
 * Gateway configuration for interface addresses and scheduling.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// IPv4 address of the LAN interface (discovery is received here).
  std::string lan_address;
  /// IPv4 address of the IPTV interface (discovery is re-emitted here).
  std::string iptv_address;

  /// Scheduler tick period.
  std::chrono::milliseconds tick_interval{50};
  /// Listen backlog for per-session accept sockets.
  int accept_backlog = 1;

  /// Log payloads and per-worker outcomes.
  bool verbose = false;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Relays discovery multicast from the LAN to the IPTV segment and bridges the
 * resulting TCP connections back to the discovering client.
 */
class Gateway {
 public:
  /// Construct a gateway with the provided configuration.
  explicit Gateway(Config config);
  /// Stop the scheduler and all workers, close sockets.
  ~Gateway();

  Gateway(const Gateway&) = delete;
  Gateway& operator=(const Gateway&) = delete;

  /// Join the discovery group and start the scheduler thread.
  bool Start();
  /// Stop the scheduler, close every socket and join all workers.
  void Stop();

  /// Return a snapshot of every session seen so far.
  std::vector<SessionInfo> GetSessions() const;
  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return counters for datagrams, connections, bytes and workers.
  GatewayMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef ZAPPA_TESTING
  friend bool test::InjectDiscovery(Gateway& gateway,
                                    const std::vector<uint8_t>& payload,
                                    const std::string& source_address,
                                    uint16_t source_port);
  friend void test::SetForwardTarget(Gateway& gateway,
                                     const std::string& address,
                                     uint16_t port);
  friend void test::RunTick(Gateway& gateway);
  friend uint64_t test::GetSpawnCount(Gateway& gateway, uint16_t source_port,
                                      WorkerRole role);
#endif
};

}  // namespace zappa

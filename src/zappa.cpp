#include "zappa/zappa.h"
#include "zappa/test_hooks.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zappa {
namespace {

// Upper bound on a single readiness wait, so stopping workers notice quickly.
constexpr int kWaitTimeoutMs = 200;

// Longest payload prefix echoed in verbose diagnostics.
constexpr size_t kMaxDescribedBytes = 64;

void Log(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[zappa] " << message << std::endl;
}

void LogDebug(const std::string& message, const Config* config) {
  if (config && config->verbose) {
    Log(message, config);
  }
}

std::string ErrnoString(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

std::string Endpoint(const std::string& address, uint16_t port) {
  return address + ":" + std::to_string(port);
}

// Printable rendering of a payload for diagnostics.
std::string DescribeBytes(const uint8_t* data, size_t length) {
  std::string out;
  const size_t shown = std::min(length, kMaxDescribedBytes);
  for (size_t i = 0; i < shown; ++i) {
    const uint8_t c = data[i];
    if (c >= 0x20 && c < 0x7f && c != '\\') {
      out.push_back(static_cast<char>(c));
    } else {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02x", c);
      out += escaped;
    }
  }
  if (shown < length) {
    out += "...";
  }
  return out;
}

// Wait for fd to become readable. Returns >0 when ready, 0 on timeout, <0 on error.
int WaitReadable(int fd, int timeout_ms) {
  if (fd < 0) {
    errno = EBADF;
    return -1;
  }
  pollfd entry{};
  entry.fd = fd;
  entry.events = POLLIN;
  for (;;) {
    const int ready = ::poll(&entry, 1, timeout_ms);
    if (ready < 0 && errno == EINTR) {
      continue;
    }
    return ready;
  }
}

const char* RoleName(WorkerRole role) {
  switch (role) {
    case WorkerRole::kDiscovery:
      return "discovery";
    case WorkerRole::kAccept:
      return "accept";
    case WorkerRole::kForwardToClient:
      return "forward-to-client";
    case WorkerRole::kForwardToDevice:
      return "forward-to-device";
  }
  return "unknown";
}

// Minimal UDP socket wrapper for the discovery listener and per-session senders.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(const std::string& bind_address, uint16_t port, bool reuse_address) {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      last_error_ = ErrnoString("socket()");
      return false;
    }
    if (reuse_address) {
      int reuse = 1;
      if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        last_error_ = ErrnoString("setsockopt(SO_REUSEADDR)");
        Close();
        return false;
      }
    }
    sockaddr_in addr = MakeSockaddr(bind_address, port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << bind_address << ":" << port << ") failed: "
          << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    return true;
  }

  // Receive traffic for a multicast group on the given local interface.
  bool JoinGroup(const std::string& group, const std::string& interface_address) {
    ip_mreq request{};
    if (inet_pton(AF_INET, group.c_str(), &request.imr_multiaddr) != 1 ||
        inet_pton(AF_INET, interface_address.c_str(), &request.imr_interface) != 1) {
      last_error_ = "invalid multicast membership " + group + " on " + interface_address;
      return false;
    }
    if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &request, sizeof(request)) < 0) {
      std::ostringstream oss;
      oss << "setsockopt(IP_ADD_MEMBERSHIP " << group << " on "
          << interface_address << ") failed: " << std::strerror(errno);
      last_error_ = oss.str();
      return false;
    }
    return true;
  }

  // Only deliver groups joined on this socket, not every group the host has joined.
  bool RestrictToJoinedGroups() {
#ifdef IP_MULTICAST_ALL
    int all = 0;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_ALL, &all, sizeof(all)) < 0) {
      last_error_ = ErrnoString("setsockopt(IP_MULTICAST_ALL)");
      return false;
    }
#endif
    return true;
  }

  // Send multicast out of the given interface, without looping it back locally.
  bool SetMulticastInterface(const std::string& interface_address) {
    in_addr iface{};
    if (inet_pton(AF_INET, interface_address.c_str(), &iface) != 1) {
      last_error_ = "invalid multicast interface " + interface_address;
      return false;
    }
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) < 0) {
      last_error_ = ErrnoString("setsockopt(IP_MULTICAST_IF)");
      return false;
    }
    unsigned char loop = 0;
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
      last_error_ = ErrnoString("setsockopt(IP_MULTICAST_LOOP)");
      return false;
    }
    return true;
  }

  void Shutdown() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const uint8_t* data, size_t length, const sockaddr_in& addr) {
    return ::sendto(fd_, data, length, 0,
                    reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  }

  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len) {
    return ::recvfrom(fd_, buffer, length, 0,
                      reinterpret_cast<sockaddr*>(addr), addr_len);
  }

 private:
  int fd_ = -1;
  std::string last_error_;
};

// Minimal TCP socket wrapper for accept sockets and relayed connections.
// last_error() is only meaningful for the thread that called Listen/Accept/Connect.
class TcpSocket {
 public:
  TcpSocket() = default;
  explicit TcpSocket(int fd) : fd_(fd) {}
  ~TcpSocket() { Close(); }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  bool Listen(const std::string& bind_address, uint16_t port, int backlog) {
    if (!Create()) {
      return false;
    }
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      last_error_ = ErrnoString("setsockopt(SO_REUSEADDR)");
      Close();
      return false;
    }
    sockaddr_in addr = MakeSockaddr(bind_address, port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << bind_address << ":" << port << ") failed: "
          << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    if (::listen(fd_, backlog) < 0) {
      last_error_ = ErrnoString("listen()");
      Close();
      return false;
    }
    return true;
  }

  std::shared_ptr<TcpSocket> Accept(sockaddr_in* peer) {
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    int fd = -1;
    do {
      fd = ::accept(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) {
      last_error_ = ErrnoString("accept()");
      return nullptr;
    }
    if (peer) {
      *peer = addr;
    }
    return std::make_shared<TcpSocket>(fd);
  }

  bool Connect(const std::string& address, uint16_t port) {
    if (!Create()) {
      return false;
    }
    sockaddr_in addr = MakeSockaddr(address, port);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "connect(" << address << ":" << port << ") failed: "
          << std::strerror(errno);
      last_error_ = oss.str();
      Close();
      return false;
    }
    return true;
  }

  ssize_t Recv(uint8_t* buffer, size_t length) {
    ssize_t received = -1;
    do {
      received = ::recv(fd_, buffer, length, 0);
    } while (received < 0 && errno == EINTR);
    return received;
  }

  // Write every byte or fail; errno describes the failure.
  bool SendAll(const uint8_t* data, size_t length) {
    size_t offset = 0;
    while (offset < length) {
      const ssize_t sent = ::send(fd_, data + offset, length - offset, MSG_NOSIGNAL);
      if (sent < 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
      offset += static_cast<size_t>(sent);
    }
    return true;
  }

  void Shutdown() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

 private:
  bool Create() {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      last_error_ = ErrnoString("socket()");
      return false;
    }
    return true;
  }

  int fd_ = -1;
  std::string last_error_;
};

// One outstanding worker per role. The scheduler sets running before the
// thread starts; the worker stores its result and clears running as its
// last action.
struct WorkerSlot {
  std::thread thread;
  std::atomic<bool> running{false};
  std::atomic<uint64_t> spawn_count{0};
  WorkerResult last_result;
};

// Per-port pairing of a discovering client with an IPTV-side device.
struct RelaySession {
  RelaySession(uint16_t port, std::string peer)
      : source_port(port), peer_address(std::move(peer)) {}

  const uint16_t source_port;
  const std::string peer_address;

  // Bound once at creation, never rebound.
  UdpSocket multicast_socket;
  TcpSocket accept_socket;

  // Guards state, connections and epoch.
  mutable std::mutex mutex;
  SessionState state = SessionState::kListening;
  std::shared_ptr<TcpSocket> device_conn;
  std::shared_ptr<TcpSocket> client_conn;
  uint64_t epoch = 0;

  WorkerSlot accept_worker;
  WorkerSlot to_client_worker;
  WorkerSlot to_device_worker;

  std::atomic<uint64_t> connections_accepted{0};
  std::atomic<uint64_t> disconnects{0};
  std::atomic<uint64_t> bytes_to_client{0};
  std::atomic<uint64_t> bytes_to_device{0};

  WorkerSlot* SlotFor(WorkerRole role) {
    switch (role) {
      case WorkerRole::kAccept:
        return &accept_worker;
      case WorkerRole::kForwardToClient:
        return &to_client_worker;
      case WorkerRole::kForwardToDevice:
        return &to_device_worker;
      case WorkerRole::kDiscovery:
        break;
    }
    return nullptr;
  }

  SessionInfo Snapshot() const {
    SessionInfo info;
    info.source_port = source_port;
    info.peer_address = peer_address;
    {
      std::lock_guard<std::mutex> lock(mutex);
      info.state = state;
    }
    info.accept_running = accept_worker.running.load();
    info.forward_to_client_running = to_client_worker.running.load();
    info.forward_to_device_running = to_device_worker.running.load();
    info.connections_accepted = connections_accepted.load();
    info.disconnects = disconnects.load();
    info.bytes_to_client = bytes_to_client.load();
    info.bytes_to_device = bytes_to_device.load();
    return info;
  }
};

// Source port -> session. Grows only; sessions are never removed.
class SessionRegistry {
 public:
  std::shared_ptr<RelaySession> FindByPort(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(port);
    if (it == sessions_.end()) {
      return nullptr;
    }
    return it->second;
  }

  // Bind both IPTV-side sockets and insert a Listening session. Returns the
  // existing session if the port is already known, nullptr if binding fails.
  std::shared_ptr<RelaySession> Create(uint16_t port, const std::string& peer_address,
                                       const Config& config, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(port);
    if (it != sessions_.end()) {
      return it->second;
    }
    auto session = std::make_shared<RelaySession>(port, peer_address);
    if (!session->multicast_socket.Open(config.iptv_address, port, false) ||
        !session->multicast_socket.SetMulticastInterface(config.iptv_address)) {
      if (error) {
        *error = session->multicast_socket.last_error();
      }
      return nullptr;
    }
    if (!session->accept_socket.Listen(config.iptv_address, port,
                                       config.accept_backlog)) {
      if (error) {
        *error = session->accept_socket.last_error();
      }
      return nullptr;
    }
    sessions_.emplace(port, session);
    return session;
  }

  std::vector<std::shared_ptr<RelaySession>> Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<RelaySession>> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
      result.push_back(entry.second);
    }
    return result;
  }

  // Wake every blocked worker by shutting down all session sockets.
  void CloseAll() {
    for (const auto& session : Snapshot()) {
      session->multicast_socket.Shutdown();
      session->accept_socket.Shutdown();
      std::lock_guard<std::mutex> lock(session->mutex);
      if (session->device_conn) {
        session->device_conn->Shutdown();
      }
      if (session->client_conn) {
        session->client_conn->Shutdown();
      }
    }
  }

 private:
  mutable std::mutex mutex_;
  std::map<uint16_t, std::shared_ptr<RelaySession>> sessions_;
};

}  // namespace

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (!is_valid_ipv4(lan_address)) {
    return fail("lan_address must be a valid IPv4 address");
  }
  if (!is_valid_ipv4(iptv_address)) {
    return fail("iptv_address must be a valid IPv4 address");
  }
  if (lan_address == iptv_address) {
    return fail("lan_address and iptv_address must differ");
  }
  if (tick_interval.count() <= 0) {
    return fail("tick_interval must be positive");
  }
  if (accept_backlog <= 0) {
    return fail("accept_backlog must be positive");
  }
  return true;
}

struct GatewayMetricsAtomic {
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> datagrams_forwarded{0};
  std::atomic<uint64_t> datagrams_ignored{0};
  std::atomic<uint64_t> forward_errors{0};
  std::atomic<uint64_t> sessions_created{0};
  std::atomic<uint64_t> session_create_errors{0};
  std::atomic<uint64_t> connections_accepted{0};
  std::atomic<uint64_t> connect_failures{0};
  std::atomic<uint64_t> disconnects{0};
  std::atomic<uint64_t> bytes_to_client{0};
  std::atomic<uint64_t> bytes_to_device{0};
  std::atomic<uint64_t> workers_spawned{0};
  std::atomic<uint64_t> worker_errors{0};

  GatewayMetrics Snapshot() const {
    GatewayMetrics snapshot;
    snapshot.datagrams_received = datagrams_received.load();
    snapshot.datagrams_forwarded = datagrams_forwarded.load();
    snapshot.datagrams_ignored = datagrams_ignored.load();
    snapshot.forward_errors = forward_errors.load();
    snapshot.sessions_created = sessions_created.load();
    snapshot.session_create_errors = session_create_errors.load();
    snapshot.connections_accepted = connections_accepted.load();
    snapshot.connect_failures = connect_failures.load();
    snapshot.disconnects = disconnects.load();
    snapshot.bytes_to_client = bytes_to_client.load();
    snapshot.bytes_to_device = bytes_to_device.load();
    snapshot.workers_spawned = workers_spawned.load();
    snapshot.worker_errors = worker_errors.load();
    return snapshot;
  }
};

struct Gateway::Impl {
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

  explicit Impl(Config config)
      : config_(std::move(config)),
        forward_target_(MakeSockaddr(kDiscoveryGroup, kDiscoveryPort)) {}

  bool Start() {
    if (running_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    if (stopping_) {
      start_error_ = "gateway has been stopped and cannot be restarted";
      Log(start_error_, &config_);
      running_ = false;
      return false;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      start_error_ = error;
      Log(error, &config_);
      running_ = false;
      return false;
    }
    // Bound to the group address: Linux only delivers group traffic to
    // sockets bound to the group or the wildcard address.
    if (!listener_.Open(kDiscoveryGroup, kDiscoveryPort, true)) {
      start_error_ = listener_.last_error();
      Log(start_error_, &config_);
      running_ = false;
      return false;
    }
    if (!listener_.JoinGroup(kDiscoveryGroup, config_.lan_address) ||
        !listener_.RestrictToJoinedGroups()) {
      start_error_ = listener_.last_error();
      Log(start_error_, &config_);
      listener_.Close();
      running_ = false;
      return false;
    }
    Log("Listening for multicasts on " +
            Endpoint(config_.lan_address, kDiscoveryPort),
        &config_);
    try {
      scheduler_thread_ = std::thread([this]() { SchedulerLoop(); });
    } catch (const std::exception& ex) {
      start_error_ = std::string("scheduler thread start failed: ") + ex.what();
      Log(start_error_, &config_);
      listener_.Close();
      running_ = false;
      return false;
    }
    return true;
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(tick_mutex_);
      stopping_ = true;
    }
    tick_cv_.notify_all();
    if (scheduler_thread_.joinable()) {
      scheduler_thread_.join();
    }
    listener_.Shutdown();
    registry_.CloseAll();
    JoinWorker(discovery_worker_);
    for (const auto& session : registry_.Snapshot()) {
      JoinWorker(session->accept_worker);
      JoinWorker(session->to_client_worker);
      JoinWorker(session->to_device_worker);
    }
    listener_.Close();
    running_ = false;
  }

  std::vector<SessionInfo> GetSessions() const {
    std::vector<SessionInfo> result;
    for (const auto& session : registry_.Snapshot()) {
      result.push_back(session->Snapshot());
    }
    return result;
  }

  std::string GetLastError() const { return start_error_; }

  GatewayMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  // Scheduler loop: one tick per interval until Stop().
  void SchedulerLoop() {
    while (!stopping_) {
      RunTick();
      std::unique_lock<std::mutex> lock(tick_mutex_);
      tick_cv_.wait_for(lock, config_.tick_interval,
                        [this]() { return stopping_.load(); });
    }
  }

  // Make sure every eligible role has exactly one outstanding worker.
  void RunTick() {
    std::lock_guard<std::mutex> tick_lock(run_mutex_);
    if (listener_.fd() >= 0) {
      EnsureWorker(discovery_worker_, WorkerRole::kDiscovery, kDiscoveryPort,
                   [this]() { return ReceiveDiscovery(); });
    }
    for (const auto& session : registry_.Snapshot()) {
      // The state check and the spawn happen under the session lock so a
      // worker can never be started for a state it does not belong to.
      std::lock_guard<std::mutex> lock(session->mutex);
      switch (session->state) {
        case SessionState::kListening:
          EnsureWorker(session->accept_worker, WorkerRole::kAccept,
                       session->source_port,
                       [this, session]() { return AcceptDevice(*session); });
          break;
        case SessionState::kAccepted:
          EnsureWorker(session->to_client_worker, WorkerRole::kForwardToClient,
                       session->source_port, [this, session]() {
                         return Pump(*session, WorkerRole::kForwardToClient);
                       });
          EnsureWorker(session->to_device_worker, WorkerRole::kForwardToDevice,
                       session->source_port, [this, session]() {
                         return Pump(*session, WorkerRole::kForwardToDevice);
                       });
          break;
      }
    }
  }

  template <typename Fn>
  bool EnsureWorker(WorkerSlot& slot, WorkerRole role, uint16_t port, Fn fn) {
    if (stopping_ || slot.running.load()) {
      return false;
    }
    if (slot.thread.joinable()) {
      slot.thread.join();
      if (!ShouldRespawn(role, port, slot.last_result)) {
        return false;
      }
    }
    slot.running = true;
    try {
      slot.thread = std::thread([&slot, fn]() {
        slot.last_result = fn();
        slot.running = false;
      });
    } catch (const std::exception& ex) {
      slot.running = false;
      Log(std::string("failed to start ") + RoleName(role) + " worker: " + ex.what(),
          &config_);
      return false;
    }
    slot.spawn_count.fetch_add(1);
    metrics_.workers_spawned.fetch_add(1);
    return true;
  }

  // Retry policy: every outcome except shutdown is retried on this tick.
  bool ShouldRespawn(WorkerRole role, uint16_t port, const WorkerResult& result) {
    switch (result.status) {
      case WorkerStatus::kCompleted:
      case WorkerStatus::kPeerClosed:
        return true;
      case WorkerStatus::kTransientError:
        metrics_.worker_errors.fetch_add(1);
        LogDebug(std::string(RoleName(role)) + " worker on port " +
                     std::to_string(port) + " failed, retrying: " + result.detail,
                 &config_);
        return true;
      case WorkerStatus::kStopped:
        return false;
    }
    return false;
  }

  void JoinWorker(WorkerSlot& slot) {
    if (slot.thread.joinable()) {
      slot.thread.join();
    }
  }

  // Discovery worker: wait for one datagram on the LAN listener and relay it.
  WorkerResult ReceiveDiscovery() {
    std::array<uint8_t, kRelayBufferSize> buffer{};
    while (!stopping_) {
      const int ready = WaitReadable(listener_.fd(), kWaitTimeoutMs);
      if (ready < 0) {
        return {WorkerStatus::kTransientError, ErrnoString("poll()")};
      }
      if (ready == 0) {
        continue;
      }
      sockaddr_in addr{};
      socklen_t addr_len = sizeof(addr);
      const ssize_t bytes =
          listener_.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
      if (bytes < 0) {
        if (stopping_) {
          break;
        }
        return {WorkerStatus::kTransientError, ErrnoString("recvfrom()")};
      }
      if (stopping_) {
        break;
      }
      metrics_.datagrams_received.fetch_add(1);
      return RelayDiscovery(buffer.data(), static_cast<size_t>(bytes), addr);
    }
    return {WorkerStatus::kStopped, {}};
  }

  // Resolve or create the session for the datagram's source port and
  // re-emit the payload unchanged on the IPTV side.
  WorkerResult RelayDiscovery(const uint8_t* data, size_t length,
                              const sockaddr_in& source) {
    const uint16_t port = ntohs(source.sin_port);
    const std::string peer = AddrToString(source);
    // Our own re-emission, heard back when both segments share a link.
    if (peer == config_.iptv_address) {
      metrics_.datagrams_ignored.fetch_add(1);
      LogDebug("Ignoring multicast from own IPTV address " + Endpoint(peer, port),
               &config_);
      return {WorkerStatus::kCompleted, {}};
    }
    std::shared_ptr<RelaySession> session = registry_.FindByPort(port);
    if (!session) {
      std::string error;
      session = registry_.Create(port, peer, config_, &error);
      if (!session) {
        metrics_.session_create_errors.fetch_add(1);
        Log("Failed to create session for " + Endpoint(peer, port) + ": " + error,
            &config_);
        return {WorkerStatus::kTransientError, error};
      }
      metrics_.sessions_created.fetch_add(1);
      LogDebug("New session for " + Endpoint(peer, port) + ", listening on " +
                   Endpoint(config_.iptv_address, port),
               &config_);
    }

    sockaddr_in target{};
    {
      std::lock_guard<std::mutex> lock(target_mutex_);
      target = forward_target_;
    }
    const ssize_t sent = session->multicast_socket.SendTo(data, length, target);
    if (sent < 0 || static_cast<size_t>(sent) != length) {
      metrics_.forward_errors.fetch_add(1);
      std::ostringstream oss;
      if (sent < 0) {
        oss << "sendto(" << Endpoint(AddrToString(target), ntohs(target.sin_port))
            << ") failed: " << std::strerror(errno);
      } else {
        oss << "partial forward: " << sent << " of " << length << " bytes";
      }
      LogDebug(oss.str(), &config_);
      return {WorkerStatus::kTransientError, oss.str()};
    }
    metrics_.datagrams_forwarded.fetch_add(1);
    LogDebug("Got multicast \"" + DescribeBytes(data, length) + "\" from " +
                 Endpoint(peer, port) + ", forwarding on " + config_.iptv_address,
             &config_);
    return {WorkerStatus::kCompleted, {}};
  }

  // Accept worker: take the device connection, then open the client
  // connection. Both must succeed before the session becomes Accepted.
  WorkerResult AcceptDevice(RelaySession& session) {
    while (!stopping_) {
      const int ready = WaitReadable(session.accept_socket.fd(), kWaitTimeoutMs);
      if (ready < 0) {
        return {WorkerStatus::kTransientError, ErrnoString("poll()")};
      }
      if (ready == 0) {
        continue;
      }
      sockaddr_in device_addr{};
      std::shared_ptr<TcpSocket> device = session.accept_socket.Accept(&device_addr);
      if (!device) {
        if (stopping_) {
          break;
        }
        return {WorkerStatus::kTransientError, session.accept_socket.last_error()};
      }

      auto client = std::make_shared<TcpSocket>();
      if (!client->Connect(session.peer_address, session.source_port)) {
        // Never leave a half-open pairing behind: drop the device side too.
        const std::string error = client->last_error();
        device->Shutdown();
        device->Close();
        metrics_.connect_failures.fetch_add(1);
        Log("Failed to reach client " +
                Endpoint(session.peer_address, session.source_port) + ": " + error,
            &config_);
        return {WorkerStatus::kTransientError, error};
      }

      {
        std::lock_guard<std::mutex> lock(session.mutex);
        if (stopping_ || session.state != SessionState::kListening) {
          device->Shutdown();
          client->Shutdown();
          return {WorkerStatus::kStopped, {}};
        }
        session.device_conn = device;
        session.client_conn = client;
        session.epoch += 1;
        session.state = SessionState::kAccepted;
      }
      session.connections_accepted.fetch_add(1);
      metrics_.connections_accepted.fetch_add(1);
      LogDebug("Accepted TCP connection from IPTV box " +
                   Endpoint(AddrToString(device_addr), ntohs(device_addr.sin_port)) +
                   " for " + Endpoint(session.peer_address, session.source_port),
               &config_);
      return {WorkerStatus::kCompleted, {}};
    }
    return {WorkerStatus::kStopped, {}};
  }

  // Pump worker: relay one direction until EOF or error, then disconnect.
  WorkerResult Pump(RelaySession& session, WorkerRole role) {
    const bool to_client = role == WorkerRole::kForwardToClient;
    std::shared_ptr<TcpSocket> source;
    std::shared_ptr<TcpSocket> destination;
    uint64_t epoch = 0;
    {
      std::lock_guard<std::mutex> lock(session.mutex);
      if (session.state != SessionState::kAccepted) {
        return {WorkerStatus::kCompleted, {}};
      }
      source = to_client ? session.device_conn : session.client_conn;
      destination = to_client ? session.client_conn : session.device_conn;
      epoch = session.epoch;
    }
    std::atomic<uint64_t>& session_bytes =
        to_client ? session.bytes_to_client : session.bytes_to_device;
    std::atomic<uint64_t>& total_bytes =
        to_client ? metrics_.bytes_to_client : metrics_.bytes_to_device;
    const char* target_name = to_client ? "client" : "device";

    std::array<uint8_t, kRelayBufferSize> buffer{};
    for (;;) {
      const ssize_t received = source->Recv(buffer.data(), buffer.size());
      if (received == 0) {
        Disconnect(session, epoch);
        return {stopping_ ? WorkerStatus::kStopped : WorkerStatus::kPeerClosed, {}};
      }
      if (received < 0) {
        const std::string error = ErrnoString("recv()");
        Disconnect(session, epoch);
        if (stopping_) {
          return {WorkerStatus::kStopped, {}};
        }
        return {WorkerStatus::kTransientError, error};
      }
      const size_t length = static_cast<size_t>(received);
      if (!destination->SendAll(buffer.data(), length)) {
        const std::string error = ErrnoString("send()");
        Disconnect(session, epoch);
        if (stopping_) {
          return {WorkerStatus::kStopped, {}};
        }
        return {WorkerStatus::kTransientError, error};
      }
      session_bytes.fetch_add(length);
      total_bytes.fetch_add(length);
      LogDebug("Sent \"" + DescribeBytes(buffer.data(), length) + "\" to " +
                   target_name + " on port " + std::to_string(session.source_port),
               &config_);
    }
  }

  // Close both connections and return to Listening, unless the pairing this
  // pump belonged to has already been torn down.
  void Disconnect(RelaySession& session, uint64_t epoch) {
    std::shared_ptr<TcpSocket> device;
    std::shared_ptr<TcpSocket> client;
    {
      std::lock_guard<std::mutex> lock(session.mutex);
      if (session.state != SessionState::kAccepted || session.epoch != epoch) {
        return;
      }
      device = std::move(session.device_conn);
      client = std::move(session.client_conn);
      session.state = SessionState::kListening;
    }
    if (device) {
      device->Shutdown();
    }
    if (client) {
      client->Shutdown();
    }
    session.disconnects.fetch_add(1);
    metrics_.disconnects.fetch_add(1);
    LogDebug("Client and device disconnected on port " +
                 std::to_string(session.source_port) + ". Listening...",
             &config_);
  }

  Config config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::string start_error_;
  GatewayMetricsAtomic metrics_;

  UdpSocket listener_;
  SessionRegistry registry_;
  WorkerSlot discovery_worker_;

  mutable std::mutex target_mutex_;
  sockaddr_in forward_target_;

  // Serializes RunTick between the scheduler thread and test-driven ticks.
  std::mutex run_mutex_;
  std::mutex tick_mutex_;
  std::condition_variable tick_cv_;
  std::thread scheduler_thread_;
};

Gateway::Gateway(Config config) : impl_(new Impl(std::move(config))) {}

Gateway::~Gateway() { impl_->Stop(); }

bool Gateway::Start() { return impl_->Start(); }
void Gateway::Stop() { impl_->Stop(); }

std::vector<SessionInfo> Gateway::GetSessions() const {
  return impl_->GetSessions();
}

std::string Gateway::GetLastError() const {
  return impl_->GetLastError();
}

GatewayMetrics Gateway::GetMetrics() const {
  return impl_->GetMetrics();
}

#ifdef ZAPPA_TESTING
namespace test {

std::string DescribePayload(const std::vector<uint8_t>& payload) {
  return DescribeBytes(payload.data(), payload.size());
}

bool InjectDiscovery(Gateway& gateway,
                     const std::vector<uint8_t>& payload,
                     const std::string& source_address,
                     uint16_t source_port) {
  const sockaddr_in source = MakeSockaddr(source_address, source_port);
  const WorkerResult result =
      gateway.impl_->RelayDiscovery(payload.data(), payload.size(), source);
  return result.status == WorkerStatus::kCompleted;
}

void SetForwardTarget(Gateway& gateway, const std::string& address,
                      uint16_t port) {
  std::lock_guard<std::mutex> lock(gateway.impl_->target_mutex_);
  gateway.impl_->forward_target_ = MakeSockaddr(address, port);
}

void RunTick(Gateway& gateway) {
  gateway.impl_->RunTick();
}

uint64_t GetSpawnCount(Gateway& gateway, uint16_t source_port,
                       WorkerRole role) {
  if (role == WorkerRole::kDiscovery) {
    return gateway.impl_->discovery_worker_.spawn_count.load();
  }
  auto session = gateway.impl_->registry_.FindByPort(source_port);
  if (!session) {
    return 0;
  }
  return session->SlotFor(role)->spawn_count.load();
}

}  // namespace test
#endif

}  // namespace zappa

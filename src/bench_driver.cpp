#include "bench_driver.hpp"
#include "message.hpp"
#include <iomanip>
#include <sstream>
#include <system_error>

const char* state_name(DriverState s) {
  switch (s) {
    case DriverState::Idle:          return "idle";
    case DriverState::Connecting:    return "connecting";
    case DriverState::Aborted:       return "aborted";
    case DriverState::Connected:     return "connected";
    case DriverState::Running:       return "running";
    case DriverState::Disconnecting: return "disconnecting";
    case DriverState::Reported:      return "reported";
  }
  return "unknown";
}

double RunResult::throughput() const {
  const int64_t us = elapsed_us > 0 ? elapsed_us : 1;
  return static_cast<double>(total_ops) * 1e6 / static_cast<double>(us);
}

int run_worker(IMqttSession& session, int client_index, const BenchOptions& opts, const std::string& message) {
  int attempts = 0, failed = 0;
  for (int i = 0; i < opts.count; ++i) {
    const std::string topic = topic_for(opts.topic_prefix, client_index, i);
    const bool ok = opts.action == Action::Publish
        ? session.publish(topic, opts.qos, message)
        : session.subscribe(topic, opts.qos);
    if (!ok) ++failed;
    ++attempts;
  }
  if (failed > 0)
    log_line("[bench] client " + std::to_string(client_index) + ": " + std::to_string(failed)
             + " of " + std::to_string(attempts) + " operations failed");
  return attempts;
}

bool BenchDriver::connect_all() {
  state_ = DriverState::Connecting;
  sessions_.reserve(static_cast<size_t>(opts_.clients));

  const int64_t t0 = now_us();
  for (int i = 0; i < opts_.clients; ++i) {
    auto s = factory_.connect(opts_.broker, client_id_for(opts_.client_id_prefix, i));
    if (!s) {
      log_line("[bench] client " + std::to_string(i) + " failed to connect, closing "
               + std::to_string(sessions_.size()) + " open sessions");
      state_ = DriverState::Aborted;
      return false;
    }
    sessions_.push_back(std::move(s));
  }
  log_line("[bench] connected " + std::to_string(sessions_.size()) + " clients to "
           + opts_.broker + " in " + std::to_string(ms_since(t0)) + " ms");
  state_ = DriverState::Connected;
  return true;
}

int64_t BenchDriver::timed_run(const std::string& message) {
  state_ = DriverState::Running;
  std::vector<std::thread> workers;
  workers.reserve(sessions_.size());

  const int64_t start_us = now_us();
  for (size_t i = 0; i < sessions_.size(); ++i) {
    IMqttSession& s = *sessions_[i];
    try {
      workers.emplace_back([&s, i, &message, this] {
        run_worker(s, static_cast<int>(i), opts_, message);
      });
    } catch (const std::system_error& e) {
      errno = e.code().value();
      die("cannot start worker thread for client " + std::to_string(i));
    }
  }
  for (auto& t : workers) t.join();
  return now_us() - start_us;
}

void BenchDriver::disconnect_all() {
  for (auto& s : sessions_) s->disconnect();
  sessions_.clear();
}

std::optional<RunResult> BenchDriver::run() {
  if (!connect_all()) {
    disconnect_all();
    return std::nullopt;
  }

  const std::string message =
      opts_.action == Action::Publish ? make_fixed_message(opts_.size) : std::string();

  if (opts_.settle_ms > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(opts_.settle_ms));

  RunResult r;
  r.action = opts_.action;
  r.elapsed_us = timed_run(message);

  state_ = DriverState::Disconnecting;
  disconnect_all();

  r.total_ops = static_cast<int64_t>(opts_.clients) * opts_.count;
  state_ = DriverState::Reported;
  return r;
}

std::string format_result(const BenchOptions& opts, const RunResult& r) {
  std::ostringstream os;
  os << action_name(r.action) << " result : broker=" << opts.broker
     << ", clients=" << opts.clients
     << ", count=" << opts.count
     << ", duration=" << r.duration_ms() << "ms"
     << ", throughput=" << std::fixed << std::setprecision(2) << r.throughput() << "messages/sec";
  return os.str();
}

#pragma once
#include "mqtt_session.hpp"

enum class DriverState { Idle, Connecting, Aborted, Connected, Running, Disconnecting, Reported };

const char* state_name(DriverState s);

struct RunResult {
  Action action = Action::Publish;
  int64_t total_ops = 0;
  int64_t elapsed_us = 0;

  int64_t duration_ms() const { return elapsed_us / 1000; }
  double throughput() const;  // operations per second
};

// Runs opts.count operations on one session, sequentially. Returns attempts made.
int run_worker(IMqttSession& session, int client_index, const BenchOptions& opts, const std::string& message);

class BenchDriver {
public:
  BenchDriver(const BenchOptions& opts, ISessionFactory& factory): opts_(opts), factory_(factory) {}

  // nullopt when the connect phase aborted; every opened session is closed either way.
  std::optional<RunResult> run();

  DriverState state() const { return state_; }

private:
  const BenchOptions& opts_;
  ISessionFactory& factory_;
  DriverState state_ = DriverState::Idle;
  std::vector<std::unique_ptr<IMqttSession>> sessions_;

  bool connect_all();
  int64_t timed_run(const std::string& message);
  void disconnect_all();
};

std::string format_result(const BenchOptions& opts, const RunResult& r);

#pragma once
#include "common.hpp"
#include <optional>

enum class Action { Publish, Subscribe };

enum class Qos : int { AtMostOnce = 0, AtLeastOnce = 1, ExactlyOnce = 2 };

inline const char* const kBrokerPlaceholder = "tcp://{host}:{port}";
inline const char* const kActionPlaceholder = "p/pub/publish or s/sub/subscribe";

struct BenchOptions {
  std::string broker = kBrokerPlaceholder;
  Action action = Action::Publish;
  int clients = 10;
  int count = 100;
  int size = 1024;
  Qos qos = Qos::AtMostOnce;
  int settle_ms = 3000;  // pause between connect phase and timer start
  std::string client_id_prefix = "mqtt-benchmark";
  std::string topic_prefix = "/mqtt-bench/benchmark";
};

// Bad or missing input. flag() names the offending option ("" when none applies).
class ConfigError : public std::runtime_error {
public:
  ConfigError(std::string flag, std::string value)
    : std::runtime_error("Invalid argument : -" + flag + " -> " + value),
      flag_(std::move(flag)), value_(std::move(value)) {}
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}

  const std::string& flag() const { return flag_; }
  const std::string& value() const { return value_; }

private:
  std::string flag_;
  std::string value_;
};

// p/pub/publish or s/sub/subscribe; anything else is nullopt.
std::optional<Action> parse_action(const std::string& s);
const char* action_name(Action a);

// Loads any subset of the option keys from a JSON file on top of `base`.
BenchOptions load_options_file(const std::string& path, BenchOptions base = {});

// Result of reading the command line. help == true means only usage was asked for.
struct CliRequest {
  bool help = false;
  BenchOptions opts;
};

// Parses argv into validated options. Throws ConfigError.
CliRequest parse_args(int argc, const char* const* argv);

std::string usage_text(const std::string& prog);

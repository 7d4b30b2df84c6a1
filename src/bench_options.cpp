#include "bench_options.hpp"
#include <fstream>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <sstream>

using json = nlohmann::json;

namespace {

const char* const kFlagNames[] = {
  "broker", "action", "clients", "count", "size", "qos", "settle_ms", "config",
};

bool is_known_flag(const std::string& name) {
  for (const char* f : kFlagNames)
    if (name == f) return true;
  return false;
}

int parse_int(const std::string& flag, const std::string& text) {
  size_t pos = 0;
  int v = 0;
  try {
    v = std::stoi(text, &pos);
  } catch (const std::exception&) {
    throw ConfigError(flag, text);
  }
  if (pos != text.size()) throw ConfigError(flag, text);
  return v;
}

// Integer key from the config file; anything that is not a whole number within int range is rejected.
int read_int(const json& j, const char* key, int fallback) {
  auto it = j.find(key);
  if (it == j.end()) return fallback;
  if (!it->is_number_integer()) throw ConfigError(key, it->dump());
  if (it->is_number_unsigned()) {
    const uint64_t u = it->get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) throw ConfigError(key, it->dump());
    return static_cast<int>(u);
  }
  const int64_t v = it->get<int64_t>();
  if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
    throw ConfigError(key, it->dump());
  return static_cast<int>(v);
}

// Reads the file into `opts`; action_text receives the raw "action" value if present.
void read_config_file(const std::string& path, BenchOptions& opts, std::optional<std::string>& action_text) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file " + path);

  try {
    json j; in >> j;
    if (!j.is_object()) throw ConfigError("config file " + path + " is not a JSON object");

    opts.broker    = j.value("broker", opts.broker);
    opts.clients   = read_int(j, "clients", opts.clients);
    opts.count     = read_int(j, "count", opts.count);
    opts.size      = read_int(j, "size", opts.size);
    opts.qos       = static_cast<Qos>(read_int(j, "qos", static_cast<int>(opts.qos)));
    opts.settle_ms = read_int(j, "settle_ms", opts.settle_ms);
    opts.client_id_prefix = j.value("client_id_prefix", opts.client_id_prefix);
    opts.topic_prefix     = j.value("topic_prefix", opts.topic_prefix);
    if (j.contains("action")) action_text = j.at("action").get<std::string>();
  } catch (const json::exception& e) {
    throw ConfigError("bad config file " + path + ": " + e.what());
  }
}

void check_numeric(const BenchOptions& o) {
  if (o.clients <= 0) throw ConfigError("clients", std::to_string(o.clients));
  if (o.count <= 0) throw ConfigError("count", std::to_string(o.count));
  if (o.size < 0) throw ConfigError("size", std::to_string(o.size));
  const int q = static_cast<int>(o.qos);
  if (q < 0 || q > 2) throw ConfigError("qos", std::to_string(q));
  if (o.settle_ms < 0) throw ConfigError("settle_ms", std::to_string(o.settle_ms));
}

}  // namespace

std::optional<Action> parse_action(const std::string& s) {
  if (s == "p" || s == "pub" || s == "publish") return Action::Publish;
  if (s == "s" || s == "sub" || s == "subscribe") return Action::Subscribe;
  return std::nullopt;
}

const char* action_name(Action a) {
  return a == Action::Publish ? "Publish" : "Subscribe";
}

BenchOptions load_options_file(const std::string& path, BenchOptions base) {
  std::optional<std::string> action_text;
  read_config_file(path, base, action_text);
  if (action_text) {
    auto a = parse_action(*action_text);
    if (!a) throw ConfigError("action", *action_text);
    base.action = *a;
  }
  return base;
}

CliRequest parse_args(int argc, const char* const* argv) {
  CliRequest req;
  if (argc <= 1) {
    req.help = true;
    return req;
  }

  std::map<std::string, std::string> flags;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.size() < 2 || a[0] != '-') throw ConfigError("unexpected argument: " + a);
    a.erase(0, a[1] == '-' ? 2 : 1);

    if (a == "h" || a == "help") {
      req.help = true;
      return req;
    }

    auto eq = a.find('=');
    std::string name = a.substr(0, eq);
    if (!is_known_flag(name)) throw ConfigError("flag provided but not defined: -" + name);
    if (eq != std::string::npos) {
      flags[name] = a.substr(eq + 1);
    } else {
      if (i + 1 >= argc) throw ConfigError("flag needs an argument: -" + name);
      flags[name] = argv[++i];
    }
  }

  BenchOptions& o = req.opts;
  std::string action_text = kActionPlaceholder;
  if (auto it = flags.find("config"); it != flags.end()) {
    std::optional<std::string> file_action;
    read_config_file(it->second, o, file_action);
    if (file_action) action_text = *file_action;
  }

  if (auto it = flags.find("broker"); it != flags.end()) o.broker = it->second;
  if (o.broker.empty() || o.broker == kBrokerPlaceholder) throw ConfigError("broker", o.broker);

  if (auto it = flags.find("action"); it != flags.end()) action_text = it->second;
  auto action = parse_action(action_text);
  if (!action) throw ConfigError("action", action_text);
  o.action = *action;

  if (auto it = flags.find("clients"); it != flags.end()) o.clients = parse_int("clients", it->second);
  if (auto it = flags.find("count"); it != flags.end()) o.count = parse_int("count", it->second);
  if (auto it = flags.find("size"); it != flags.end()) o.size = parse_int("size", it->second);
  if (auto it = flags.find("qos"); it != flags.end()) o.qos = static_cast<Qos>(parse_int("qos", it->second));
  if (auto it = flags.find("settle_ms"); it != flags.end()) o.settle_ms = parse_int("settle_ms", it->second);
  check_numeric(o);

  return req;
}

std::string usage_text(const std::string& prog) {
  std::ostringstream os;
  os << "Usage of " << prog << ":\n"
     << "  -action string\n"
     << "    \tPublish or Subscribe (required) (default \"" << kActionPlaceholder << "\")\n"
     << "  -broker string\n"
     << "    \tURI of MQTT broker (required) (default \"" << kBrokerPlaceholder << "\")\n"
     << "  -clients int\n"
     << "    \tNumber of clients (default 10)\n"
     << "  -config string\n"
     << "    \tJSON file with default option values\n"
     << "  -count int\n"
     << "    \tNumber of loops (default 100)\n"
     << "  -qos int\n"
     << "    \tMQTT QoS(0/1/2) (default 0)\n"
     << "  -settle_ms int\n"
     << "    \tWait after connecting before the timed run (default 3000)\n"
     << "  -size int\n"
     << "    \tMessage size per publish (byte) (default 1024)\n";
  return os.str();
}

#pragma once
#include "mqtt_session.hpp"
#include <atomic>
#include <mutex>
#include <set>

// In-memory stand-in for a broker connection. Counters are shared with the factory.
struct FakeCounters {
  std::atomic<int> connects{0};
  std::atomic<int> publishes{0};
  std::atomic<int> subscribes{0};
  std::atomic<int> disconnects{0};
  std::mutex mtx;
  std::multiset<std::string> topics;
  std::set<std::string> client_ids;
};

class FakeSession : public IMqttSession {
public:
  FakeSession(FakeCounters& c, std::string id, int fail_every)
    : c_(c), id_(std::move(id)), fail_every_(fail_every) {}

  bool publish(const std::string& topic, Qos, const std::string&) override {
    c_.publishes++;
    record(topic);
    return !should_fail();
  }
  bool subscribe(const std::string& topic, Qos) override {
    c_.subscribes++;
    record(topic);
    return !should_fail();
  }
  void disconnect() noexcept override {
    if (!closed_) { closed_ = true; c_.disconnects++; }
  }
  const std::string& client_id() const override { return id_; }

private:
  FakeCounters& c_;
  std::string id_;
  int fail_every_;
  int ops_ = 0;
  bool closed_ = false;

  bool should_fail() { ++ops_; return fail_every_ > 0 && ops_ % fail_every_ == 0; }
  void record(const std::string& topic) {
    std::lock_guard<std::mutex> lk(c_.mtx);
    c_.topics.insert(topic);
  }
};

class FakeFactory : public ISessionFactory {
public:
  int fail_connect_at = -1;  // connect attempt index that returns nullptr
  int fail_every = 0;        // every n-th operation on a session reports failure
  FakeCounters counters;

  std::unique_ptr<IMqttSession> connect(const std::string&, const std::string& client_id) override {
    int idx = counters.connects++;
    if (idx == fail_connect_at) return nullptr;
    counters.client_ids.insert(client_id);
    return std::make_unique<FakeSession>(counters, client_id, fail_every);
  }
};

#pragma once
#include "bench_options.hpp"
#include <memory>

namespace mqtt { class async_client; }

// One connected MQTT session. Operation failures are logged and reported as false.
class IMqttSession {
public:
  virtual ~IMqttSession() = default;
  virtual bool publish(const std::string& topic, Qos qos, const std::string& payload) = 0;
  virtual bool subscribe(const std::string& topic, Qos qos) = 0;
  // Best-effort force close; never throws.
  virtual void disconnect() noexcept = 0;
  virtual const std::string& client_id() const = 0;
};

class ISessionFactory {
public:
  virtual ~ISessionFactory() = default;
  // nullptr when the connection could not be established (already logged).
  virtual std::unique_ptr<IMqttSession> connect(const std::string& broker, const std::string& client_id) = 0;
};

class PahoSession : public IMqttSession {
public:
  PahoSession(std::unique_ptr<mqtt::async_client> cli, std::string client_id);
  ~PahoSession() override;

  bool publish(const std::string& topic, Qos qos, const std::string& payload) override;
  bool subscribe(const std::string& topic, Qos qos) override;
  void disconnect() noexcept override;
  const std::string& client_id() const override { return client_id_; }

private:
  std::unique_ptr<mqtt::async_client> cli_;
  std::string client_id_;
  bool closed_ = false;
};

class PahoSessionFactory : public ISessionFactory {
public:
  std::unique_ptr<IMqttSession> connect(const std::string& broker, const std::string& client_id) override;
};

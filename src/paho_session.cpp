#include "mqtt_session.hpp"
#include <mqtt/async_client.h>

PahoSession::PahoSession(std::unique_ptr<mqtt::async_client> cli, std::string client_id)
  : cli_(std::move(cli)), client_id_(std::move(client_id)) {}

PahoSession::~PahoSession() {
  disconnect();
}

bool PahoSession::publish(const std::string& topic, Qos qos, const std::string& payload) {
  try {
    cli_->publish(topic, payload.data(), payload.size(), static_cast<int>(qos), false)->wait();
    return true;
  } catch (const mqtt::exception& e) {
    log_line(std::string("Publish error: ") + e.what());
    return false;
  }
}

bool PahoSession::subscribe(const std::string& topic, Qos qos) {
  try {
    cli_->subscribe(topic, static_cast<int>(qos))->wait();
    return true;
  } catch (const mqtt::exception& e) {
    log_line(std::string("Subscribe error: ") + e.what());
    return false;
  }
}

void PahoSession::disconnect() noexcept {
  if (closed_) return;
  closed_ = true;
  try {
    // zero timeout: drop the session without waiting for in-flight work
    cli_->disconnect(0)->wait();
  } catch (const std::exception&) {
    // close-time errors are ignored
  }
}

std::unique_ptr<IMqttSession> PahoSessionFactory::connect(const std::string& broker, const std::string& client_id) {
  try {
    auto cli = std::make_unique<mqtt::async_client>(broker, client_id);
    auto opts = mqtt::connect_options_builder()
                  .clean_session()
                  .automatic_reconnect(false)
                  .finalize();
    cli->connect(opts)->wait();
    return std::make_unique<PahoSession>(std::move(cli), client_id);
  } catch (const mqtt::exception& e) {
    log_line(std::string("Connected error: ") + e.what());
    return nullptr;
  }
}

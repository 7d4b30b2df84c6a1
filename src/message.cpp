#include "message.hpp"

std::string make_fixed_message(int size) {
  std::string msg;
  if (size <= 0) return msg;
  msg.reserve(static_cast<size_t>(size));
  for (int i = 0; i < size; ++i) msg.push_back(static_cast<char>('0' + i % 10));
  return msg;
}

std::string client_id_for(const std::string& prefix, int index) {
  return prefix + std::to_string(index);
}

std::string topic_for(const std::string& prefix, int client, int iteration) {
  return prefix + "/" + std::to_string(client) + "/" + std::to_string(iteration);
}

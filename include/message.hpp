#pragma once
#include <string>

// `size` characters cycling "0123456789" from index 0; size <= 0 gives "".
std::string make_fixed_message(int size);

std::string client_id_for(const std::string& prefix, int index);

// prefix/<client>/<iteration>, indices in decimal so every pair maps to its own topic.
std::string topic_for(const std::string& prefix, int client, int iteration);

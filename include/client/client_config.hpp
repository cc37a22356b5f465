#ifndef AUTONOMI_CLIENT_CONFIG_HPP
#define AUTONOMI_CLIENT_CONFIG_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include "data/data_config.hpp"

namespace autonomi {
namespace client {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct ClientConfig {
  data::SelfEncryptionConfig self_encryption;
  data::RetryConfig retry;
  std::size_t worker_threads = 4;
  // Empty log_file logs to the console
  std::string log_file;
  std::string log_level = "info";

  // Throws ConfigError naming the first offending setting
  void validate() const;
};

// Reads a YAML file; keys that are absent keep their defaults.
//
//   self_encryption: { max_chunk_size, min_chunk_size, max_data_map_depth }
//   retry: { max_retries, initial_backoff_ms, backoff_multiplier }
//   worker_threads, log_file, log_level
ClientConfig load_config(const std::string& path);

// File sink when log_file is set, console otherwise
void init_logging(const ClientConfig& config);

} // namespace client
} // namespace autonomi

#endif // AUTONOMI_CLIENT_CONFIG_HPP

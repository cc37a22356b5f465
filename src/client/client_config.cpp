#include "client/client_config.hpp"
#include "utils/logger.hpp"
#include <boost/log/trivial.hpp>
#include <yaml-cpp/yaml.h>

namespace autonomi {
namespace client {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& target) {
  const YAML::Node value = node[key];
  if (value) {
    target = value.as<T>();
  }
}

} // namespace

void ClientConfig::validate() const {
  if (self_encryption.max_chunk_size < data::kMinMaxChunkSize) {
    throw ConfigError("self_encryption.max_chunk_size must be at least " + std::to_string(data::kMinMaxChunkSize));
  }
  if (self_encryption.min_chunk_size < 1 || self_encryption.min_chunk_size > self_encryption.max_chunk_size / 2) {
    throw ConfigError("self_encryption.min_chunk_size must be between 1 and half of max_chunk_size");
  }
  if (self_encryption.max_data_map_depth < 1) {
    throw ConfigError("self_encryption.max_data_map_depth must be at least 1");
  }
  if (retry.backoff_multiplier < 1) {
    throw ConfigError("retry.backoff_multiplier must be at least 1");
  }
  if (worker_threads < 1) {
    throw ConfigError("worker_threads must be at least 1");
  }
  try {
    utils::logging::parse_severity(log_level);
  }
  catch (const std::invalid_argument& e) {
    throw ConfigError(std::string("log_level: ") + e.what());
  }
}

ClientConfig load_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading client configuration from " << path;

  ClientConfig config;
  try {
    const YAML::Node root = YAML::LoadFile(path);

    if (const YAML::Node section = root["self_encryption"]) {
      read_value(section, "max_chunk_size", config.self_encryption.max_chunk_size);
      read_value(section, "min_chunk_size", config.self_encryption.min_chunk_size);
      read_value(section, "max_data_map_depth", config.self_encryption.max_data_map_depth);
    }
    if (const YAML::Node section = root["retry"]) {
      read_value(section, "max_retries", config.retry.max_retries);
      read_value(section, "initial_backoff_ms", config.retry.initial_backoff_ms);
      read_value(section, "backoff_multiplier", config.retry.backoff_multiplier);
    }
    read_value(root, "worker_threads", config.worker_threads);
    read_value(root, "log_file", config.log_file);
    read_value(root, "log_level", config.log_level);
  }
  catch (const YAML::Exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to read " << path << ": " << e.what();
    throw ConfigError("Failed to read " + path + ": " + e.what());
  }

  config.validate();
  return config;
}

void init_logging(const ClientConfig& config) {
  const auto level = utils::logging::parse_severity(config.log_level);
  if (config.log_file.empty()) {
    utils::logging::init_console_logging(level);
  }
  else {
    utils::logging::init_logging(config.log_file, level);
  }
}

} // namespace client
} // namespace autonomi

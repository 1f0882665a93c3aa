#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <random>

#include "../control/config.hpp"

namespace tokengate::logging {

static thread_local quill::Logger* g_current_logger = nullptr;

void init_logging_system() {
  quill::Backend::start();
}

std::optional<quill::LogLevel> parse_log_level(std::string_view level) {
  std::string lower(level);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") return quill::LogLevel::Debug;
  if (lower == "info") return quill::LogLevel::Info;
  if (lower == "warning" || lower == "warn") return quill::LogLevel::Warning;
  if (lower == "error") return quill::LogLevel::Error;
  return std::nullopt;
}

quill::Logger* init_worker_logger(int worker_id, const control::LogConfig& log_config) {
  std::filesystem::create_directories(log_config.output);

  quill::RotatingFileSinkConfig sink_config;
  sink_config.set_rotation_max_file_size(
      static_cast<size_t>(log_config.rotation.max_size_mb) * 1'000'000);
  sink_config.set_max_backup_files(log_config.rotation.max_files);
  sink_config.set_open_mode('a');

  std::string log_path = fmt::format("{}/tokengate_{}.log", log_config.output, worker_id);
  std::string logger_name = fmt::format("tokengate_{}", worker_id);

  quill::Logger* logger = nullptr;
  if (log_config.format == "json") {
    logger = quill::Frontend::create_or_get_logger(
        logger_name,
        quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, sink_config));
  } else {
    logger = quill::Frontend::create_or_get_logger(
        logger_name,
        quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, sink_config));
  }

  // Unknown names were already reported as a config warning
  logger->set_log_level(parse_log_level(log_config.level).value_or(quill::LogLevel::Info));

  g_current_logger = logger;
  return logger;
}

void shutdown_logging() {
  g_current_logger = nullptr;
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger;
}

// Base UUID v4, once per thread; correlation only, never a credential
static std::string generate_base_uuid() {
  std::mt19937 rng(std::random_device{}() ^
                   static_cast<uint32_t>(
                       std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 4) {
    uint32_t value = dist(rng);
    for (size_t b = 0; b < 4; ++b) {
      bytes[i + b] = static_cast<uint8_t>((value >> (8 * b)) & 0xFF);
    }
  }

  bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
  bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant

  return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                     "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                     bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                     bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                     bytes[14], bytes[15]);
}

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
  size_t hash_pos = id.rfind('#');
  if (hash_pos == std::string_view::npos || hash_pos != 36) {
    return false;
  }

  std::string_view uuid = id.substr(0, hash_pos);
  std::string_view counter = id.substr(hash_pos + 1);

  if (counter.empty() || counter.size() > 20 ||
      !std::all_of(counter.begin(), counter.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    return false;
  }

  for (size_t i = 0; i < uuid.size(); ++i) {
    auto c = static_cast<unsigned char>(uuid[i]);
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-') return false;
    } else if (!std::isxdigit(c)) {
      return false;
    }
  }

  // Version 4, RFC 4122 variant
  char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(uuid[19])));
  return uuid[14] == '4' &&
         (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

}  // namespace tokengate::logging

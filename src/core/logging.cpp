#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <random>

#include "../control/config.hpp"

namespace httpgate::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

static quill::LogLevel parse_level(std::string_view level) {
  std::string level_lower{level};
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (level_lower == "debug") {
    return quill::LogLevel::Debug;
  } else if (level_lower == "warning" || level_lower == "warn") {
    return quill::LogLevel::Warning;
  } else if (level_lower == "error") {
    return quill::LogLevel::Error;
  }
  return quill::LogLevel::Info;
}

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
  quill::Logger* logger = nullptr;

  if (log_config.output.empty() || log_config.output == "stdout") {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("httpgate_console");
    logger = quill::Frontend::create_or_get_logger("httpgate", std::move(console_sink));
  } else {
    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000ull);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/httpgate.log", log_config.output);

    if (log_config.format == "json") {
      auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("httpgate", std::move(json_sink));
    } else {
      auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
          log_path, config);
      logger = quill::Frontend::create_or_get_logger("httpgate", std::move(file_sink));
    }
  }

  logger->set_log_level(parse_level(log_config.level));

  g_logger.store(logger, std::memory_order_release);
  return logger;
}

void set_log_level(std::string_view level) {
  if (auto* logger = get_logger()) {
    logger->set_log_level(parse_level(level));
  }
}

void shutdown_logging() {
  if (auto* logger = g_logger.exchange(nullptr, std::memory_order_acq_rel)) {
    logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_logger() {
  return g_logger.load(std::memory_order_acquire);
}

// Generate base UUID v4 (called once per thread)
static std::string generate_base_uuid() {
  // XOR combines hardware randomness with timestamp for thread-unique seed
  std::mt19937 rng(std::random_device{}() ^
                   static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::uniform_int_distribution<uint32_t> dist;

  std::array<uint8_t, 16> uuid_bytes{};
  for (size_t i = 0; i < 16; i += 4) {
    uint32_t random_val = dist(rng);
    uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
    uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
    uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
    uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
  }

  // Version 4, RFC4122 variant
  uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
  uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    fmt::format_to(std::back_inserter(out), "{:02x}", uuid_bytes[i]);
  }
  return out;
}

std::string generate_correlation_id() {
  static thread_local std::string base_uuid = generate_base_uuid();
  static thread_local uint64_t counter = 0;

  return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
  // Example: 550e8400-e29b-41d4-a716-446655440000#42
  size_t hash_pos = id.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;
  }

  std::string_view uuid_part = id.substr(0, hash_pos);
  std::string_view counter_part = id.substr(hash_pos + 1);

  if (uuid_part.length() != 36) {
    return false;
  }

  if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
      uuid_part[23] != '-') {
    return false;
  }

  if (uuid_part[14] != '4') {
    return false;
  }

  char variant = uuid_part[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b') {
    return false;
  }

  for (size_t i = 0; i < 36; ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23)
      continue;
    if (!std::isxdigit(static_cast<unsigned char>(uuid_part[i]))) return false;
  }

  if (counter_part.empty()) {
    return false;
  }

  return std::all_of(counter_part.begin(), counter_part.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace httpgate::logging

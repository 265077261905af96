#pragma once

#include <algorithm>
#include <boost/json.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "conf/logging_config.hpp"
#include "data/connection.hpp"
#include "transport/http_transport.hpp"

namespace devportal {
namespace fs = std::filesystem;

inline constexpr const char *kPasswordEnvVar = "DEVPORTAL_PASSWORD";

struct DevPortalConfig {
  std::string device_url{"http://127.0.0.1:8080"};
  std::string username{};
  std::string password{};
  std::string token{};
  bool verify_tls{true};
  int request_timeout_seconds{30};
  LoggingConfig logging{};

  data::Connection to_connection() const {
    return data::Connection::from_url(device_url);
  }

  data::Credentials to_credentials() const {
    data::Credentials c;
    c.username = username;
    c.password = password;
    c.token = token;
    return c;
  }

  transport::HttpTransportOptions transport_options() const {
    transport::HttpTransportOptions opts;
    opts.verify_tls = verify_tls;
    opts.request_timeout =
        std::chrono::seconds(std::max(1, request_timeout_seconds));
    return opts;
  }

  friend DevPortalConfig
  tag_invoke(const boost::json::value_to_tag<DevPortalConfig> &,
             const boost::json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("DevPortalConfig is not an object");
    }
    DevPortalConfig cfg{};
    if (auto *p = jo_p->if_contains("device_url"); p && p->is_string()) {
      cfg.device_url = std::string(p->as_string().c_str());
    } else {
      std::cerr << "device_url not found, using default " << cfg.device_url
                << std::endl;
    }
    if (auto *p = jo_p->if_contains("username"); p && p->is_string()) {
      cfg.username = std::string(p->as_string().c_str());
    }
    if (auto *p = jo_p->if_contains("password"); p && p->is_string()) {
      cfg.password = std::string(p->as_string().c_str());
    }
    if (auto *p = jo_p->if_contains("token"); p && p->is_string()) {
      cfg.token = std::string(p->as_string().c_str());
    }
    if (auto *p = jo_p->if_contains("verify_tls")) {
      cfg.verify_tls = p->as_bool();
    }
    if (auto *p = jo_p->if_contains("request_timeout_seconds")) {
      cfg.request_timeout_seconds = p->to_number<int>();
    }
    if (auto *p = jo_p->if_contains("logging")) {
      cfg.logging = boost::json::value_to<LoggingConfig>(*p);
    }
    if (const char *env = std::getenv(kPasswordEnvVar); env && *env) {
      cfg.password = env;
    }
    return cfg;
  }
};

class IDevPortalConfigProvider {
public:
  virtual ~IDevPortalConfigProvider() = default;

  virtual const DevPortalConfig &get() const = 0;
  virtual DevPortalConfig &get() = 0;
};

class DevPortalConfigProviderFile : public IDevPortalConfigProvider {
private:
  DevPortalConfig config_;

public:
  explicit DevPortalConfigProviderFile(const fs::path &config_file) {
    std::ifstream ifs(config_file);
    if (!ifs) {
      throw std::runtime_error("Unable to open configuration file: " +
                               config_file.string());
    }
    std::string content((std::istreambuf_iterator<char>(ifs)),
                        std::istreambuf_iterator<char>());
    boost::system::error_code ec;
    auto jv = boost::json::parse(content, ec);
    if (ec) {
      throw std::runtime_error("Configuration file is not valid JSON: " +
                               config_file.string() + ": " + ec.message());
    }
    config_ = boost::json::value_to<DevPortalConfig>(jv);
  }

  const DevPortalConfig &get() const override { return config_; }
  DevPortalConfig &get() override { return config_; }
};

} // namespace devportal

#pragma once

#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace devportal {

class DeviceApiError : public std::runtime_error {
public:
  DeviceApiError(int code, const std::string &what, int http_status = 0)
      : std::runtime_error(what), code_(code), http_status_(http_status) {}

  int code() const noexcept { return code_; }

  // Zero unless code() is NETWORK::HTTP_STATUS_ERROR.
  int http_status() const noexcept { return http_status_; }

  bool is_invalid_argument() const noexcept {
    return code_ == my_errors::GENERAL::INVALID_ARGUMENT;
  }
  bool is_precondition_failed() const noexcept {
    return code_ == my_errors::GENERAL::PRECONDITION_FAILED;
  }

private:
  int code_;
  int http_status_;
};

} // namespace devportal

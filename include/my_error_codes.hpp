#pragma once

namespace my_errors {

namespace GENERAL {  // General errors

constexpr int INVALID_ARGUMENT = 5000;  // Invalid argument
constexpr int POINTER_IS_NULL = 5011;  // Pointer is null
constexpr int PRECONDITION_FAILED = 5023;  // Precondition failed
}  // namespace GENERAL

namespace NETWORK {  // Network errors

constexpr int CONNECT_ERROR = 5200;  // Connect error
constexpr int READ_ERROR = 5201;  // Read error
constexpr int WRITE_ERROR = 5202;  // Write error
constexpr int TIMEOUT_ERROR = 5203;  // Timeout error
constexpr int SSL_ERROR = 5204;  // SSL error
constexpr int SSL_HANDSHAKE_ERROR = 5205;  // SSL handshake error
constexpr int HTTP_STATUS_ERROR = 5206;  // Non-success HTTP status
}  // namespace NETWORK

}  // namespace my_errors

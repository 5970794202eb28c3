#pragma once

#include <stdexcept>
#include <string>
#include "exception_code.hpp"

namespace kducer {

/**
 * @brief Base class of every error raised by the library
 */
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Link-level failure: refused or reset connection, peer close, I/O timeout
 *
 * The device session answers these by reconnecting; they are never terminal for a command.
 */
class TransportError : public Error {
 public:
  using Error::Error;
};

/**
 * @brief The TCP connection was not established within the connect timeout
 */
class ConnectTimeout : public TransportError {
 public:
  using TransportError::TransportError;
};

/**
 * @brief Malformed or unmatched response (header echo, declared length, function code)
 */
class ProtocolError : public Error {
 public:
  using Error::Error;
};

/**
 * @brief The device answered with a Modbus exception response
 */
class DeviceException : public Error {
 public:
  DeviceException(ExceptionCode code, const std::string &what)
      : Error(what),
        code_(code) {}

  [[nodiscard]] ExceptionCode GetCode() const noexcept { return code_; }

 private:
  ExceptionCode code_;
};

/**
 * @brief Exception code 6: the device received the request but cannot act on it right now
 */
class DeviceBusy : public DeviceException {
 public:
  explicit DeviceBusy(const std::string &what)
      : DeviceException(ExceptionCode::kServerDeviceBusy, what) {}
};

/**
 * @brief A caller's or the session's cancellation signal fired
 */
class Cancelled : public Error {
 public:
  using Error::Error;
};

/**
 * @brief Argument rejected before any exchange with the device
 */
class InvalidArgument : public Error {
 public:
  using Error::Error;
};

}  // namespace kducer

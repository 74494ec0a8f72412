// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <utility>

namespace nodeguard {
namespace util {

/**
 * Status - outcome of an operation that can fail
 *
 * Codes:
 * - VALIDATION: malformed input (bad address, empty request)
 * - NOT_FOUND:  referenced object is absent; always propagated as-is
 * - CONFLICT:   optimistic-concurrency mismatch; caller retries with a fresh read
 * - TRANSIENT:  timeout / cancellation / backend unavailable; caller retries with backoff
 *
 * A negative trust decision is not a Status error.
 */
class Status {
public:
  enum class Code {
    OK,
    VALIDATION,
    NOT_FOUND,
    CONFLICT,
    TRANSIENT
  };

  Status() : code_(Code::OK) {}

  static Status Ok() { return Status(); }
  static Status Validation(const std::string &message) {
    return Status(Code::VALIDATION, message);
  }
  static Status NotFound(const std::string &message) {
    return Status(Code::NOT_FOUND, message);
  }
  static Status Conflict(const std::string &message) {
    return Status(Code::CONFLICT, message);
  }
  static Status Transient(const std::string &message) {
    return Status(Code::TRANSIENT, message);
  }

  bool IsOk() const { return code_ == Code::OK; }
  bool IsValidation() const { return code_ == Code::VALIDATION; }
  bool IsNotFound() const { return code_ == Code::NOT_FOUND; }
  bool IsConflict() const { return code_ == Code::CONFLICT; }
  bool IsTransient() const { return code_ == Code::TRANSIENT; }

  // Worth retrying with a fresh read
  bool IsRetryable() const { return IsConflict() || IsTransient(); }

  Code code() const { return code_; }
  const std::string &message() const { return message_; }

  // Same code, message becomes "<prefix>: <message>"
  Status Wrap(const std::string &prefix) const {
    if (IsOk()) {
      return *this;
    }
    return Status(code_, prefix + ": " + message_);
  }

  std::string ToString() const {
    if (IsOk()) {
      return "OK";
    }
    return std::string(CodeName(code_)) + ": " + message_;
  }

  static const char *CodeName(Code code) {
    switch (code) {
    case Code::OK:
      return "OK";
    case Code::VALIDATION:
      return "VALIDATION";
    case Code::NOT_FOUND:
      return "NOT_FOUND";
    case Code::CONFLICT:
      return "CONFLICT";
    case Code::TRANSIENT:
      return "TRANSIENT";
    }
    return "UNKNOWN";
  }

private:
  Status(Code code, std::string message)
      : code_(code), message_(std::move(message)) {}

  Code code_;
  std::string message_;
};

} // namespace util
} // namespace nodeguard

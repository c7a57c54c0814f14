// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace fedmint::util {

// Outcome of a storage call. Anything but OK carries a message.
class Status {
 public:
  enum class Code { OK, NotFound, InvalidArgument, GeneralError };

  static Status OK() { return Status(Code::OK, ""); }
  static Status NotFound(const std::string& msg) { return Status(Code::NotFound, msg); }
  static Status InvalidArgument(const std::string& msg) { return Status(Code::InvalidArgument, msg); }
  static Status GeneralError(const std::string& msg) { return Status(Code::GeneralError, msg); }

  Code code() const { return code_; }
  const std::string& message() const { return message_; }

  bool isOK() const { return code_ == Code::OK; }
  bool isNotFound() const { return code_ == Code::NotFound; }
  bool isInvalidArgument() const { return code_ == Code::InvalidArgument; }
  bool isGeneralError() const { return code_ == Code::GeneralError; }

  std::string toString() const {
    switch (code_) {
      case Code::OK:
        return "OK";
      case Code::NotFound:
        return "Not Found: " + message_;
      case Code::InvalidArgument:
        return "Invalid Argument: " + message_;
      case Code::GeneralError:
        return "General Error: " + message_;
    }
    return "Unknown: " + message_;
  }

  // Statuses compare by code only.
  bool operator==(const Status& other) const { return code_ == other.code_; }
  bool operator!=(const Status& other) const { return code_ != other.code_; }

 private:
  Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

  Code code_;
  std::string message_;
};

inline std::ostream& operator<<(std::ostream& os, const Status& status) { return os << status.toString(); }

}  // namespace fedmint::util

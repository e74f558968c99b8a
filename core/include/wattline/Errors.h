#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace wattline {

// Base error for the engine. Catch this to handle any analysis failure.
class WattlineError : public std::runtime_error {
  public:
    explicit WattlineError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Non-positive FTP, empty steps or stream, bad samples, bad configuration.
class InvalidInputError : public WattlineError {
  public:
    explicit InvalidInputError(std::string msg) : WattlineError(std::move(msg)) {}
};

// A planned step fails structural validation.
class MalformedPlanError : public WattlineError {
  public:
    explicit MalformedPlanError(std::string msg) : WattlineError(std::move(msg)) {}
};

// Too few samples to align or summarize.
class InsufficientDataError : public WattlineError {
  public:
    explicit InsufficientDataError(std::string msg) : WattlineError(std::move(msg)) {}
};

// Actual stream exceeds the configured safety bound.
class StreamTooLargeError : public WattlineError {
  public:
    explicit StreamTooLargeError(std::string msg) : WattlineError(std::move(msg)) {}
};

// SQLite failures in ComplianceStore.
class StorageError : public WattlineError {
  public:
    explicit StorageError(std::string msg) : WattlineError(std::move(msg)) {}
};

}  // namespace wattline

#pragma once
#include "types.hpp"

#include <string>
#include <utility>
#include <variant>

namespace tbot
{
// Every failure the engine can report. Stage-local codes (stale data, rejected signals) are
// absorbed by the pipeline after logging; the others end the affected strategy or session.
enum class ErrorCode : u8
{
  Ok = 0,
  StaleObservation,
  InvalidObservation,
  DuplicateObservation,
  InvalidParameters,
  StrategyFault,
  InsufficientBalance,
  InvalidSignal,
  OrderSinkError,
  HistoryFetchError,
  StateConflict,
  ConfigError
};

inline const char *to_string(ErrorCode c) noexcept
{
  switch (c)
  {
  case ErrorCode::Ok:
    return "Ok";
  case ErrorCode::StaleObservation:
    return "StaleObservation";
  case ErrorCode::InvalidObservation:
    return "InvalidObservation";
  case ErrorCode::DuplicateObservation:
    return "DuplicateObservation";
  case ErrorCode::InvalidParameters:
    return "InvalidParameters";
  case ErrorCode::StrategyFault:
    return "StrategyFault";
  case ErrorCode::InsufficientBalance:
    return "InsufficientBalance";
  case ErrorCode::InvalidSignal:
    return "InvalidSignal";
  case ErrorCode::OrderSinkError:
    return "OrderSinkError";
  case ErrorCode::HistoryFetchError:
    return "HistoryFetchError";
  case ErrorCode::StateConflict:
    return "StateConflict";
  case ErrorCode::ConfigError:
    return "ConfigError";
  }
  return "Unknown";
}

// Outcome of an operation: a code plus a human readable reason for the log.
struct Status
{
  ErrorCode code{ErrorCode::Ok};
  std::string reason{};

  bool ok() const noexcept
  {
    return code == ErrorCode::Ok;
  }

  static Status success()
  {
    return Status{};
  }

  static Status error(ErrorCode c, std::string why)
  {
    return Status{c, std::move(why)};
  }
};

// Either a value or the error that prevented producing it.
// std::variant keeps the two states exclusive without a heap allocation.
template <typename T> class Result
{
  std::variant<T, Status> v_;

public:
  Result(T value) : v_(std::move(value)) {}
  Result(Status error) : v_(std::move(error)) {}

  bool ok() const noexcept
  {
    return std::holds_alternative<T>(v_);
  }

  const T &value() const
  {
    return std::get<T>(v_);
  }

  T &value()
  {
    return std::get<T>(v_);
  }

  // Ok status when a value is held.
  Status status() const
  {
    return ok() ? Status::success() : std::get<Status>(v_);
  }
};
} // namespace tbot

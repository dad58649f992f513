#pragma once

#include "common/status.hpp"

#include <string>
#include <vector>

namespace tbot
{
enum class OrderType : u8
{
  Market = 0,
  Limit = 1
};

// Exchange order lifecycle as reported by the venue.
enum class OrderStatus : u8
{
  New = 0,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
  Expired
};

inline const char *to_string(OrderStatus s) noexcept
{
  switch (s)
  {
  case OrderStatus::New:
    return "NEW";
  case OrderStatus::PartiallyFilled:
    return "PARTIALLY_FILLED";
  case OrderStatus::Filled:
    return "FILLED";
  case OrderStatus::Canceled:
    return "CANCELED";
  case OrderStatus::Rejected:
    return "REJECTED";
  case OrderStatus::Expired:
    return "EXPIRED";
  }
  return "?";
}

inline bool is_terminal(OrderStatus s) noexcept
{
  return s == OrderStatus::Filled || s == OrderStatus::Canceled || s == OrderStatus::Rejected ||
         s == OrderStatus::Expired;
}

struct OrderAck
{
  std::string order_id;
  OrderStatus status{OrderStatus::New};
};

struct OrderStatusReport
{
  std::string order_id;
  OrderStatus status{OrderStatus::New};
  Qty executed_qty{0};
  Price avg_price{0};
  double commission{0};
  Timestamp update_time{0};
};

struct AccountInfo
{
  std::string quote_asset;
  double quote_free{0};
  double base_free{0};
};

struct TradeFill
{
  std::string order_id;
  Side side{Side::Buy};
  Price price{0};
  Qty quantity{0};
  double commission{0};
  Timestamp time{0};
};

// Exchange order entry. Every call may fail; the router treats failures as OrderSinkError and
// retries on its next poll.
class IOrderSink
{
public:
  virtual ~IOrderSink() = default;
  virtual Result<OrderAck> place_order(const std::string &symbol, Side side, OrderType type,
                                       Qty quantity) = 0;
  virtual Result<OrderStatusReport> get_order_status(const std::string &symbol,
                                                     const std::string &order_id) = 0;
  virtual Status cancel_order(const std::string &symbol, const std::string &order_id) = 0;
  virtual Result<AccountInfo> get_account_info() = 0;
  virtual Result<std::vector<TradeFill>> get_trade_history(const std::string &symbol) = 0;
};
} // namespace tbot

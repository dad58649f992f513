#pragma once

#include "common/logging.hpp"
#include "executor.hpp"
#include "order_sink.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace tbot
{
// Live executor. Signals become market orders on an IOrderSink; the ledger only changes when poll()
// sees the order FILLED, using the venue's average price, executed quantity and commission.
// While an order is outstanding for a symbol further signals for it are refused.
class OrderRouter final : public IExecutor
{
  struct PendingOrder
  {
    std::string symbol;
    std::string order_id;
    Side side{Side::Buy};
    Qty quantity{0};
    bool closing{false};
  };

  IOrderSink &sink_;
  ExecutionConfig cfg_;
  std::vector<PendingOrder> pending_;

public:
  OrderRouter(IOrderSink &sink, ExecutionConfig cfg = {}) : sink_(sink), cfg_(cfg)
  {
    check_execution_config(cfg_);
  }

  ExecutionMode mode() const noexcept override
  {
    return ExecutionMode::Live;
  }

  ExecutionReport execute(const Signal &signal, const Bar &bar, WalletLedger &ledger) override
  {
    ExecutionReport r;
    if (signal.action == Action::Hold)
      return r;
    if (has_pending(bar.symbol))
    {
      TBOT_WARN("router: %s %s refused, an order is still pending", bar.symbol.c_str(),
                to_string(signal.action));
      r.outcome = ExecutionOutcome::Rejected;
      r.status = Status::error(ErrorCode::StateConflict, "order pending for " + bar.symbol);
      return r;
    }

    std::variant<OrderIntent, ExecutionReport> plan =
        apply_position_rules(signal, ledger, cfg_, "router");
    if (std::holds_alternative<ExecutionReport>(plan))
      return std::get<ExecutionReport>(plan);
    const OrderIntent intent = std::get<OrderIntent>(plan);

    Result<OrderAck> ack = sink_.place_order(bar.symbol, intent.side, OrderType::Market,
                                             intent.quantity);
    if (!ack.ok())
    {
      TBOT_ERROR("router: %s place_order failed: %s", bar.symbol.c_str(),
                 ack.status().reason.c_str());
      r.outcome = ExecutionOutcome::Rejected;
      r.status = Status::error(ErrorCode::OrderSinkError, ack.status().reason);
      return r;
    }

    pending_.push_back(
        PendingOrder{bar.symbol, ack.value().order_id, intent.side, intent.quantity, intent.closing});
    TBOT_INFO("router: %s %s %.8f submitted as %s (%s)", bar.symbol.c_str(),
              to_string(intent.side), intent.quantity, ack.value().order_id.c_str(),
              signal.reason.c_str());
    r.outcome = ExecutionOutcome::Submitted;
    r.order_id = ack.value().order_id;
    return r;
  }

  // Asks the venue about every pending order. Terminal states are applied or dropped; sink errors
  // leave the order pending for the next poll.
  std::vector<ExecutionReport> poll(WalletLedger &ledger) override
  {
    std::vector<ExecutionReport> out;
    std::vector<PendingOrder> still;
    for (PendingOrder &p : pending_)
    {
      Result<OrderStatusReport> st = sink_.get_order_status(p.symbol, p.order_id);
      if (!st.ok())
      {
        TBOT_ERROR("router: status of %s failed (%s): %s", p.order_id.c_str(),
                   to_string(ErrorCode::OrderSinkError), st.status().reason.c_str());
        still.push_back(std::move(p));
        continue;
      }
      const OrderStatusReport &rep = st.value();
      if (rep.status == OrderStatus::Filled)
      {
        out.push_back(apply_fill(p, rep, ledger));
      }
      else if (is_terminal(rep.status))
      {
        TBOT_WARN("router: order %s for %s ended %s", p.order_id.c_str(), p.symbol.c_str(),
                  to_string(rep.status));
        ExecutionReport r;
        r.outcome = ExecutionOutcome::Rejected;
        r.order_id = p.order_id;
        r.status = Status::error(ErrorCode::OrderSinkError,
                                 std::string("order ") + to_string(rep.status));
        out.push_back(std::move(r));
      }
      else
      {
        still.push_back(std::move(p));
      }
    }
    pending_ = std::move(still);
    return out;
  }

  // Takes the free quote balance from the venue as the ledger balance.
  Status sync_account(WalletLedger &ledger)
  {
    Result<AccountInfo> info = sink_.get_account_info();
    if (!info.ok())
    {
      TBOT_ERROR("router: account sync failed: %s", info.status().reason.c_str());
      return Status::error(ErrorCode::OrderSinkError, info.status().reason);
    }
    ledger.set_balance(info.value().quote_free);
    TBOT_INFO("router: balance synced, %s %.8f", info.value().quote_asset.c_str(),
              info.value().quote_free);
    return Status::success();
  }

  // Cancels whatever is still outstanding. Orders that fail to cancel are logged and forgotten.
  void shutdown(WalletLedger &) override
  {
    for (const PendingOrder &p : pending_)
    {
      Status st = sink_.cancel_order(p.symbol, p.order_id);
      if (!st.ok())
        TBOT_ERROR("router: cancel of %s failed: %s", p.order_id.c_str(), st.reason.c_str());
      else
        TBOT_INFO("router: canceled %s", p.order_id.c_str());
    }
    pending_.clear();
  }

  bool has_pending(const std::string &symbol) const
  {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](const PendingOrder &p) { return p.symbol == symbol; });
  }

  std::size_t pending_count() const noexcept
  {
    return pending_.size();
  }

private:
  ExecutionReport apply_fill(const PendingOrder &p, const OrderStatusReport &rep,
                             WalletLedger &ledger)
  {
    ExecutionReport r;
    r.order_id = p.order_id;
    Fill f;
    f.symbol = p.symbol;
    f.side = p.side;
    f.price = rep.avg_price;
    f.quantity = rep.executed_qty;
    f.commission = rep.commission;
    f.time = rep.update_time;

    TradeRecord closed;
    Status st = ledger.apply(f, false, &closed);
    if (!st.ok())
    {
      TBOT_ERROR("router: fill of %s could not be applied: %s", p.order_id.c_str(),
                 st.reason.c_str());
      r.outcome = ExecutionOutcome::Rejected;
      r.status = st;
      return r;
    }
    TBOT_INFO("router: %s filled %.8f @ %.8f fee %.8f", p.order_id.c_str(), f.quantity, f.price,
              f.commission);
    r.outcome = ExecutionOutcome::Filled;
    r.fill = f;
    if (p.closing)
      r.closed = closed;
    return r;
  }
};
} // namespace tbot

#pragma once

#include "bollinger_strategy.hpp"
#include "common/logging.hpp"
#include "macd_strategy.hpp"
#include "rsi_strategy.hpp"
#include "sma_crossover.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tbot
{
struct StrategyInfo
{
  std::string name;
  std::string description;
  std::vector<OptionSpec> options;
};

// Name -> factory for strategies available to sessions. Starts out with the bundled strategies;
// more can be added with add().
class StrategyRegistry
{
public:
  using Factory = std::function<std::unique_ptr<IStrategy>()>;

private:
  std::map<std::string, Factory> factories_;

public:
  StrategyRegistry()
  {
    add<SmaCrossover>();
    add<RsiStrategy>();
    add<MacdStrategy>();
    add<BollingerStrategy>();
  }

  template <typename S> void add()
  {
    add(S{}.name(), [] { return std::unique_ptr<IStrategy>(std::make_unique<S>()); });
  }

  void add(const std::string &name, Factory f)
  {
    factories_[name] = std::move(f);
  }

  std::vector<std::string> available() const
  {
    std::vector<std::string> out;
    for (const auto &kv : factories_)
      out.push_back(kv.first);
    return out;
  }

  Result<std::unique_ptr<IStrategy>> create(const std::string &name) const
  {
    auto it = factories_.find(name);
    if (it == factories_.end())
    {
      TBOT_ERROR("registry: unknown strategy '%s'", name.c_str());
      return Status::error(ErrorCode::InvalidParameters, "unknown strategy '" + name + "'");
    }
    return it->second();
  }

  Result<StrategyInfo> describe(const std::string &name) const
  {
    Result<std::unique_ptr<IStrategy>> s = create(name);
    if (!s.ok())
      return s.status();
    const IStrategy &st = *s.value();
    return StrategyInfo{st.name(), st.description(), st.options()};
  }
};
} // namespace tbot

#include "trendsim/domain/unit.hpp"

#include <sstream>
#include <utility>

namespace trendsim {
namespace domain {

Unit::Unit(UnitTerms terms)
    : terms_(std::move(terms)),
      trade_id_(makeTradeId(terms_.security, terms_.entry_time,
                            terms_.direction)) {
  original_stop_price_ = terms_.entry_price - directionSign(terms_.direction) *
                                                  terms_.stop_loss_factor *
                                                  terms_.atr;
  stop_price_ = original_stop_price_;
}

double Unit::value(double price) const {
  return price * terms_.unit_size * terms_.lot_size;
}

double Unit::marginReq() const {
  return value(terms_.entry_price) * terms_.margin_factor;
}

bool Unit::isStoppedOut(double price) const {
  return isLong() ? stop_price_ > price : stop_price_ < price;
}

std::string Unit::describe() const {
  std::ostringstream out;
  out << directionToString(terms_.direction) << " unit " << trade_id_
      << ": size=" << terms_.unit_size << "x" << terms_.lot_size
      << " entry=" << terms_.entry_price << " @tick " << terms_.entry_tick
      << " stop=" << stop_price_ << " ATR=" << terms_.atr;
  return out.str();
}

std::string makeTradeId(const std::string& security, Timestamp entry_time,
                        Direction direction) {
  return security + "@" + std::to_string(timestamp_to_ms(entry_time)) +
         (direction == Direction::Long ? "/L" : "/S");
}

}  // namespace domain
}  // namespace trendsim

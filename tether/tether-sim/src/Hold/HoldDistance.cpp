// Ticket: 0009_anchor_tracking

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "tether-sim/src/Hold/HoldDistance.hpp"

namespace tether_sim
{

HoldDistance::HoldDistance(double min, double max)
  : min_{min}, max_{max}, value_{min}
{
  if (!std::isfinite(min) || !std::isfinite(max) || min <= 0.0 || min > max)
  {
    throw std::invalid_argument("Hold distance range must satisfy 0 < min <= "
                                "max, got: [" +
                                std::to_string(min) + ", " +
                                std::to_string(max) + "]");
  }
}

void HoldDistance::set(double value)
{
  if (!std::isfinite(value))
  {
    return;
  }
  value_ = std::clamp(value, min_, max_);
}

double HoldDistance::adjust(double scrollDelta, double step)
{
  set(value_ + scrollDelta * step);
  return value_;
}

double HoldDistance::get() const
{
  return value_;
}

double HoldDistance::getMin() const
{
  return min_;
}

double HoldDistance::getMax() const
{
  return max_;
}

}  // namespace tether_sim

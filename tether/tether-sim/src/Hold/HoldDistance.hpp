// Ticket: 0009_anchor_tracking

#ifndef TETHER_SIM_HOLD_HOLD_DISTANCE_HPP
#define TETHER_SIM_HOLD_HOLD_DISTANCE_HPP

namespace tether_sim
{

/**
 * @brief Distance along the view direction at which a body is held
 *
 * The value never leaves [min, max], whatever is passed to set() or adjust().
 */
class HoldDistance
{
public:
  /**
   * @throws std::invalid_argument unless 0 < min <= max (both finite)
   */
  HoldDistance(double min, double max);

  /// Clamp value into range and store it. Non-finite values are ignored.
  void set(double value);

  /**
   * @brief Move by scrollDelta * step, clamped
   * @return The new distance [m]
   */
  double adjust(double scrollDelta, double step);

  [[nodiscard]] double get() const;
  [[nodiscard]] double getMin() const;
  [[nodiscard]] double getMax() const;

private:
  double min_;
  double max_;
  double value_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_HOLD_DISTANCE_HPP

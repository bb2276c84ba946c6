// Ticket: 0005_grab_input

#ifndef TETHER_SIM_AGENT_VIEW_SOURCE_HPP
#define TETHER_SIM_AGENT_VIEW_SOURCE_HPP

#include <optional>

#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/Physics/Pose.hpp"

namespace tether_sim
{

/**
 * @brief Supplies the controller (view) transform of the holding agent
 *
 * The movement/look controller that drives this transform is external.
 */
class ViewSource
{
public:
  virtual ~ViewSource() = default;

  /// Controller origin and orientation; forward is the view direction
  [[nodiscard]] virtual Pose getViewPose() const = 0;

  /// Beam start point, if the agent carries a muzzle
  [[nodiscard]] virtual std::optional<Coordinate> getMuzzlePosition() const = 0;

protected:
  ViewSource() = default;
  ViewSource(const ViewSource&) = default;
  ViewSource& operator=(const ViewSource&) = default;
  ViewSource(ViewSource&&) noexcept = default;
  ViewSource& operator=(ViewSource&&) noexcept = default;
};

/**
 * @brief ViewSource whose transform is set directly
 */
class FixedViewSource final : public ViewSource
{
public:
  FixedViewSource() = default;

  explicit FixedViewSource(const Pose& pose) : pose_{pose}
  {
  }

  [[nodiscard]] Pose getViewPose() const override
  {
    return pose_;
  }

  [[nodiscard]] std::optional<Coordinate> getMuzzlePosition() const override
  {
    return muzzle_;
  }

  void setViewPose(const Pose& pose)
  {
    pose_ = pose;
  }

  void setMuzzlePosition(std::optional<Coordinate> muzzle)
  {
    muzzle_ = muzzle;
  }

private:
  Pose pose_;
  std::optional<Coordinate> muzzle_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_AGENT_VIEW_SOURCE_HPP

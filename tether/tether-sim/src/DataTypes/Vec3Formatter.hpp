// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_VEC3_FORMATTER_HPP
#define TETHER_SIM_DATATYPES_VEC3_FORMATTER_HPP

#include <concepts>
#include <format>
#include <string>

#include "tether-sim/src/DataTypes/Vec3DBase.hpp"

namespace tether_sim::detail
{

template <typename T>
concept SemanticVec3 = std::derived_from<T, Vec3DBase<T>>;

}  // namespace tether_sim::detail

/**
 * @brief std::format support for every semantic 3-vector
 *
 * Prints "(x, y, z)". Accepts an optional [.precision][f|e|g] spec; the
 * default is three decimals in fixed notation.
 */
template <tether_sim::detail::SemanticVec3 T>
struct std::formatter<T, char>
{
  int precision{3};
  char presentation{'f'};

  constexpr auto parse(std::format_parse_context& ctx)
  {
    auto it = ctx.begin();
    if (it != ctx.end() && *it == '.')
    {
      ++it;
      precision = 0;
      while (it != ctx.end() && *it >= '0' && *it <= '9')
      {
        precision = precision * 10 + (*it - '0');
        ++it;
      }
    }
    if (it != ctx.end() && (*it == 'f' || *it == 'e' || *it == 'g'))
    {
      presentation = *it;
      ++it;
    }
    if (it != ctx.end() && *it != '}')
    {
      throw std::format_error("Invalid format spec for a 3-vector");
    }
    return it;
  }

  auto format(const T& vec, std::format_context& ctx) const
  {
    return std::format_to(ctx.out(),
                          "({}, {}, {})",
                          component(vec.x()),
                          component(vec.y()),
                          component(vec.z()));
  }

private:
  [[nodiscard]] std::string component(double value) const
  {
    switch (presentation)
    {
      case 'e':
        return std::format("{:.{}e}", value, precision);
      case 'g':
        return std::format("{:.{}g}", value, precision);
      default:
        return std::format("{:.{}f}", value, precision);
    }
  }
};

#endif  // TETHER_SIM_DATATYPES_VEC3_FORMATTER_HPP

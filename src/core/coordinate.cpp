#include <geohashing/core/coordinate.hpp>

#include <cmath>

namespace geohashing {

auto GraticuleAxis::from_coordinate(double value) -> GraticuleAxis {
    return GraticuleAxis{.degree = static_cast<std::int32_t>(std::trunc(value))};
}

auto GraticuleAxis::text() const -> std::string {
    return std::to_string(degree);
}

}  // namespace geohashing

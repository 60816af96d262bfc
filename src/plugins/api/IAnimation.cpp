#include "IAnimation.h"

#include <cmath>

namespace cosmicled {
namespace plugins {

float AnimationParameter::constrain(float value) const {
    if (std::isnan(value)) {
        value = defaultValue;
    }
    if (type == AnimationParameterType::INT) {
        value = std::round(value);
    }
    if (value < minValue) return minValue;
    if (value > maxValue) return maxValue;
    return value;
}

} // namespace plugins
} // namespace cosmicled

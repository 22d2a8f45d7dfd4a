#pragma once
#include "horizon/horizon_types.h"
#include <vector>

namespace skyline {

/* Re-express raw samples relative to the bearing toward the peak and sort
   them ascending by relative direction.

   The bearing is rounded to the nearest whole degree before subtracting so
   that relative directions land on the same integer grid as the raw
   samples; direction 0 is the column straight at the peak. */
std::vector<HorizonSample> to_relative(const std::vector<RawHorizonSample>& raw,
                                       double bearing_to_peak);

} // namespace skyline

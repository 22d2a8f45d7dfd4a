#pragma once
#include "horizon/horizon_types.h"
#include <vector>

namespace skyline {

/* Anything that can cast horizon rays from a point. Implementations must
   be safe to query from several threads at once once constructed. */
class ElevationSource {
public:
    virtual ~ElevationSource() = default;

    virtual const char* name() const = 0;

    /* One sample per integer compass direction in [start_dir, end_dir],
       ascending. Bounds are inclusive and must satisfy
       0 <= start_dir <= end_dir <= 359; anything else throws QueryError. */
    virtual std::vector<RawHorizonSample> horizon_query(double lat, double lon,
                                                        int start_dir, int end_dir) const = 0;
};

/* Shared helper for implementations */
void validate_direction_bounds(int start_dir, int end_dir);

} // namespace skyline

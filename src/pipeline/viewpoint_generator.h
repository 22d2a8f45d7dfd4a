#pragma once
#include "elevation/elevation_source.h"
#include "horizon/horizon_types.h"
#include "pipeline/generation_params.h"

namespace skyline {

/* Place the viewpoint for one angle, look back at the peak, and collect
   the horizon inside the field of view. Deterministic for a given source;
   wrapping windows are queried as two sub-ranges. */
Viewpoint generate_viewpoint(const ElevationSource& source, int angle,
                             const GenerationParams& params = DEFAULT_PARAMS);

/* All params.angle_count viewpoints, index == angle. With workers > 1 the
   angles are spread over that many threads; the result is identical to
   the sequential build. The first failure is rethrown after every worker
   has stopped. */
Dataset build_dataset(const ElevationSource& source,
                      const GenerationParams& params = DEFAULT_PARAMS,
                      int workers = 1);

} // namespace skyline

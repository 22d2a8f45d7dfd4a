#ifndef SKYLINE_H
#define SKYLINE_H

#include "types.h"

#ifdef _WIN32
  #ifdef SKYLINE_EXPORTS
    #define SKYLINE_API __declspec(dllexport)
  #else
    #define SKYLINE_API __declspec(dllimport)
  #endif
#else
  #define SKYLINE_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ── Geodesy ───────────────────────────────────────────────────────── */
SKYLINE_API skyline_coord_t skyline_destination_point(skyline_coord_t origin,
                                                      double distance_km,
                                                      double bearing_deg);
SKYLINE_API double skyline_bearing(skyline_coord_t from, skyline_coord_t to);

/* ── Generation ────────────────────────────────────────────────────── */
/* Build the 360-viewpoint dataset for the built-in peak from a GeoTIFF
   and write the JSON to output_path. workers <= 0 means 1. */
SKYLINE_API skyline_status_t skyline_generate_file(const char* tif_path,
                                                   const char* output_path,
                                                   int workers);

/* Message for the last failed call on this thread ("" if none) */
SKYLINE_API const char* skyline_last_error(void);

#ifdef __cplusplus
}
#endif

#endif /* SKYLINE_H */

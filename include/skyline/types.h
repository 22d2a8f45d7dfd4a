#ifndef SKYLINE_TYPES_H
#define SKYLINE_TYPES_H

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
    double latitude;
    double longitude;
} skyline_coord_t;

typedef enum {
    SKYLINE_OK                  = 0,
    SKYLINE_ERR_DATA_LOAD       = 1, /* elevation file missing/unreadable/corrupt */
    SKYLINE_ERR_QUERY           = 2, /* collaborator rejected a direction range */
    SKYLINE_ERR_SERIALIZATION   = 3, /* artifact could not be encoded/written */
    SKYLINE_ERR_INVALID_ARGUMENT = 4,
    SKYLINE_ERR_INTERNAL        = 5
} skyline_status_t;

#ifdef __cplusplus
}
#endif

#endif /* SKYLINE_TYPES_H */

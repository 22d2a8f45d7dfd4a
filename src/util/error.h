#pragma once
#include <stdexcept>
#include <string>

namespace skyline {

/* Base for every failure skyline reports. Geodesy never throws;
   everything fallible sits behind the elevation load, the collaborator
   query, or the artifact encoder. */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/* Elevation source missing, unreadable or corrupt. Retryable. */
class DataLoadError : public Error {
public:
    explicit DataLoadError(const std::string& what) : Error(what) {}
};

/* Malformed direction range handed to an ElevationSource. */
class QueryError : public Error {
public:
    explicit QueryError(const std::string& what) : Error(what) {}
};

/* Artifact could not be encoded or written. */
class SerializationError : public Error {
public:
    explicit SerializationError(const std::string& what) : Error(what) {}
};

} // namespace skyline

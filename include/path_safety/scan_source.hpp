#ifndef PATH_SAFETY__SCAN_SOURCE_HPP_
#define PATH_SAFETY__SCAN_SOURCE_HPP_

#include <optional>
#include <stdexcept>
#include <string>

#include "path_safety/types.hpp"

namespace path_safety {

// A single batch could not be read. The source itself stays usable.
class ScanReadError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Where raw scans come from. Implementations normalize their transport's
// encoding into RawReading (degrees, meters).
//
// next() is only called from the engine worker. It returns std::nullopt when
// there is no data (no device, nothing received yet) and throws ScanReadError
// when one read fails.
class ScanSource {
public:
  virtual ~ScanSource() = default;

  virtual std::optional<ScanBatch> next() = 0;

  // Called from another thread while next() may be running. A blocked next()
  // returns soon after, later calls report no data. Must not throw.
  virtual void interrupt() {}

  // Releases the underlying device. After close() next() reports no data.
  // Never called while next() is running.
  virtual void close() = 0;

  virtual std::string name() const = 0;
};

}  // namespace path_safety

#endif  // PATH_SAFETY__SCAN_SOURCE_HPP_

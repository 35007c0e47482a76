#pragma once

#include "slidewatch/core/reading_series.hpp"
#include "slidewatch/data/store_format.hpp"
#include <string>

namespace slidewatch {

/// A reading set read back from disk
struct StoredReadingSet {
  std::string label;
  ReadingSeries series;
};

/**
 * Compressed on-disk cache of reading sets
 *
 * Lets an analysis rerun without reparsing the raw gauge exports.
 */
class ReadingStore {
public:
  ReadingStore() = delete;

  /**
   * Write a reading set
   *
   * @param path Output file, overwritten if present
   * @param series Readings to store
   * @param label Free-form description (at most 4096 bytes)
   * @param compression_level ZSTD level (1-22)
   * @throws StoreError on I/O or compression failure
   */
  static void write(const std::string &path, const ReadingSeries &series,
                    const std::string &label = "",
                    int compression_level = store::DEFAULT_COMPRESSION_LEVEL);

  /**
   * Read and validate a reading set
   *
   * @throws StoreError on bad magic, version, sizes or checksum
   */
  static StoredReadingSet read(const std::string &path);

  /// "ir_reading_set_<YYYY-MM-DD of the last reading>.swrs"
  /// @throws InsufficientDataError for an empty series
  static std::string file_name_for(const ReadingSeries &series);
};

} // namespace slidewatch

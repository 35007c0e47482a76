#include "slidewatch/data/reading_store.hpp"
#include "slidewatch/core/errors.hpp"
#include "slidewatch/core/logging.hpp"
#include "slidewatch/core/time_utils.hpp"

#include <cstdint>
#include <fstream>
#include <vector>

#include <zstd.h>

namespace slidewatch {

namespace store {

uint32_t calculate_crc32(const void *data, size_t size) {
  uint32_t crc = 0xFFFFFFFF;
  const uint8_t *bytes = static_cast<const uint8_t *>(data);

  for (size_t i = 0; i < size; ++i) {
    crc ^= bytes[i];
    for (int j = 0; j < 8; ++j) {
      crc = (crc >> 1) ^ (0xEDB88320 & -(crc & 1));
    }
  }

  return ~crc;
}

} // namespace store

namespace {

constexpr size_t BYTES_PER_READING = sizeof(int64_t) + sizeof(double);

std::vector<uint8_t> pack_payload(const ReadingSeries &series) {
  const size_t n = series.size();
  std::vector<uint8_t> raw(n * BYTES_PER_READING);

  uint8_t *times = raw.data();
  uint8_t *heights = raw.data() + n * sizeof(int64_t);
  for (size_t i = 0; i < n; ++i) {
    const int64_t t = series[i].timestamp;
    const double h = series[i].height;
    std::memcpy(times + i * sizeof(int64_t), &t, sizeof(t));
    std::memcpy(heights + i * sizeof(double), &h, sizeof(h));
  }
  return raw;
}

std::vector<Reading> unpack_payload(const std::vector<uint8_t> &raw, size_t n) {
  std::vector<Reading> readings(n);

  const uint8_t *times = raw.data();
  const uint8_t *heights = raw.data() + n * sizeof(int64_t);
  for (size_t i = 0; i < n; ++i) {
    std::memcpy(&readings[i].timestamp, times + i * sizeof(int64_t), sizeof(int64_t));
    std::memcpy(&readings[i].height, heights + i * sizeof(double), sizeof(double));
  }
  return readings;
}

std::vector<uint8_t> compress_data(const std::vector<uint8_t> &raw, int level) {
  const size_t max_compressed_size = ZSTD_compressBound(raw.size());
  std::vector<uint8_t> compressed(max_compressed_size);

  const size_t compressed_size = ZSTD_compress(
      compressed.data(), max_compressed_size, raw.data(), raw.size(), level);

  if (ZSTD_isError(compressed_size)) {
    throw StoreError("ZSTD compression failed: " +
                     std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed.resize(compressed_size);
  return compressed;
}

std::vector<uint8_t> decompress_data(const std::vector<uint8_t> &compressed,
                                     size_t raw_size) {
  std::vector<uint8_t> raw(raw_size);

  const size_t decompressed_size = ZSTD_decompress(
      raw.data(), raw.size(), compressed.data(), compressed.size());

  if (ZSTD_isError(decompressed_size)) {
    throw StoreError("ZSTD decompression failed: " +
                     std::string(ZSTD_getErrorName(decompressed_size)));
  }
  if (decompressed_size != raw_size) {
    throw StoreError("Decompressed payload is " + std::to_string(decompressed_size) +
                     " bytes, header says " + std::to_string(raw_size));
  }

  return raw;
}

} // namespace

void ReadingStore::write(const std::string &path, const ReadingSeries &series,
                         const std::string &label, int compression_level) {
  if (label.size() > store::MAX_LABEL_LENGTH) {
    throw StoreError("Label of " + std::to_string(label.size()) +
                     " bytes exceeds the limit of " +
                     std::to_string(store::MAX_LABEL_LENGTH));
  }
  if (compression_level < 1 || compression_level > ZSTD_maxCLevel()) {
    throw StoreError("Compression level must be in [1, " +
                     std::to_string(ZSTD_maxCLevel()) + "]");
  }

  const std::vector<uint8_t> raw = pack_payload(series);
  const std::vector<uint8_t> compressed = compress_data(raw, compression_level);

  store::StoreHeader header;
  header.reading_count = series.size();
  header.raw_size = raw.size();
  header.compressed_size = compressed.size();
  header.payload_crc32 = store::calculate_crc32(raw.data(), raw.size());
  header.label_length = static_cast<uint32_t>(label.size());
  header.compression_level = static_cast<uint8_t>(compression_level);

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw StoreError("Cannot open file for writing: " + path);
  }

  file.write(reinterpret_cast<const char *>(&header), sizeof(header));
  file.write(label.data(), static_cast<std::streamsize>(label.size()));
  file.write(reinterpret_cast<const char *>(compressed.data()),
             static_cast<std::streamsize>(compressed.size()));
  file.flush();
  if (!file) {
    throw StoreError("Failed to write reading set to " + path);
  }

  log::info("store", "Wrote " + std::to_string(series.size()) + " readings to " +
            path + " (" + std::to_string(compressed.size()) + " bytes)");
}

StoredReadingSet ReadingStore::read(const std::string &path) {
  std::ifstream file(path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw StoreError("Cannot open file: " + path);
  }
  const std::streamoff end = file.tellg();
  if (end < 0) {
    throw StoreError("Cannot determine size of " + path);
  }
  const auto file_size = static_cast<uint64_t>(end);
  file.seekg(0, std::ios::beg);

  store::StoreHeader header;
  if (file_size < sizeof(header) ||
      !file.read(reinterpret_cast<char *>(&header), sizeof(header))) {
    throw StoreError("File too small for a reading store header: " + path);
  }

  if (header.magic != store::STORE_MAGIC) {
    throw StoreError("Invalid magic number in " + path);
  }
  if (header.version != store::STORE_VERSION) {
    throw StoreError("Unsupported reading store version " +
                     std::to_string(header.version) + " in " + path);
  }
  if (header.label_length > store::MAX_LABEL_LENGTH) {
    throw StoreError("Label length " + std::to_string(header.label_length) +
                     " exceeds the limit in " + path);
  }
  if (header.reading_count > UINT64_MAX / BYTES_PER_READING ||
      header.raw_size != header.reading_count * BYTES_PER_READING) {
    throw StoreError("Payload size does not match reading count in " + path);
  }
  if (sizeof(header) + header.label_length + header.compressed_size != file_size) {
    throw StoreError("File size does not match header in " + path);
  }

  StoredReadingSet result;
  result.label.resize(header.label_length);
  std::vector<uint8_t> compressed(header.compressed_size);

  if (!file.read(&result.label[0], static_cast<std::streamsize>(header.label_length)) ||
      !file.read(reinterpret_cast<char *>(compressed.data()),
                 static_cast<std::streamsize>(compressed.size()))) {
    throw StoreError("Truncated reading store: " + path);
  }

  // Header sizes must agree with the frame before raw_size is allocated
  const unsigned long long frame_size =
      ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (frame_size == ZSTD_CONTENTSIZE_ERROR || frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw StoreError("Payload is not a sized ZSTD frame in " + path);
  }
  if (frame_size != header.raw_size) {
    throw StoreError("Payload holds " + std::to_string(frame_size) +
                     " bytes, header says " + std::to_string(header.raw_size) +
                     " in " + path);
  }

  const std::vector<uint8_t> raw = decompress_data(compressed, header.raw_size);
  if (store::calculate_crc32(raw.data(), raw.size()) != header.payload_crc32) {
    throw StoreError("Checksum mismatch in " + path);
  }

  try {
    result.series = ReadingSeries(unpack_payload(raw, header.reading_count));
  } catch (const ReadingFormatError &e) {
    throw StoreError("Corrupt reading set in " + path + ": " + e.what());
  }

  log::info("store", "Read " + std::to_string(result.series.size()) +
            " readings from " + path);
  return result;
}

std::string ReadingStore::file_name_for(const ReadingSeries &series) {
  return "ir_reading_set_" +
         time_utils::format_timestamp(series.last().timestamp, "%Y-%m-%d") + ".swrs";
}

} // namespace slidewatch

/**
 * Reading store file layout
 *
 *   [StoreHeader]      fixed 64 bytes
 *   [label]            label_length bytes, UTF-8, no terminator
 *   [payload]          ZSTD frame of the raw payload
 *
 * Raw payload: reading_count int64 timestamps followed by reading_count
 * float64 heights, host byte order (little-endian on every supported
 * target). payload_crc32 covers the raw payload.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace slidewatch {
namespace store {

// ==============================================================================
// Constants
// ==============================================================================

constexpr uint32_t STORE_MAGIC = 0x53525753;    // "SWRS" in little-endian
constexpr uint32_t STORE_VERSION = 0x00010000;  // v1.0
constexpr uint32_t MAX_LABEL_LENGTH = 4096;
constexpr int DEFAULT_COMPRESSION_LEVEL = 3;

// ==============================================================================
// Header
// ==============================================================================

#pragma pack(push, 1)

struct StoreHeader {
  uint32_t magic;           // "SWRS"
  uint32_t version;         // STORE_VERSION
  uint64_t reading_count;   // Readings in the set
  uint64_t raw_size;        // reading_count * 16
  uint64_t compressed_size; // Bytes of the ZSTD frame
  uint32_t payload_crc32;   // CRC32 of the raw payload
  uint32_t label_length;    // Bytes of label after the header
  uint8_t compression_level;
  uint8_t reserved[23];

  StoreHeader() {
    magic = STORE_MAGIC;
    version = STORE_VERSION;
    reading_count = 0;
    raw_size = 0;
    compressed_size = 0;
    payload_crc32 = 0;
    label_length = 0;
    compression_level = DEFAULT_COMPRESSION_LEVEL;
    std::memset(reserved, 0, sizeof(reserved));
  }
};

#pragma pack(pop)

static_assert(sizeof(StoreHeader) == 64, "StoreHeader must be 64 bytes");

/// Standard CRC32 (reflected, polynomial 0xEDB88320)
uint32_t calculate_crc32(const void *data, size_t size);

} // namespace store
} // namespace slidewatch

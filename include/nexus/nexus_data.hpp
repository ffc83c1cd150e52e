#pragma once

// nexus/nexus_data.hpp: NexusData envelope and its on-chain wire form.
//
// WIRE (bit-exact):
//   { storage: bytes, one: bytes, many: bytes[], encryption_mode: u8 }
//   storage in {"inline", "walrus"}; encryption_mode in {0, 1, 2}.
//
// DESIGN:
//   A single JSON value travels in `one` as its JSON text; an array travels
//   element by element in `many`. An empty array is both fields empty.
//   Decoding trims each field and quotes bare integer literals wider than
//   u64 (more than 20 digits, or 21 characters with a leading '-') before
//   parsing, so u128/u256 values survive as JSON strings.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nexus/jsonlite.hpp"
#include "nexus/types.hpp"

namespace nexus {

// Transaction sizing used by hint_remote_fields().
constexpr std::size_t NEXUS_BASE_TRANSACTION_SIZE = 8 * 1024;
constexpr std::size_t MAX_TRANSACTION_SIZE = 128 * 1024;
constexpr std::size_t WALRUS_BLOB_ID_LENGTH = 44;
constexpr std::size_t ENCRYPTION_BASE_SIZE = 440;
constexpr std::size_t ENCRYPTION_INFLATION_FACTOR = 4;

enum class StorageKind { inline_storage, walrus };

enum class EncryptionMode : std::uint8_t {
  plain = 0,
  standard = 1,
  limited_persistent = 2,
};

std::string to_string(StorageKind kind);
std::string to_string(EncryptionMode mode);

struct NexusData {
  StorageKind storage{StorageKind::inline_storage};
  jsonlite::Value data;
  EncryptionMode encryption_mode{EncryptionMode::plain};

  static NexusData new_inline(jsonlite::Value v);
  static NexusData new_inline_encrypted(jsonlite::Value v);
  static NexusData new_walrus(jsonlite::Value v);
  static NexusData new_walrus_encrypted(jsonlite::Value v);

  bool is_encrypted() const { return encryption_mode != EncryptionMode::plain; }

  bool operator==(const NexusData& o) const {
    return storage == o.storage && encryption_mode == o.encryption_mode && data == o.data;
  }
};

struct NexusDataWire {
  std::string storage;
  std::string one;
  std::vector<std::string> many;
  std::uint8_t encryption_mode{0};

  bool operator==(const NexusDataWire& o) const {
    return storage == o.storage && one == o.one && many == o.many && encryption_mode == o.encryption_mode;
  }
};

NexusDataWire to_wire(const NexusData& data);
std::optional<NexusData> from_wire(const NexusDataWire& wire, Error* error = nullptr);

// On-chain JSON rendition: byte strings as arrays of numbers.
std::string wire_to_json(const NexusDataWire& wire);
std::optional<NexusDataWire> wire_from_json(const std::string& text, Error* error = nullptr);

// Quotes `text` when it is a bare integer literal too wide for u64.
std::string preserve_large_integer(const std::string& text);
bool is_valid_utf8(const std::string& bytes);

// ---------------------------------------------------------------------------
// Input helpers
// ---------------------------------------------------------------------------
// Wraps every field of a JSON object. Fields listed in `remote_fields` use the
// preferred remote storage (walrus by default); asking for inline remote
// storage is an error.
std::optional<std::map<std::string, NexusData>> json_to_nexus_data_map(
    const jsonlite::Value& json, const std::vector<std::string>& encrypt_fields,
    const std::vector<std::string>& remote_fields, std::optional<StorageKind> preferred_remote_storage,
    Error* error = nullptr);

// Names the fields, largest first, that must move to remote storage for the
// object to fit in one transaction. Sizes assume every field is encrypted.
std::optional<std::vector<std::string>> hint_remote_fields(const jsonlite::Value& json, Error* error = nullptr);

}  // namespace nexus

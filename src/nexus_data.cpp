#include "nexus/nexus_data.hpp"

#include <algorithm>
#include <utility>

namespace nexus {
namespace {

constexpr const char* kInlineTag = "inline";
constexpr const char* kWalrusTag = "walrus";

bool is_json_ws(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

std::string trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_json_ws(s[b])) ++b;
  while (e > b && is_json_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::optional<jsonlite::Value> parse_field(const std::string& bytes, const char* field, Error* error) {
  if (!is_valid_utf8(bytes)) {
    set_error(error, ErrorCode::nexus_data_invalid_utf8, std::string("invalid utf-8 in '") + field + "'");
    return std::nullopt;
  }
  const std::string text = preserve_large_integer(trim(bytes));
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Value v = jsonlite::parse_value(text, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::nexus_data_invalid_json,
              std::string("invalid json in '") + field + "': " + jerr->message);
    return std::nullopt;
  }
  return v;
}

jsonlite::Value bytes_to_json(const std::string& bytes) {
  jsonlite::Array arr;
  arr.reserve(bytes.size());
  for (unsigned char c : bytes) arr.push_back(jsonlite::Value{static_cast<std::uint64_t>(c)});
  return jsonlite::Value{std::move(arr)};
}

std::optional<std::string> json_to_bytes(const jsonlite::Value& v) {
  const auto* arr = jsonlite::as_array(v);
  if (!arr) return std::nullopt;
  std::string out;
  out.reserve(arr->size());
  for (const auto& el : *arr) {
    auto n = jsonlite::as_u64(el);
    if (!n || *n > 0xFF) return std::nullopt;
    out += static_cast<char>(*n);
  }
  return out;
}

bool contains(const std::vector<std::string>& list, const std::string& key) {
  return std::find(list.begin(), list.end(), key) != list.end();
}

}  // namespace

std::string to_string(StorageKind kind) {
  return kind == StorageKind::walrus ? kWalrusTag : kInlineTag;
}

std::string to_string(EncryptionMode mode) {
  switch (mode) {
    case EncryptionMode::plain: return "plain";
    case EncryptionMode::standard: return "standard";
    case EncryptionMode::limited_persistent: return "limited_persistent";
  }
  return "unknown";
}

NexusData NexusData::new_inline(jsonlite::Value v) {
  return NexusData{StorageKind::inline_storage, std::move(v), EncryptionMode::plain};
}

NexusData NexusData::new_inline_encrypted(jsonlite::Value v) {
  return NexusData{StorageKind::inline_storage, std::move(v), EncryptionMode::standard};
}

NexusData NexusData::new_walrus(jsonlite::Value v) {
  return NexusData{StorageKind::walrus, std::move(v), EncryptionMode::plain};
}

NexusData NexusData::new_walrus_encrypted(jsonlite::Value v) {
  return NexusData{StorageKind::walrus, std::move(v), EncryptionMode::standard};
}

bool is_valid_utf8(const std::string& bytes) {
  size_t i = 0;
  const size_t n = bytes.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + len > n) return false;
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(bytes[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
    i += len;
  }
  return true;
}

std::string preserve_large_integer(const std::string& text) {
  const bool negative = !text.empty() && text[0] == '-';
  const size_t digits_from = negative ? 1 : 0;
  if (text.size() <= digits_from) return text;
  for (size_t i = digits_from; i < text.size(); ++i) {
    if (text[i] < '0' || text[i] > '9') return text;
  }
  const size_t limit = negative ? 21 : 20;
  if (text.size() <= limit) return text;
  return "\"" + text + "\"";
}

NexusDataWire to_wire(const NexusData& data) {
  NexusDataWire wire;
  wire.storage = to_string(data.storage);
  wire.encryption_mode = static_cast<std::uint8_t>(data.encryption_mode);
  if (const auto* arr = jsonlite::as_array(data.data)) {
    wire.many.reserve(arr->size());
    for (const auto& el : *arr) wire.many.push_back(jsonlite::to_json(el));
  } else {
    wire.one = jsonlite::to_json(data.data);
  }
  return wire;
}

std::optional<NexusData> from_wire(const NexusDataWire& wire, Error* error) {
  NexusData out;
  if (wire.storage == kInlineTag) {
    out.storage = StorageKind::inline_storage;
  } else if (wire.storage == kWalrusTag) {
    out.storage = StorageKind::walrus;
  } else {
    set_error(error, ErrorCode::nexus_data_unknown_storage, "unknown storage tag");
    return std::nullopt;
  }
  if (wire.encryption_mode > static_cast<std::uint8_t>(EncryptionMode::limited_persistent)) {
    set_error(error, ErrorCode::nexus_data_invalid_encryption_mode,
              "invalid encryption mode " + std::to_string(wire.encryption_mode));
    return std::nullopt;
  }
  out.encryption_mode = static_cast<EncryptionMode>(wire.encryption_mode);

  if (!wire.one.empty()) {
    auto v = parse_field(wire.one, "one", error);
    if (!v) return std::nullopt;
    out.data = std::move(*v);
  } else {
    jsonlite::Array values;
    values.reserve(wire.many.size());
    for (const auto& item : wire.many) {
      auto v = parse_field(item, "many", error);
      if (!v) return std::nullopt;
      values.push_back(std::move(*v));
    }
    out.data = jsonlite::Value{std::move(values)};
  }
  return out;
}

std::string wire_to_json(const NexusDataWire& wire) {
  jsonlite::Object obj;
  obj["storage"] = bytes_to_json(wire.storage);
  obj["one"] = bytes_to_json(wire.one);
  jsonlite::Array many;
  for (const auto& item : wire.many) many.push_back(bytes_to_json(item));
  obj["many"] = jsonlite::Value{std::move(many)};
  obj["encryption_mode"] = jsonlite::Value{static_cast<std::uint64_t>(wire.encryption_mode)};
  return jsonlite::to_json(obj);
}

std::optional<NexusDataWire> wire_from_json(const std::string& text, Error* error) {
  std::optional<jsonlite::JsonError> jerr;
  jsonlite::Object obj = jsonlite::parse(text, &jerr);
  if (jerr) {
    set_error(error, ErrorCode::nexus_data_invalid_json, jerr->message);
    return std::nullopt;
  }
  NexusDataWire wire;
  const auto* storage = jsonlite::find(obj, "storage");
  const auto* one = jsonlite::find(obj, "one");
  const auto* many = jsonlite::find(obj, "many");
  const auto* mode = jsonlite::find(obj, "encryption_mode");
  if (!storage || !one || !many || !mode) {
    set_error(error, ErrorCode::nexus_data_invalid_field, "missing nexus data field");
    return std::nullopt;
  }
  auto storage_bytes = json_to_bytes(*storage);
  auto one_bytes = json_to_bytes(*one);
  const auto* many_arr = jsonlite::as_array(*many);
  auto mode_val = jsonlite::as_u64(*mode);
  if (!storage_bytes || !one_bytes || !many_arr || !mode_val || *mode_val > 0xFF) {
    set_error(error, ErrorCode::nexus_data_invalid_field, "malformed nexus data field");
    return std::nullopt;
  }
  wire.storage = std::move(*storage_bytes);
  wire.one = std::move(*one_bytes);
  for (const auto& item : *many_arr) {
    auto b = json_to_bytes(item);
    if (!b) {
      set_error(error, ErrorCode::nexus_data_invalid_field, "malformed 'many' element");
      return std::nullopt;
    }
    wire.many.push_back(std::move(*b));
  }
  wire.encryption_mode = static_cast<std::uint8_t>(*mode_val);
  return wire;
}

std::optional<std::map<std::string, NexusData>> json_to_nexus_data_map(
    const jsonlite::Value& json, const std::vector<std::string>& encrypt_fields,
    const std::vector<std::string>& remote_fields, std::optional<StorageKind> preferred_remote_storage,
    Error* error) {
  const StorageKind remote_kind = preferred_remote_storage.value_or(StorageKind::walrus);
  const auto* obj = jsonlite::as_object(json);
  if (!obj) {
    set_error(error, ErrorCode::nexus_data_invalid_field, "Expected JSON object");
    return std::nullopt;
  }

  std::map<std::string, NexusData> out;
  for (const auto& [key, value] : *obj) {
    const bool encrypt = contains(encrypt_fields, key);
    const bool remote = contains(remote_fields, key);
    if (remote && remote_kind == StorageKind::inline_storage) {
      set_error(error, ErrorCode::nexus_data_unknown_storage,
                "Cannot store data remotely using inline storage");
      return std::nullopt;
    }
    NexusData d;
    d.storage = remote ? remote_kind : StorageKind::inline_storage;
    d.data = value;
    d.encryption_mode = encrypt ? EncryptionMode::standard : EncryptionMode::plain;
    out.emplace(key, std::move(d));
  }
  return out;
}

std::optional<std::vector<std::string>> hint_remote_fields(const jsonlite::Value& json, Error* error) {
  const auto* obj = jsonlite::as_object(json);
  if (!obj) {
    set_error(error, ErrorCode::nexus_data_invalid_field, "Expected JSON object");
    return std::nullopt;
  }

  struct Field {
    const std::string* key;
    const jsonlite::Value* value;
    size_t size;
  };
  std::vector<Field> fields;
  fields.reserve(obj->size());
  for (const auto& [key, value] : *obj) {
    const size_t data_size = jsonlite::to_json(value).size();
    const auto* arr = jsonlite::as_array(value);
    const size_t base = arr ? ENCRYPTION_BASE_SIZE * arr->size() : ENCRYPTION_BASE_SIZE;
    fields.push_back(Field{&key, &value, key.size() + base + data_size * ENCRYPTION_INFLATION_FACTOR});
  }
  // Largest first; ties keep key order.
  std::stable_sort(fields.begin(), fields.end(), [](const Field& a, const Field& b) { return a.size > b.size; });

  const size_t available = MAX_TRANSACTION_SIZE - NEXUS_BASE_TRANSACTION_SIZE;
  size_t required = 0;
  for (const auto& f : fields) required += f.size;
  if (required <= available) return std::vector<std::string>{};

  std::vector<std::string> remote;
  for (const auto& f : fields) {
    const auto* arr = jsonlite::as_array(*f.value);
    const size_t storage_cost = arr ? WALRUS_BLOB_ID_LENGTH * arr->size() : WALRUS_BLOB_ID_LENGTH;
    required = (required > f.size ? required - f.size : 0) + storage_cost;
    remote.push_back(*f.key);
    if (required <= available) break;
  }
  if (required > available) {
    set_error(error, ErrorCode::nexus_data_invalid_field,
              "Cannot fit data within max transaction size, even after storing all fields remotely");
    return std::nullopt;
  }
  return remote;
}

}  // namespace nexus

/**
 * @file Protocol.cpp
 * @brief CORE:Protocol - Broadcast decoder and encoder implementation
 */

#include "Protocol.h"
#include <cstring>

namespace PBScan {

namespace {
constexpr uint8_t TYPE_SHIFT = 5;
constexpr uint8_t LEN_MASK = 0x1F;
constexpr uint8_t MAX_INLINE_LEN = LEN_MASK;
constexpr uint8_t COMPANY_ID_LO = PBSCAN_COMPANY_ID & 0xFF;
constexpr uint8_t COMPANY_ID_HI = (PBSCAN_COMPANY_ID >> 8) & 0xFF;

enum WireType : uint8_t {
  T_SINGLE = 0,
  T_TRUE = 1,
  T_FALSE = 2,
  T_INT = 3,
  T_FLOAT = 4,
  T_STR = 5,
  T_BYTES = 6,
  T_LIST = 7
};

struct Cursor {
  const uint8_t *data;
  size_t pos;
  size_t end;
};

struct Writer {
  uint8_t *buf;
  size_t max;
  size_t pos;

  bool put(uint8_t b) {
    if (pos >= max)
      return false;
    buf[pos++] = b;
    return true;
  }

  bool put(const uint8_t *src, size_t len) {
    if (pos + len > max)
      return false;
    if (len > 0)
      std::memcpy(buf + pos, src, len);
    pos += len;
    return true;
  }
};

bool isValidUtf8(const uint8_t *s, size_t len) {
  size_t i = 0;
  while (i < len) {
    uint8_t c = s[i];
    size_t extra;
    uint32_t cp;

    if (c < 0x80) {
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }

    if (i + extra >= len)
      return false;

    for (size_t k = 1; k <= extra; k++) {
      uint8_t cc = s[i + k];
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }

    // Overlong forms, surrogates, out of range
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF))
      return false;

    i += extra + 1;
  }
  return true;
}

uint32_t readLE(const uint8_t *p, uint8_t len) {
  uint32_t v = 0;
  for (uint8_t i = 0; i < len; i++) {
    v |= (uint32_t)p[i] << (8 * i);
  }
  return v;
}

bool decodeOne(Cursor &c, Value &out, uint8_t depth) {
  uint8_t header;

  // SINGLE_OBJECT markers carry no data, step over them in place
  do {
    if (c.pos >= c.end)
      return false;
    header = c.data[c.pos++];
  } while (header == 0x00);

  const uint8_t type = header >> TYPE_SHIFT;
  const uint8_t len = header & LEN_MASK;

  switch (type) {
  case T_TRUE:
  case T_FALSE:
    if (len != 0)
      return false;
    out = Value::makeBool(type == T_TRUE);
    return true;

  case T_INT: {
    if (len != 1 && len != 2 && len != 4)
      return false;
    if (c.pos + len > c.end)
      return false;
    uint32_t raw = readLE(c.data + c.pos, len);
    int32_t v;
    if (len == 1)
      v = (int8_t)raw;
    else if (len == 2)
      v = (int16_t)raw;
    else
      v = (int32_t)raw;
    c.pos += len;
    out = Value::makeInt(v);
    return true;
  }

  case T_FLOAT: {
    if (len != 4 || c.pos + 4 > c.end)
      return false;
    uint32_t raw = readLE(c.data + c.pos, 4);
    float f;
    std::memcpy(&f, &raw, sizeof(f));
    c.pos += 4;
    out = Value::makeFloat(f);
    return true;
  }

  case T_STR:
    if (c.pos + len > c.end)
      return false;
    if (!isValidUtf8(c.data + c.pos, len))
      return false;
    out = Value::makeStr(
        std::string(reinterpret_cast<const char *>(c.data + c.pos), len));
    c.pos += len;
    return true;

  case T_BYTES:
    if (c.pos + len > c.end)
      return false;
    out = Value::makeBytes(
        std::vector<uint8_t>(c.data + c.pos, c.data + c.pos + len));
    c.pos += len;
    return true;

  case T_SINGLE: // len > 0 here: nested tuple
  case T_LIST: {
    if (depth >= PBSCAN_MAX_NESTING)
      return false;
    if (c.pos + len > c.end)
      return false;

    out = (type == T_LIST) ? Value::makeList() : Value::makeTuple();
    Cursor inner = {c.data, c.pos, c.pos + len};
    while (inner.pos < inner.end) {
      Value item;
      if (!decodeOne(inner, item, depth + 1))
        return false;
      out.items.push_back(std::move(item));
    }
    c.pos = inner.end;
    return true;
  }

  default:
    return false;
  }
}

bool encodeOne(const Value &value, Writer &w, uint8_t depth) {
  switch (value.type) {
  case ValueType::BOOL:
    return w.put(value.boolVal ? (T_TRUE << TYPE_SHIFT)
                               : (T_FALSE << TYPE_SHIFT));

  case ValueType::INT: {
    int32_t v = value.intVal;
    uint8_t width = 4;
    if (v >= -128 && v <= 127)
      width = 1;
    else if (v >= -32768 && v <= 32767)
      width = 2;

    if (!w.put((T_INT << TYPE_SHIFT) | width))
      return false;
    uint32_t raw = (uint32_t)v;
    for (uint8_t i = 0; i < width; i++) {
      if (!w.put((raw >> (8 * i)) & 0xFF))
        return false;
    }
    return true;
  }

  case ValueType::FLOAT: {
    uint32_t raw;
    std::memcpy(&raw, &value.floatVal, sizeof(raw));
    if (!w.put((T_FLOAT << TYPE_SHIFT) | 4))
      return false;
    for (uint8_t i = 0; i < 4; i++) {
      if (!w.put((raw >> (8 * i)) & 0xFF))
        return false;
    }
    return true;
  }

  case ValueType::STR:
    if (value.strVal.size() > MAX_INLINE_LEN)
      return false;
    return w.put((T_STR << TYPE_SHIFT) | (uint8_t)value.strVal.size()) &&
           w.put(reinterpret_cast<const uint8_t *>(value.strVal.data()),
                 value.strVal.size());

  case ValueType::BYTES:
    if (value.bytesVal.size() > MAX_INLINE_LEN)
      return false;
    return w.put((T_BYTES << TYPE_SHIFT) | (uint8_t)value.bytesVal.size()) &&
           w.put(value.bytesVal.data(), value.bytesVal.size());

  case ValueType::LIST:
  case ValueType::TUPLE: {
    if (depth >= PBSCAN_MAX_NESTING)
      return false;

    const size_t headerPos = w.pos;
    if (!w.put(0))
      return false;
    for (const Value &item : value.items) {
      if (!encodeOne(item, w, depth + 1))
        return false;
    }

    const size_t bodyLen = w.pos - headerPos - 1;
    if (bodyLen > MAX_INLINE_LEN)
      return false;
    // 0x00 alone is the SINGLE_OBJECT marker, so nested empty tuples have
    // no encoding
    if (value.type == ValueType::TUPLE && bodyLen == 0)
      return false;

    const uint8_t type = (value.type == ValueType::LIST) ? T_LIST : T_SINGLE;
    w.buf[headerPos] = (type << TYPE_SHIFT) | (uint8_t)bodyLen;
    return true;
  }
  }
  return false;
}

} // namespace

DecodeStatus Protocol::decode(const RawEvent &event, DecodeResult &out) {
  size_t len = event.length;
  if (len > PBSCAN_MAX_PAYLOAD)
    len = PBSCAN_MAX_PAYLOAD;
  return decode(event.payload, len, out);
}

DecodeStatus Protocol::decode(const uint8_t *data, size_t len,
                              DecodeResult &out) {
  out = DecodeResult();

  const uint8_t *mfr = nullptr;
  size_t mfrLen = 0;

  // Single walk over the AD elements: [len][type][len-1 bytes]
  size_t i = 0;
  while (i < len) {
    const uint8_t elemLen = data[i];
    if (elemLen == 0)
      break;

    if (i + 1 + elemLen > len) {
      out = DecodeResult();
      out.status = DecodeStatus::MALFORMED;
      return out.status;
    }

    const uint8_t adType = data[i + 1];
    const uint8_t *body = data + i + 2;
    const size_t bodyLen = elemLen - 1;

    if (adType == PBSCAN_AD_TYPE_MANUFACTURER) {
      if (!mfr && bodyLen >= 2 && body[0] == COMPANY_ID_LO &&
          body[1] == COMPANY_ID_HI) {
        mfr = body + 2;
        mfrLen = bodyLen - 2;
      }
    } else if (adType == PBSCAN_AD_TYPE_COMPLETE_NAME ||
               adType == PBSCAN_AD_TYPE_SHORT_NAME) {
      const bool complete = adType == PBSCAN_AD_TYPE_COMPLETE_NAME;
      // Complete name wins over a shortened one
      if (bodyLen > 0 && (!out.hasName || (complete && !out.nameComplete)) &&
          isValidUtf8(body, bodyLen)) {
        out.name.assign(reinterpret_cast<const char *>(body), bodyLen);
        out.hasName = true;
        out.nameComplete = complete;
      }
    }

    i += 1 + elemLen;
  }

  // Need a channel byte plus at least one value header
  if (!mfr || mfrLen < 2) {
    out.status = DecodeStatus::FOREIGN;
    return out.status;
  }

  // Channel is a single unsigned byte (0-255)
  out.channel = mfr[0];

  if (!decodeValue(mfr + 1, mfrLen - 1, out.value)) {
    out.value = Value();
    out.status = DecodeStatus::MALFORMED;
    return out.status;
  }

  out.status = DecodeStatus::DECODED;
  return out.status;
}

bool Protocol::decodeValue(const uint8_t *data, size_t len, Value &out) {
  if (len == 0)
    return false;

  Cursor c = {data, 0, len};

  if (data[0] == (T_SINGLE << TYPE_SHIFT)) {
    if (!decodeOne(c, out, 0))
      return false;
    return c.pos == c.end;
  }

  out = Value::makeTuple();
  while (c.pos < c.end) {
    Value item;
    if (!decodeOne(c, item, 1))
      return false;
    out.items.push_back(std::move(item));
  }
  return true;
}

bool Protocol::containsCompanyId(const uint8_t *data, size_t len) {
  for (size_t i = 0; i + 1 < len; i++) {
    if (data[i] == COMPANY_ID_LO && data[i + 1] == COMPANY_ID_HI)
      return true;
  }
  return false;
}

size_t Protocol::encodeValue(const Value &value, uint8_t *outBuffer,
                             size_t maxLen) {
  Writer w = {outBuffer, maxLen, 0};

  if (value.type == ValueType::TUPLE) {
    if (value.items.empty())
      return 0;
    for (const Value &item : value.items) {
      if (!encodeOne(item, w, 1))
        return 0;
    }
    return w.pos;
  }

  if (!w.put(T_SINGLE << TYPE_SHIFT) || !encodeOne(value, w, 0))
    return 0;
  return w.pos;
}

std::vector<uint8_t> Protocol::buildAdvertisement(uint8_t channel,
                                                  const Value &value,
                                                  const std::string &name) {
  uint8_t body[PBSCAN_AD_UNIT_MAX];
  size_t bodyLen = encodeValue(value, body, sizeof(body));
  if (bodyLen == 0)
    return {};

  std::vector<uint8_t> out;
  out.reserve(PBSCAN_AD_UNIT_MAX);

  if (!name.empty()) {
    out.push_back((uint8_t)(name.size() + 1));
    out.push_back(PBSCAN_AD_TYPE_COMPLETE_NAME);
    out.insert(out.end(), name.begin(), name.end());
  }

  out.push_back((uint8_t)(bodyLen + 4));
  out.push_back(PBSCAN_AD_TYPE_MANUFACTURER);
  out.push_back(COMPANY_ID_LO);
  out.push_back(COMPANY_ID_HI);
  out.push_back(channel);
  out.insert(out.end(), body, body + bodyLen);

  if (out.size() > PBSCAN_AD_UNIT_MAX)
    return {};
  return out;
}

std::vector<uint8_t> Protocol::buildScanResponse(const std::string &name,
                                                 bool complete) {
  std::vector<uint8_t> out;
  if (name.empty() || name.size() + 2 > PBSCAN_AD_UNIT_MAX)
    return out;

  out.push_back((uint8_t)(name.size() + 1));
  out.push_back(complete ? PBSCAN_AD_TYPE_COMPLETE_NAME
                         : PBSCAN_AD_TYPE_SHORT_NAME);
  out.insert(out.end(), name.begin(), name.end());
  return out;
}

} // namespace PBScan

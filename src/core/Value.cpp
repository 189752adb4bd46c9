/**
 * @file Value.cpp
 * @brief CORE:Types - Value construction, comparison and formatting
 */

#include "Types.h"
#include <cstdio>
#include <cstring>

namespace PBScan {

Value Value::makeInt(int32_t v) {
  Value out;
  out.type = ValueType::INT;
  out.intVal = v;
  return out;
}

Value Value::makeFloat(float v) {
  Value out;
  out.type = ValueType::FLOAT;
  out.floatVal = v;
  return out;
}

Value Value::makeBool(bool v) {
  Value out;
  out.type = ValueType::BOOL;
  out.boolVal = v;
  return out;
}

Value Value::makeStr(const std::string &v) {
  Value out;
  out.type = ValueType::STR;
  out.strVal = v;
  return out;
}

Value Value::makeBytes(const std::vector<uint8_t> &v) {
  Value out;
  out.type = ValueType::BYTES;
  out.bytesVal = v;
  return out;
}

Value Value::makeList(const std::vector<Value> &v) {
  Value out;
  out.type = ValueType::LIST;
  out.items = v;
  return out;
}

Value Value::makeTuple(const std::vector<Value> &v) {
  Value out;
  out.type = ValueType::TUPLE;
  out.items = v;
  return out;
}

bool Value::operator==(const Value &other) const {
  if (type != other.type)
    return false;

  switch (type) {
  case ValueType::INT:
    return intVal == other.intVal;
  case ValueType::FLOAT:
    // Bit compare: identical encodings dedup, NaN included
    return std::memcmp(&floatVal, &other.floatVal, sizeof(float)) == 0;
  case ValueType::BOOL:
    return boolVal == other.boolVal;
  case ValueType::STR:
    return strVal == other.strVal;
  case ValueType::BYTES:
    return bytesVal == other.bytesVal;
  case ValueType::LIST:
  case ValueType::TUPLE:
    if (items.size() != other.items.size())
      return false;
    for (size_t i = 0; i < items.size(); i++) {
      if (items[i] != other.items[i])
        return false;
    }
    return true;
  }
  return false;
}

std::string Value::toString() const {
  std::string out;
  appendTo(out, false);
  return out;
}

void Value::appendTo(std::string &out, bool nested) const {
  char buf[32];

  switch (type) {
  case ValueType::INT:
    snprintf(buf, sizeof(buf), "%ld", (long)intVal);
    out += buf;
    break;
  case ValueType::FLOAT:
    snprintf(buf, sizeof(buf), "%.6g", (double)floatVal);
    out += buf;
    break;
  case ValueType::BOOL:
    out += boolVal ? "True" : "False";
    break;
  case ValueType::STR:
    if (nested) {
      out += '\'';
      out += strVal;
      out += '\'';
    } else {
      out += strVal;
    }
    break;
  case ValueType::BYTES: {
    static const char HEX_CHARS[] = "0123456789abcdef";
    out.reserve(out.size() + bytesVal.size() * 2);
    for (uint8_t b : bytesVal) {
      out += HEX_CHARS[b >> 4];
      out += HEX_CHARS[b & 0x0F];
    }
    break;
  }
  case ValueType::LIST:
  case ValueType::TUPLE: {
    const bool list = type == ValueType::LIST;
    out += list ? '[' : '(';
    for (size_t i = 0; i < items.size(); i++) {
      if (i > 0)
        out += ", ";
      items[i].appendTo(out, true);
    }
    if (!list && items.size() == 1)
      out += ',';
    out += list ? ']' : ')';
    break;
  }
  }
}

std::string formatAddress(const Address &address) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X", address[0],
           address[1], address[2], address[3], address[4], address[5]);
  return std::string(buf);
}

} // namespace PBScan

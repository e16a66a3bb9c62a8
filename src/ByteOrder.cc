#include "ByteOrder.hh"

#include <strings.h>

#include <format>
#include <stdexcept>

#include "Types.hh"

using namespace std;

template <>
const char* phosg::name_for_enum<Endianness>(Endianness e) {
  switch (e) {
    case Endianness::BIG:
      return "big";
    case Endianness::LITTLE:
      return "little";
  }
  throw logic_error("invalid endianness");
}

template <>
Endianness phosg::enum_for_name<Endianness>(const char* name) {
  if (!strcasecmp(name, "big") || !strcasecmp(name, "be")) {
    return Endianness::BIG;
  } else if (!strcasecmp(name, "little") || !strcasecmp(name, "le")) {
    return Endianness::LITTLE;
  } else {
    throw invalid_argument(std::format("incorrect endianness name: {}", name));
  }
}

uint16_t read_u16(const void* data, size_t offset, Endianness e) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data) + offset;
  if (e == Endianness::BIG) {
    return reinterpret_cast<const be_uint16_t*>(bytes)->load();
  } else {
    return reinterpret_cast<const le_uint16_t*>(bytes)->load();
  }
}

void write_u16(void* data, size_t offset, uint16_t value, Endianness e) {
  uint8_t* bytes = reinterpret_cast<uint8_t*>(data) + offset;
  if (e == Endianness::BIG) {
    *reinterpret_cast<be_uint16_t*>(bytes) = value;
  } else {
    *reinterpret_cast<le_uint16_t*>(bytes) = value;
  }
}

uint32_t read_u24(const void* data, size_t offset, Endianness e) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(data) + offset;
  if (e == Endianness::BIG) {
    return (static_cast<uint32_t>(bytes[0]) << 16) |
        (static_cast<uint32_t>(bytes[1]) << 8) |
        static_cast<uint32_t>(bytes[2]);
  } else {
    return (static_cast<uint32_t>(bytes[2]) << 16) |
        (static_cast<uint32_t>(bytes[1]) << 8) |
        static_cast<uint32_t>(bytes[0]);
  }
}

void write_u24(void* data, size_t offset, uint32_t value, Endianness e) {
  uint8_t* bytes = reinterpret_cast<uint8_t*>(data) + offset;
  value &= 0xFFFFFF;
  if (e == Endianness::BIG) {
    bytes[0] = (value >> 16) & 0xFF;
    bytes[1] = (value >> 8) & 0xFF;
    bytes[2] = value & 0xFF;
  } else {
    bytes[0] = value & 0xFF;
    bytes[1] = (value >> 8) & 0xFF;
    bytes[2] = (value >> 16) & 0xFF;
  }
}

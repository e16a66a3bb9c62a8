#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/Types.hh>
#include <string>

enum class Endianness {
  BIG = 0,
  LITTLE = 1,
};

template <>
const char* phosg::name_for_enum<Endianness>(Endianness e);
template <>
Endianness phosg::enum_for_name<Endianness>(const char* name);

// These functions do not check bounds; the caller must ensure that
// offset + width <= size before calling them.

uint16_t read_u16(const void* data, size_t offset, Endianness e);
void write_u16(void* data, size_t offset, uint16_t value, Endianness e);

// 24-bit values use the same byte ordering rule as 16-bit values, extended to
// three bytes. write_u24 ignores the high 8 bits of value.
uint32_t read_u24(const void* data, size_t offset, Endianness e);
void write_u24(void* data, size_t offset, uint32_t value, Endianness e);

inline uint16_t read_u16(const std::string& data, size_t offset, Endianness e) {
  return read_u16(data.data(), offset, e);
}
inline void write_u16(std::string& data, size_t offset, uint16_t value, Endianness e) {
  write_u16(data.data(), offset, value, e);
}
inline uint32_t read_u24(const std::string& data, size_t offset, Endianness e) {
  return read_u24(data.data(), offset, e);
}
inline void write_u24(std::string& data, size_t offset, uint32_t value, Endianness e) {
  write_u24(data.data(), offset, value, e);
}

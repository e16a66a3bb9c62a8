#pragma once

#include <stddef.h>
#include <stdint.h>

#include <phosg/Encoding.hh>
#include <stdexcept>
#include <type_traits>

#define __packed__ __attribute__((packed))
#define check_struct_size(StructT, Size)                                 \
  static_assert(sizeof(StructT) >= Size, "Structure size is too small"); \
  static_assert(sizeof(StructT) <= Size, "Structure size is too large")

using le_uint16_t = phosg::le_uint16_t;
using be_uint16_t = phosg::be_uint16_t;

template <bool BE>
using U16T = typename std::conditional<BE, be_uint16_t, le_uint16_t>::type;

// Packed array for use in save record structs. Elements are never
// initialized; these structs are only ever overlaid onto existing save data.

template <typename ItemT, size_t Count>
struct parray {
  ItemT items[Count];

  ItemT& operator[](size_t index) {
    if (index >= Count) {
      throw std::out_of_range("array index out of bounds");
    }
    return *&this->items[index];
  }
  const ItemT& operator[](size_t index) const {
    if (index >= Count) {
      throw std::out_of_range("array index out of bounds");
    }
    return *&this->items[index];
  }

  void clear(ItemT v) {
    for (size_t x = 0; x < Count; x++) {
      this->items[x] = v;
    }
  }
} __packed__;

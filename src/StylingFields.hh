#pragma once

#include <stddef.h>

#include <phosg/JSON.hh>
#include <string>
#include <vector>

constexpr size_t STYLING_BLOCK_SIZE = 45;

struct StylingField {
  std::string key;
  size_t sub_offset;
};

// The list of named single-byte fields in the avatar styling block. The list
// is validated once at construction time: keys must be unique and nonempty,
// and every sub-offset must be inside the styling block.
class StylingFieldList {
public:
  StylingFieldList(); // Built-in field list
  explicit StylingFieldList(std::vector<StylingField> fields);
  // Expects a list of [key, sub_offset] pairs
  explicit StylingFieldList(const phosg::JSON& json);

  phosg::JSON json() const;

  inline const std::vector<StylingField>& all() const {
    return this->fields;
  }
  inline size_t size() const {
    return this->fields.size();
  }

protected:
  std::vector<StylingField> fields;

  void validate() const;
};

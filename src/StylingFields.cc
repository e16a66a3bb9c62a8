#include "StylingFields.hh"

#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std;

StylingFieldList::StylingFieldList()
    : fields({
          {"Gender", 0x00},
          {"FaceShape", 0x02},
          {"SkinTone", 0x04},
          {"HairStyle", 0x06},
          {"HairColor", 0x08},
          {"EyeShape", 0x0A},
          {"EyeColor", 0x0C},
          {"Eyebrows", 0x0E},
          {"Mouth", 0x10},
          {"FacePaint", 0x12},
          {"Headwear", 0x14},
          {"HeadwearColor", 0x16},
          {"Eyewear", 0x18},
          {"Top", 0x1A},
          {"TopColor", 0x1C},
          {"Bottom", 0x1E},
          {"BottomColor", 0x20},
          {"Gloves", 0x22},
          {"Shoes", 0x24},
          {"ShoesColor", 0x26},
          {"Accessory", 0x28},
          {"AccessoryColor", 0x2A},
          {"Pose", 0x2C}, // Last byte of the block; has no padding byte
      }) {
  this->validate();
}

StylingFieldList::StylingFieldList(vector<StylingField> fields)
    : fields(std::move(fields)) {
  this->validate();
}

StylingFieldList::StylingFieldList(const phosg::JSON& json) {
  for (const auto& it : json.as_list()) {
    const auto& l = it->as_list();
    if (l.size() != 2) {
      throw runtime_error("styling field entries must be [key, sub_offset] pairs");
    }
    int64_t sub_offset = l[1]->as_int();
    if (sub_offset < 0) {
      throw runtime_error(std::format("styling field {} has a negative sub-offset", l[0]->as_string()));
    }
    this->fields.emplace_back(StylingField{l[0]->as_string(), static_cast<size_t>(sub_offset)});
  }
  this->validate();
}

void StylingFieldList::validate() const {
  unordered_set<string> seen_keys;
  for (const auto& field : this->fields) {
    if (field.key.empty()) {
      throw runtime_error("styling field key is empty");
    }
    if (!seen_keys.emplace(field.key).second) {
      throw runtime_error(std::format("styling field {} is defined multiple times", field.key));
    }
    if (field.sub_offset >= STYLING_BLOCK_SIZE) {
      throw runtime_error(std::format(
          "styling field {} sub-offset 0x{:X} is outside the styling block", field.key, field.sub_offset));
    }
  }
}

phosg::JSON StylingFieldList::json() const {
  auto ret = phosg::JSON::list();
  for (const auto& field : this->fields) {
    auto entry = phosg::JSON::list();
    entry.emplace_back(field.key);
    entry.emplace_back(field.sub_offset);
    ret.emplace_back(std::move(entry));
  }
  return ret;
}

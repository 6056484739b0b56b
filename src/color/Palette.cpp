#include "Palette.hpp"

namespace muxcore {
namespace {
vector<optional<RgbColor>> flatten(const Palette& palette) {
  vector<optional<RgbColor>> slots;
  Palette::forEachSlot(palette,
                       [&](const string& name, const optional<RgbColor>& slot) {
                         slots.push_back(slot);
                       });
  return slots;
}
}  // namespace

Palette Palette::overlay(const Palette& base, const Palette& top) {
  Palette result = base;
  auto topSlots = flatten(top);
  size_t a = 0;
  forEachSlot(result, [&](const string& name, optional<RgbColor>& slot) {
    if (topSlots[a]) {
      slot = topSlots[a];
    }
    a++;
  });
  return result;
}

bool Palette::isComplete() const { return missingSlots().empty(); }

vector<string> Palette::missingSlots() const {
  vector<string> missing;
  forEachSlot(*this, [&](const string& name, const optional<RgbColor>& slot) {
    if (!slot) {
      missing.push_back(name);
    }
  });
  return missing;
}

int Palette::definedSlotCount() const {
  int count = 0;
  forEachSlot(*this, [&](const string& name, const optional<RgbColor>& slot) {
    if (slot) {
      count++;
    }
  });
  return count;
}

optional<RgbColor> Palette::getSlot(const string& slot) const {
  optional<RgbColor> retval;
  bool found = false;
  forEachSlot(*this, [&](const string& name, const optional<RgbColor>& value) {
    if (name == slot) {
      retval = value;
      found = true;
    }
  });
  if (!found) {
    throw std::runtime_error("Unknown color slot: " + slot);
  }
  return retval;
}

void Palette::setSlot(const string& slot, const RgbColor& color) {
  bool found = false;
  forEachSlot(*this, [&](const string& name, optional<RgbColor>& value) {
    if (name == slot) {
      value = color;
      found = true;
    }
  });
  if (!found) {
    throw std::runtime_error("Unknown color slot: " + slot);
  }
}

const vector<string>& Palette::slotNames() {
  static const vector<string> names = []() {
    vector<string> retval;
    Palette empty;
    forEachSlot(empty, [&](const string& name, const optional<RgbColor>&) {
      retval.push_back(name);
    });
    return retval;
  }();
  return names;
}

bool Palette::operator==(const Palette& other) const {
  return flatten(*this) == flatten(other);
}

void to_json(json& j, const Palette& palette) {
  j = json::object();
  Palette::forEachSlot(
      palette, [&](const string& name, const optional<RgbColor>& slot) {
        if (slot) {
          j[json::json_pointer("/" + name)] = slot->toHexString();
        }
      });
}

void from_json(const json& j, Palette& palette) {
  if (!j.is_object()) {
    throw std::runtime_error("A palette must be a JSON object");
  }
  Palette::forEachSlot(palette, [&](const string& name,
                                    optional<RgbColor>& slot) {
    json::json_pointer pointer("/" + name);
    if (!j.contains(pointer) || j.at(pointer).is_null()) {
      return;
    }
    const json& value = j.at(pointer);
    if (!value.is_string()) {
      throw std::runtime_error("Color slot " + name + " must be a string");
    }
    slot = RgbColor::parse(value.get<string>());
  });
}

}  // namespace muxcore

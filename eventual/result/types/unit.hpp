#pragma once

namespace eventual {

// Value of a computation that produces nothing

struct Unit {
  bool operator==(const Unit&) const = default;
};

}  // namespace eventual

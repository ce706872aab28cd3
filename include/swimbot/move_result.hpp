#pragma once
#include <swimbot/state.hpp>

namespace swimbot {

enum class MoveStatus : int {
  Ok = 0,
  JointOutOfLimits = 1, // a joint was already outside its limits before the step
  NonFiniteResult = 2   // singular configuration: the field blew up
};

inline const char* to_string(MoveStatus s) {
  switch (s) {
    case MoveStatus::Ok:               return "ok";
    case MoveStatus::JointOutOfLimits: return "joint out of limits";
    case MoveStatus::NonFiniteResult:  return "non-finite result";
  }
  return "unknown";
}

struct MoveResult {
  MoveStatus status = MoveStatus::Ok;
  JointAngles joints{};  // joint angles after the call (unchanged on failure)
  bool ok() const { return status == MoveStatus::Ok; }
};

} // namespace swimbot

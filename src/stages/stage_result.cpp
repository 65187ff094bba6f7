#include "stages/stage_result.hpp"

namespace binpost::stages {

const char* ToString(StageId stage) {
  switch (stage) {
  case StageId::kArchive:
    return "archive";
  case StageId::kParity:
    return "parity";
  case StageId::kTransmit:
    return "transmit";
  }
  return "archive";
}

const char* ToString(StageStatus status) {
  switch (status) {
  case StageStatus::kSucceeded:
    return "succeeded";
  case StageStatus::kSkipped:
    return "skipped";
  case StageStatus::kFailed:
    return "failed";
  }
  return "failed";
}

} // namespace binpost::stages

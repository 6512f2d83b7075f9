#include "spockscan/results/iteration_result.hpp"

namespace spockscan::results {

auto ToString(IterationStatus status) -> const char* {
  switch (status) {
    case IterationStatus::kPassed:
      return "PASSED";
    case IterationStatus::kFailed:
      return "FAILED";
    case IterationStatus::kSkipped:
      return "SKIPPED";
  }
  return "FAILED";
}

}  // namespace spockscan::results

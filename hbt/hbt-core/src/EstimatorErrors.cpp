#include "hbt-core/src/EstimatorErrors.hpp"

namespace hbt_core
{

const char* toString(EventRejection reason)
{
  switch (reason)
  {
    case EventRejection::NegativeAmount:
      return "negative amount";
    case EventRejection::NonFiniteAmount:
      return "non-finite amount";
    case EventRejection::UnparsableTimestamp:
      return "unparsable timestamp";
  }
  return "unknown";
}

}  // namespace hbt_core

#pragma once

#include <memory>

#include <google/protobuf/repeated_field.h>

#include "internal/trigger/state_source.hpp"
#include "internal/util/time.hpp"
#include "routine/manager/v1/routine.pb.h"

namespace routine::core {

/*
  Routine conditions -> bool.

  Conjunction over the list, short-circuiting on the first false; an
  empty list passes. time_range reads the clock's local hour,
  state_check/comparison read through the state source. custom
  conditions throw util::Unsupported.
*/
class ConditionEvaluator {
 public:
  // state_source may be null; state conditions then throw util::Unsupported.
  ConditionEvaluator(std::shared_ptr<const util::ClockSource> clock, std::shared_ptr<trigger::StateSource> state_source);

  bool Evaluate(const google::protobuf::RepeatedPtrField<manager::v1::Condition>& conditions) const;

  bool EvaluateOne(const manager::v1::Condition& condition) const;

 private:
  bool EvaluateTimeRange(const manager::v1::TimeRangeCondition& condition) const;
  bool EvaluateStateCheck(const manager::v1::StateCheckCondition& condition) const;
  bool EvaluateComparison(const manager::v1::ComparisonCondition& condition) const;

  google::protobuf::Value Observe(const std::string& service, const std::string& entity, const std::string& property) const;

  std::shared_ptr<const util::ClockSource> clock_;
  std::shared_ptr<trigger::StateSource>    state_source_;
};

} // namespace routine::core

#include "internal/core/condition_evaluator.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routine::core {
namespace {

namespace v1 = routine::manager::v1;
using google::protobuf::Value;

std::optional<double> AsNumber(const Value& value) {
  switch (value.kind_case()) {
    case Value::kNumberValue:
      return value.number_value();
    case Value::kStringValue: {
      const auto& text = value.string_value();
      if (text.empty()) return std::nullopt;
      char*  end    = nullptr;
      double parsed = std::strtod(text.c_str(), &end);
      if (end && *end == '\0') return parsed;
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

bool Matches(const Value& observed, const Value& expected) {
  const auto observed_json = util::ValueToJson(observed);
  const auto expected_json = util::ValueToJson(expected);
  if (observed_json == expected_json) return true;

  // Home Assistant reports every state as a string ("21", "true").
  if (observed.kind_case() == Value::kStringValue &&
      (expected.kind_case() == Value::kNumberValue || expected.kind_case() == Value::kBoolValue)) {
    if (auto lhs = AsNumber(observed), rhs = AsNumber(expected); lhs && rhs) return *lhs == *rhs;
    return observed.string_value() == expected_json;
  }
  return false;
}

} // namespace

ConditionEvaluator::ConditionEvaluator(std::shared_ptr<const util::ClockSource> clock, std::shared_ptr<trigger::StateSource> state_source)
    : clock_(std::move(clock)), state_source_(std::move(state_source)) {
  if (!clock_) {
    throw std::invalid_argument("ConditionEvaluator: clock is null");
  }
}

bool ConditionEvaluator::Evaluate(const google::protobuf::RepeatedPtrField<v1::Condition>& conditions) const {
  for (const auto& condition : conditions) {
    if (!EvaluateOne(condition)) {
      return false;
    }
  }
  return true;
}

bool ConditionEvaluator::EvaluateOne(const v1::Condition& condition) const {
  switch (condition.kind_case()) {
    case v1::Condition::kTimeRange:
      return EvaluateTimeRange(condition.time_range());
    case v1::Condition::kStateCheck:
      return EvaluateStateCheck(condition.state_check());
    case v1::Condition::kComparison:
      return EvaluateComparison(condition.comparison());
    case v1::Condition::kCustom:
      throw util::Unsupported("Unsupported condition type: custom");
    case v1::Condition::KIND_NOT_SET:
      break;
  }

  ROUTINE_LOG_WARN("Condition has no type, treating as passed");
  return true;
}

bool ConditionEvaluator::EvaluateTimeRange(const v1::TimeRangeCondition& condition) const {
  if (!condition.has_start_hour() || !condition.has_end_hour()) {
    return true;
  }

  // [start, end) with no wrap past midnight
  const int hour = util::LocalHour(clock_->Now());
  return hour >= condition.start_hour() && hour < condition.end_hour();
}

bool ConditionEvaluator::EvaluateStateCheck(const v1::StateCheckCondition& condition) const {
  return Matches(Observe(condition.service(), condition.entity(), condition.property()), condition.equals());
}

bool ConditionEvaluator::EvaluateComparison(const v1::ComparisonCondition& condition) const {
  auto observed = AsNumber(Observe(condition.service(), condition.entity(), condition.property()));
  if (!observed) {
    return false;
  }

  const double lhs = *observed;
  const double rhs = condition.value();
  switch (condition.op()) {
    case v1::COMPARISON_OPERATOR_EQ:
      return lhs == rhs;
    case v1::COMPARISON_OPERATOR_NE:
      return lhs != rhs;
    case v1::COMPARISON_OPERATOR_GT:
      return lhs > rhs;
    case v1::COMPARISON_OPERATOR_GTE:
      return lhs >= rhs;
    case v1::COMPARISON_OPERATOR_LT:
      return lhs < rhs;
    case v1::COMPARISON_OPERATOR_LTE:
      return lhs <= rhs;
    default:
      throw util::ValidationError("Comparison condition has no operator");
  }
}

Value ConditionEvaluator::Observe(const std::string& service, const std::string& entity, const std::string& property) const {
  if (!service.empty() && service != "homeassistant") {
    throw util::Unsupported("Unsupported state provider: " + service);
  }
  if (entity.empty()) {
    throw util::ValidationError("State condition requires an entity");
  }
  if (!state_source_) {
    throw util::Unsupported("No state source configured");
  }
  return trigger::ObservedValue(state_source_->GetState(entity), property);
}

} // namespace routine::core

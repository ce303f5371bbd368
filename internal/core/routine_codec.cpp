#include "internal/core/routine_codec.hpp"

#include <stdexcept>
#include <unordered_set>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace routine::core {
namespace {

namespace v1 = routine::manager::v1;
using google::protobuf::Struct;
using google::protobuf::Value;

constexpr const char* kName          = "routineName";
constexpr const char* kDescription   = "routineDescription";
constexpr const char* kEnabled       = "routineEnabled";
constexpr const char* kCount         = "routineExecutionCount";
constexpr const char* kTrigger       = "routineTrigger";
constexpr const char* kConditions    = "routineConditions";
constexpr const char* kActions       = "routineActions";
constexpr const char* kTags          = "routineTags";
constexpr const char* kCreatedFrom   = "routineCreatedFromTask";
constexpr const char* kCreatedAt     = "createdAt";
constexpr const char* kLastExecuted  = "lastExecuted";
constexpr const char* kUntitled      = "Untitled Routine";

template <typename T>
std::string EncodeList(const google::protobuf::RepeatedPtrField<T>& items) {
  std::string out   = "[";
  bool        first = true;
  for (const auto& item : items) {
    if (!first) out += ",";
    first = false;
    out += util::ToJson(item);
  }
  out += "]";
  return out;
}

template <typename T>
void DecodeList(const std::string& json, google::protobuf::RepeatedPtrField<T>* out) {
  auto value = util::ParseJsonValue(json.empty() ? "[]" : json);
  if (value.kind_case() != Value::kListValue) {
    throw std::runtime_error("expected a JSON array, got: " + json);
  }
  for (const auto& item : value.list_value().values()) {
    util::FromJson(util::ValueToJson(item), out->Add());
  }
}

const Value* Find(const Struct& metadata, const char* key) {
  auto it = metadata.fields().find(std::string(key));
  return it == metadata.fields().end() ? nullptr : &it->second;
}

std::string GetString(const Struct& metadata, const char* key, const std::string& fallback = {}) {
  const auto* value = Find(metadata, key);
  if (!value || value->kind_case() != Value::kStringValue) return fallback;
  return value->string_value();
}

Value StringValue(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value NullValue() {
  Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

} // namespace

Struct EncodeMetadata(const v1::Routine& routine) {
  Struct metadata;
  auto&  fields = *metadata.mutable_fields();

  fields[kName]        = StringValue(routine.name());
  fields[kDescription] = StringValue(routine.description());
  fields[kEnabled].set_bool_value(routine.enabled());
  fields[kCount].set_number_value(static_cast<double>(routine.execution_count()));
  fields[kTrigger]    = StringValue(util::ToJson(routine.trigger()));
  fields[kConditions] = StringValue(EncodeList(routine.conditions()));
  fields[kActions]    = StringValue(EncodeList(routine.actions()));

  auto* tags = fields[kTags].mutable_list_value();
  for (const auto& tag : routine.tags()) {
    tags->add_values()->set_string_value(tag);
  }

  if (!routine.created_from_task().empty()) {
    fields[kCreatedFrom] = StringValue(routine.created_from_task());
  }

  fields[kCreatedAt]    = StringValue(util::ToIso8601(util::FromProto(routine.created_at())));
  fields[kLastExecuted] = routine.has_last_executed() ? StringValue(util::ToIso8601(util::FromProto(routine.last_executed()))) : NullValue();

  return metadata;
}

v1::Routine DecodeRoutine(const store::StoredMemory& memory) {
  const auto& metadata = memory.metadata;

  v1::Routine routine;
  routine.set_id(memory.id);
  routine.set_name(GetString(metadata, kName, kUntitled));
  routine.set_description(GetString(metadata, kDescription));

  const auto* enabled = Find(metadata, kEnabled);
  routine.set_enabled(!enabled || enabled->kind_case() != Value::kBoolValue || enabled->bool_value());

  const auto* count = Find(metadata, kCount);
  if (count && count->kind_case() == Value::kNumberValue && count->number_value() > 0) {
    routine.set_execution_count(static_cast<uint64_t>(count->number_value()));
  }

  const auto trigger = GetString(metadata, kTrigger, "{}");
  util::FromJson(trigger.empty() ? "{}" : trigger, routine.mutable_trigger());
  DecodeList(GetString(metadata, kConditions, "[]"), routine.mutable_conditions());
  DecodeList(GetString(metadata, kActions, "[]"), routine.mutable_actions());

  if (const auto* tags = Find(metadata, kTags); tags && tags->kind_case() == Value::kListValue) {
    for (const auto& tag : tags->list_value().values()) {
      if (tag.kind_case() == Value::kStringValue) routine.add_tags(tag.string_value());
    }
  }

  routine.set_created_from_task(GetString(metadata, kCreatedFrom));

  if (auto created = util::FromIso8601(GetString(metadata, kCreatedAt))) {
    *routine.mutable_created_at() = util::ToProto(*created);
  } else {
    *routine.mutable_created_at() = util::ToProto(util::TimePoint{} + std::chrono::milliseconds(memory.created_at_ms));
  }

  if (auto last = util::FromIso8601(GetString(metadata, kLastExecuted))) {
    *routine.mutable_last_executed() = util::ToProto(*last);
  }

  return routine;
}

void MarkExecuted(Struct* metadata, util::TimePoint at) {
  auto&        fields = *metadata->mutable_fields();
  const auto&  count  = fields[kCount];
  const double prior  = count.kind_case() == Value::kNumberValue && count.number_value() > 0 ? count.number_value() : 0;

  fields[kCount].set_number_value(prior + 1);
  fields[kLastExecuted] = StringValue(util::ToIso8601(at));
}

v1::RoutineSummary Summarize(const v1::Routine& routine) {
  v1::RoutineSummary summary;
  summary.set_id(routine.id());
  summary.set_name(routine.name());
  summary.set_description(routine.description());
  summary.set_enabled(routine.enabled());
  if (routine.has_last_executed()) {
    *summary.mutable_last_executed() = routine.last_executed();
  }
  summary.set_execution_count(routine.execution_count());
  *summary.mutable_tags() = routine.tags();
  return summary;
}

std::string DescribeTrigger(const v1::Trigger& trigger) {
  auto or_default = [](const std::string& value, const char* fallback) { return value.empty() ? std::string(fallback) : value; };

  switch (trigger.kind_case()) {
    case v1::Trigger::kTime:
      return "Time-based: " + or_default(trigger.time().schedule(), "No schedule");
    case v1::Trigger::kEvent:
      return "Event: " + or_default(trigger.event().event_name(), "Unknown event");
    case v1::Trigger::kStateChange:
      return "State change: " + or_default(trigger.state_change().monitor().service(), "Unknown service");
    case v1::Trigger::kUserAction:
      return "User action: " + or_default(trigger.user_action().action_type(), "Unknown action");
    case v1::Trigger::kCompletion:
      return "Task completion: " + or_default(trigger.completion().task_pattern(), "Any task");
    case v1::Trigger::kVisionDetection: {
      const auto& vision  = trigger.vision_detection();
      std::string objects;
      for (const auto& type : vision.object_types()) {
        if (!objects.empty()) objects += ", ";
        objects += type;
      }
      return "Vision detection: " + or_default(vision.service(), "Unknown service") + " detecting " + or_default(objects, "objects");
    }
    case v1::Trigger::KIND_NOT_SET:
      break;
  }
  return "Unknown trigger";
}

std::string SummaryText(const v1::Routine& routine) {
  return routine.name() + "\n\n" + routine.description() + "\n\nTrigger: " + DescribeTrigger(routine.trigger()) +
         "\nActions: " + std::to_string(routine.actions_size()) + " action(s)";
}

void DedupeTags(google::protobuf::RepeatedPtrField<std::string>* tags) {
  std::unordered_set<std::string>               seen;
  google::protobuf::RepeatedPtrField<std::string> unique;
  for (const auto& tag : *tags) {
    if (seen.insert(tag).second) {
      unique.Add()->assign(tag);
    }
  }
  tags->Swap(&unique);
}

} // namespace routine::core

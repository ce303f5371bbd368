#pragma once

#include <string>

#include <google/protobuf/repeated_field.h>
#include <google/protobuf/struct.pb.h>

#include "internal/store/record_store.hpp"
#include "internal/util/time.hpp"
#include "routine/manager/v1/routine.pb.h"

namespace routine::core {

/*
  Routine <-> record-store encoding.

  The metadata bag carries every routine field:

    routineName, routineDescription        string
    routineEnabled                         bool
    routineExecutionCount                  number
    routineTrigger                         JSON text of Trigger
    routineConditions, routineActions      JSON text (array)
    routineTags                            list of strings
    routineCreatedFromTask                 string, omitted when empty
    createdAt, lastExecuted                ISO-8601 UTC, lastExecuted null until first run

  Record text is the searchable summary built by SummaryText().
*/

google::protobuf::Struct EncodeMetadata(const manager::v1::Routine& routine);

// Missing fields decode to defaults ("Untitled Routine", enabled, no actions).
// Throws std::runtime_error when an encoded payload is not valid JSON.
manager::v1::Routine DecodeRoutine(const store::StoredMemory& memory);

// Execution bookkeeping: routineExecutionCount + 1, lastExecuted = at.
// Other metadata keys are left untouched.
void MarkExecuted(google::protobuf::Struct* metadata, util::TimePoint at);

manager::v1::RoutineSummary Summarize(const manager::v1::Routine& routine);

std::string DescribeTrigger(const manager::v1::Trigger& trigger);

// "<name>\n\n<description>\n\nTrigger: <trigger>\nActions: <n> action(s)"
std::string SummaryText(const manager::v1::Routine& routine);

// Drops repeats, keeping the first occurrence of each tag.
void DedupeTags(google::protobuf::RepeatedPtrField<std::string>* tags);

} // namespace routine::core

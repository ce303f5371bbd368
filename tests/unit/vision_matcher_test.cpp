#include "internal/trigger/vision_matcher.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

namespace {

using routine::trigger::Detection;
using routine::trigger::DetectionSignature;
using routine::trigger::MatchDetections;

google::protobuf::RepeatedPtrField<std::string> Targets(std::initializer_list<const char*> names) {
  google::protobuf::RepeatedPtrField<std::string> targets;
  for (const auto* name : names) {
    targets.Add()->assign(name);
  }
  return targets;
}

void TestConfidenceThresholdIsInclusive() {
  const std::vector<Detection> detections = {{"person", 0.5}, {"person", 0.49}, {"car", 0.9}};

  const auto matched = MatchDetections(detections, Targets({"person"}), 0.5);
  assert(matched.size() == 1);
  assert(matched[0] == "person");
}

void TestSubstringMatchesEitherDirection() {
  const std::vector<Detection> detections = {{"Person", 0.9}, {"car", 0.8}, {"dog", 0.95}, {"", 0.99}};

  // "person" in "Person" (case-insensitive) and "car" contains "ca"
  const auto matched = MatchDetections(detections, Targets({"person", "ca"}), 0.5);
  assert(matched.size() == 2);
  assert(matched[0] == "Person");
  assert(matched[1] == "car");

  // target longer than the label
  const auto reverse = MatchDetections({{"cat", 0.7}}, Targets({"cats"}), 0.5);
  assert(reverse.size() == 1);
}

void TestSignatureIsOrderIndependent() {
  assert(DetectionSignature({"person", "car"}) == "car,person");
  assert(DetectionSignature({"car", "person"}) == "car,person");
  assert(DetectionSignature({"person", "person"}) == "person,person");
  assert(DetectionSignature({}).empty());
}

} // namespace

int main() {
  TestConfidenceThresholdIsInclusive();
  TestSubstringMatchesEitherDirection();
  TestSignatureIsOrderIndependent();

  std::cout << "routine_manager_unit_vision_matcher: pass\n";
  return 0;
}

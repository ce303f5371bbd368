#include "internal/connectors/home_assistant_client.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace routine::connectors {
namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Field(const Value& object, const std::string& key) {
  if (object.kind_case() != Value::kStructValue) return nullptr;
  auto it = object.struct_value().fields().find(key);
  return it == object.struct_value().fields().end() ? nullptr : &it->second;
}

std::string StringField(const Value& object, const std::string& key) {
  const auto* value = Field(object, key);
  return value && value->kind_case() == Value::kStringValue ? value->string_value() : std::string();
}

Value Text(const std::string& text) {
  Value value;
  value.set_string_value(text);
  return value;
}

Value Normalize(const Value& entity) {
  const auto entity_id = StringField(entity, "entity_id");

  Value out;
  auto& fields          = *out.mutable_struct_value()->mutable_fields();
  fields["entityId"]    = Text(entity_id);
  fields["domain"]      = Text(entity_id.substr(0, entity_id.find('.')));
  fields["lastChanged"] = Text(StringField(entity, "last_changed"));
  fields["lastUpdated"] = Text(StringField(entity, "last_updated"));

  if (const auto* state = Field(entity, "state")) {
    fields["state"] = *state;
  }

  std::string friendly_name = entity_id;
  if (const auto* attributes = Field(entity, "attributes")) {
    fields["attributes"] = *attributes;
    if (auto name = StringField(*attributes, "friendly_name"); !name.empty()) {
      friendly_name = name;
    }
  }
  fields["friendlyName"] = Text(friendly_name);
  return out;
}

Value ParseBody(const http::HttpResponse& response, const std::string& what) {
  if (response.body.empty()) {
    return Value();
  }
  try {
    return util::ParseJsonValue(response.body);
  } catch (const std::runtime_error& e) {
    throw util::ConnectorError("Home Assistant returned invalid JSON for " + what + ": " + e.what());
  }
}

} // namespace

HomeAssistantClient::HomeAssistantClient(std::shared_ptr<http::HttpClient> http, routine::runtime::config::HomeAssistantConfig config)
    : http_(std::move(http)), config_(std::move(config)) {
  if (!http_) {
    throw std::invalid_argument("HomeAssistantClient: http client is null");
  }
}

bool HomeAssistantClient::Configured() const {
  return !config_.url().empty() && !config_.token().empty();
}

trigger::EntityState HomeAssistantClient::GetState(const std::string& entity) {
  auto raw = Fetch("/api/states/" + http::QueryEscape(entity), "entity " + entity);

  trigger::EntityState state;
  if (const auto* value = Field(raw, "state")) {
    state.state = *value;
  } else {
    state.state.set_null_value(google::protobuf::NULL_VALUE);
  }
  if (const auto* attributes = Field(raw, "attributes"); attributes && attributes->kind_case() == Value::kStructValue) {
    state.attributes = attributes->struct_value();
  }
  return state;
}

manager::v1::ActionResult HomeAssistantClient::CallService(const std::string& domain, const std::string& operation, const std::string& entity,
                                                           const Struct& data) {
  RequireConfigured();

  Struct body = data;
  (*body.mutable_fields())["entity_id"] = Text(entity);

  const auto url      = http::JoinUrl(config_.url(), "/api/services/" + http::QueryEscape(domain) + "/" + http::QueryEscape(operation));
  const auto response = http_->PostJson(url, util::ToJson(body), Headers());
  if (response.status == 401) {
    throw util::SetupRequired("Home Assistant authentication failed. Please check your HOME_ASSISTANT_TOKEN.");
  }
  if (!response.ok()) {
    throw util::ConnectorError("Home Assistant API error: HTTP " + std::to_string(response.status) + " - " + response.body);
  }

  manager::v1::ActionResult result;
  result.set_success(true);
  result.set_message("Called " + domain + "." + operation + " on " + entity);

  auto& fields       = *result.mutable_data()->mutable_struct_value()->mutable_fields();
  fields["service"]  = Text(domain + "." + operation);
  fields["entityId"] = Text(entity);
  fields["result"]   = ParseBody(response, domain + "." + operation);
  return result;
}

Value HomeAssistantClient::Entity(const std::string& entity) {
  return Normalize(Fetch("/api/states/" + http::QueryEscape(entity), "entity " + entity));
}

Value HomeAssistantClient::Devices(const std::string& domain) {
  auto entities = Fetch("/api/states", "states");

  Value devices;
  auto* list = devices.mutable_list_value();
  if (entities.kind_case() == Value::kListValue) {
    for (const auto& entity : entities.list_value().values()) {
      if (!domain.empty() && StringField(entity, "entity_id").rfind(domain + ".", 0) != 0) {
        continue;
      }
      *list->add_values() = Normalize(entity);
    }
  }

  Value out;
  auto& fields = *out.mutable_struct_value()->mutable_fields();
  fields["deviceCount"].set_number_value(list->values_size());
  fields["domain"]  = Text(domain.empty() ? "all" : domain);
  fields["devices"] = devices;
  return out;
}

Value HomeAssistantClient::Fetch(const std::string& path, const std::string& what) {
  RequireConfigured();

  const auto response = http_->Get(http::JoinUrl(config_.url(), path), Headers());
  if (response.status == 401) {
    throw util::SetupRequired("Home Assistant authentication failed. Please check your HOME_ASSISTANT_TOKEN.");
  }
  if (response.status == 404) {
    throw util::ConnectorError("Home Assistant: " + what + " not found");
  }
  if (!response.ok()) {
    throw util::ConnectorError("Home Assistant API error: HTTP " + std::to_string(response.status));
  }
  return ParseBody(response, what);
}

std::vector<std::string> HomeAssistantClient::Headers() const {
  return {"Authorization: Bearer " + config_.token(), "Accept: application/json"};
}

void HomeAssistantClient::RequireConfigured() const {
  if (!Configured()) {
    throw util::SetupRequired(kHomeAssistantSetup);
  }
}

} // namespace routine::connectors

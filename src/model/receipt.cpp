#include "model/receipt.hpp"

#include <stdexcept>

namespace joule_gate::model {

nlohmann::json to_json(const receipt& value) {
  return nlohmann::json{{"id", value.id},
                        {"ts", value.timestamp},
                        {"task", value.fields.task_name},
                        {"joule", value.fields.joules_charged},
                        {"sec", value.fields.duration_sec},
                        {"delta", value.fields.delta},
                        {"loss", value.fields.loss},
                        {"delta_hash", value.fields.content_hash},
                        {"meta", value.fields.metadata}};
}

std::string to_json_line(const receipt& value) {
  return to_json(value).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

receipt receipt_from_json(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("receipt must be a JSON object");
  }

  receipt parsed{};
  parsed.id = value.at("id").get<std::uint64_t>();
  parsed.timestamp = value.at("ts").get<double>();
  parsed.fields.task_name = value.at("task").get<std::string>();
  parsed.fields.joules_charged = value.value("joule", 0.0);
  parsed.fields.duration_sec = value.value("sec", 0.0);
  parsed.fields.delta = value.value("delta", 0.0);
  parsed.fields.loss = value.value("loss", 0.0);
  parsed.fields.content_hash = value.value("delta_hash", std::string{});
  parsed.fields.metadata = value.value("meta", nlohmann::json::object());
  return parsed;
}

nlohmann::json to_json(const merge_decision& value) {
  return nlohmann::json{{"accepted", value.accepted},
                        {"delta", value.delta},
                        {"secondary_gain", value.secondary_gain},
                        {"decision_hash", value.decision_hash},
                        {"ts", value.timestamp}};
}

}  // namespace joule_gate::model

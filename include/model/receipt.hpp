#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace joule_gate::model {

struct task_result {
  bool ok{false};
  double delta{0.0};
  double loss{0.0};
  std::string content_hash{};
  nlohmann::json metadata = nlohmann::json::object();
};

// Everything the scheduler knows about one admitted run. The ledger adds
// the id and the timestamp.
struct receipt_fields {
  std::string task_name;
  double joules_charged{0.0};
  double duration_sec{0.0};
  double delta{0.0};
  double loss{0.0};
  std::string content_hash{};
  nlohmann::json metadata = nlohmann::json::object();
};

struct receipt {
  std::uint64_t id{0};
  double timestamp{0.0};
  receipt_fields fields{};
};

struct merge_decision {
  bool accepted{false};
  double delta{0.0};
  double secondary_gain{0.0};
  std::string decision_hash{};
  double timestamp{0.0};
};

nlohmann::json to_json(const receipt& value);
// Single-line JSON. Bytes that are not valid UTF-8 become U+FFFD instead of throwing.
std::string to_json_line(const receipt& value);
receipt receipt_from_json(const nlohmann::json& value);
nlohmann::json to_json(const merge_decision& value);

}  // namespace joule_gate::model

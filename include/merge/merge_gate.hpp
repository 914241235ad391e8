#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include "model/receipt.hpp"

namespace joule_gate::merge {

class MergeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct MergeThresholds {
  double delta_threshold{0.002};
  double secondary_threshold{0.01};
};

struct MergeCandidate {
  // Stable name of the candidate, hashed into the decision.
  std::string identity;
  // Staged output on disk. Empty when the candidate has no payload to promote.
  std::filesystem::path location{};
  double delta{0.0};
  std::optional<double> secondary_gain{};
};

// Decides whether a candidate replaces the persisted base. The base path is a
// symbolic link into generations_dir; promotion swaps it with one rename(2),
// so readers see either the old or the new generation, never a mix.
// Candidates must live strictly inside candidates_dir.
class MergeGate {
 public:
  MergeGate(MergeThresholds thresholds, std::filesystem::path base_path, std::filesystem::path generations_dir,
            std::filesystem::path candidates_dir);

  [[nodiscard]] bool should_accept(double delta, std::optional<double> secondary_gain) const noexcept;

  // Promotes or discards the candidate. The candidate location is gone
  // afterwards in both cases. Throws MergeError if promotion fails, with the
  // base left as it was, and before touching anything if the location is
  // outside candidates_dir or reaches into the base or its generations.
  model::merge_decision evaluate(const MergeCandidate& candidate);

  // Generation the base currently resolves to, empty if there is none yet.
  [[nodiscard]] std::filesystem::path current_base() const;

  [[nodiscard]] const MergeThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  [[nodiscard]] std::filesystem::path confine(const std::filesystem::path& location) const;
  void promote(const std::filesystem::path& location, const std::string& decision_hash);
  static void discard(const std::filesystem::path& location) noexcept;

  MergeThresholds thresholds_;
  std::filesystem::path base_path_;
  std::filesystem::path generations_dir_;
  std::filesystem::path candidates_dir_;
};

}  // namespace joule_gate::merge

#include "merge/merge_gate.hpp"

#include <unistd.h>

#include <cmath>
#include <cstdio>
#include <iostream>
#include <system_error>
#include <utility>

#include "core/digest.hpp"
#include "core/timestamp.hpp"

namespace joule_gate::merge {

namespace {

std::string decision_digest(const double timestamp, const std::string& identity, const double delta) {
  char prefix[32]{};
  std::snprintf(prefix, sizeof(prefix), "%.17g", timestamp);
  char suffix[32]{};
  std::snprintf(suffix, sizeof(suffix), "%.17g", delta);
  return core::sha256_hex(std::string(prefix) + identity + suffix);
}

void move_path(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return;
  }
  if (ec != std::errc::cross_device_link) {
    throw MergeError("unable to stage candidate " + from.string() + ": " + ec.message());
  }

  std::filesystem::copy(from, to, std::filesystem::copy_options::recursive, ec);
  if (ec) {
    std::filesystem::remove_all(to, ec);
    throw MergeError("unable to copy candidate " + from.string() + " across filesystems");
  }
  std::filesystem::remove_all(from, ec);
}

// Absolute, symlinks resolved for the existing prefix, no trailing separator.
std::filesystem::path resolve(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::path resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
  if (ec) {
    throw MergeError("unable to resolve " + path.string() + ": " + ec.message());
  }
  if (!resolved.has_filename() && resolved.has_parent_path()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

bool strictly_within(const std::filesystem::path& root, const std::filesystem::path& path) {
  auto path_it = path.begin();
  for (auto root_it = root.begin(); root_it != root.end(); ++root_it, ++path_it) {
    if (path_it == path.end() || *path_it != *root_it) {
      return false;
    }
  }
  return path_it != path.end();
}

bool same_or_within(const std::filesystem::path& root, const std::filesystem::path& path) {
  return path == root || strictly_within(root, path);
}

}  // namespace

MergeGate::MergeGate(MergeThresholds thresholds, std::filesystem::path base_path, std::filesystem::path generations_dir,
                     std::filesystem::path candidates_dir)
    : thresholds_(thresholds),
      base_path_(std::move(base_path)),
      generations_dir_(std::move(generations_dir)),
      candidates_dir_(std::move(candidates_dir)) {}

bool MergeGate::should_accept(const double delta, const std::optional<double> secondary_gain) const noexcept {
  const bool delta_ok = std::isfinite(delta) && delta >= thresholds_.delta_threshold;
  const bool secondary_ok =
      secondary_gain.has_value() && std::isfinite(*secondary_gain) && *secondary_gain >= thresholds_.secondary_threshold;
  return delta_ok || secondary_ok;
}

model::merge_decision MergeGate::evaluate(const MergeCandidate& candidate) {
  model::merge_decision decision{};
  decision.timestamp = core::unix_seconds_now();
  decision.delta = candidate.delta;
  decision.secondary_gain = candidate.secondary_gain.value_or(0.0);
  decision.accepted = should_accept(candidate.delta, candidate.secondary_gain);
  decision.decision_hash = decision_digest(decision.timestamp, candidate.identity, candidate.delta);

  std::filesystem::path location{};
  if (!candidate.location.empty()) {
    location = confine(candidate.location);
  }
  if (!decision.accepted) {
    discard(location);
    std::cerr << "[merge] rejected " << candidate.identity << " delta=" << candidate.delta
              << " secondary_gain=" << decision.secondary_gain << '\n';
    return decision;
  }

  if (!location.empty()) {
    try {
      promote(location, decision.decision_hash);
    } catch (const MergeError&) {
      discard(location);
      throw;
    }
  }

  std::cerr << "[merge] accepted " << candidate.identity << " delta=" << candidate.delta
            << " secondary_gain=" << decision.secondary_gain << " decision=" << decision.decision_hash.substr(0, 8)
            << '\n';
  return decision;
}

std::filesystem::path MergeGate::current_base() const {
  std::error_code ec;
  if (!std::filesystem::is_symlink(std::filesystem::symlink_status(base_path_, ec))) {
    return {};
  }
  return std::filesystem::read_symlink(base_path_, ec);
}

std::filesystem::path MergeGate::confine(const std::filesystem::path& location) const {
  if (candidates_dir_.empty()) {
    throw MergeError("no candidates directory configured; refusing " + location.string());
  }

  const std::filesystem::path resolved = resolve(location);
  if (!strictly_within(resolve(candidates_dir_), resolved)) {
    throw MergeError("candidate " + location.string() + " is outside " + candidates_dir_.string());
  }
  if (same_or_within(resolve(base_path_), resolved) || same_or_within(resolve(generations_dir_), resolved)) {
    throw MergeError("candidate " + location.string() + " overlaps the persisted base");
  }
  return resolved;
}

void MergeGate::promote(const std::filesystem::path& location, const std::string& decision_hash) {
  std::error_code ec;
  const auto base_status = std::filesystem::symlink_status(base_path_, ec);
  if (std::filesystem::exists(base_status) && !std::filesystem::is_symlink(base_status)) {
    throw MergeError("base path " + base_path_.string() + " exists and is not a managed link");
  }

  if (!std::filesystem::exists(location, ec)) {
    throw MergeError("candidate " + location.string() + " does not exist");
  }

  std::filesystem::create_directories(generations_dir_, ec);
  if (ec) {
    throw MergeError("unable to create " + generations_dir_.string() + ": " + ec.message());
  }
  if (base_path_.has_parent_path()) {
    std::filesystem::create_directories(base_path_.parent_path(), ec);
  }

  const std::filesystem::path previous = current_base();
  const std::filesystem::path generation =
      std::filesystem::absolute(generations_dir_) /
      ("gen-" + std::to_string(core::unix_timestamp_now_ns()) + "-" + decision_hash.substr(0, 12));

  move_path(location, generation);

  std::filesystem::path staged_link = base_path_;
  staged_link += ".next-" + std::to_string(::getpid());
  std::filesystem::remove(staged_link, ec);
  std::filesystem::create_symlink(generation, staged_link, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove_all(generation, ec);
    throw MergeError("unable to stage base link: " + reason);
  }

  std::filesystem::rename(staged_link, base_path_, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(staged_link, ec);
    std::filesystem::remove_all(generation, ec);
    throw MergeError("unable to swap base link: " + reason);
  }

  if (!previous.empty() && previous != generation && previous.parent_path() == generation.parent_path()) {
    std::filesystem::remove_all(previous, ec);
    if (ec) {
      std::cerr << "[merge] unable to remove previous generation " << previous.string() << ": " << ec.message()
                << '\n';
    }
  }
}

void MergeGate::discard(const std::filesystem::path& location) noexcept {
  if (location.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove_all(location, ec);
  if (ec) {
    std::cerr << "[merge] unable to discard candidate " << location.string() << ": " << ec.message() << '\n';
  }
}

}  // namespace joule_gate::merge

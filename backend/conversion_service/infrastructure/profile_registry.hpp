#pragma once

#include "common/config/config.hpp"
#include "domain/encode_profile.hpp"
#include "domain/job_error.hpp"

#include <expected>
#include <string>
#include <unordered_map>
#include <vector>

namespace conversion_service {

// Read-only catalogue of encode profiles, built once at startup.
// Lookups match names and aliases case-insensitively.
class ProfileRegistry {
public:
  // Throws std::invalid_argument on an empty or duplicate name or alias.
  explicit ProfileRegistry(std::vector<EncodeProfile> profiles);

  static EncodeProfile fromConfig(const config::EncodeProfileConfig& profile);
  static ProfileRegistry fromConfig(const std::vector<config::EncodeProfileConfig>& profiles);

  std::expected<EncodeProfile, JobError> resolve(const std::string& name) const;
  const std::vector<EncodeProfile>& list() const { return profiles_; }

private:
  static std::string key(const std::string& name);

  std::vector<EncodeProfile> profiles_;
  std::unordered_map<std::string, std::size_t> index_;
};

} // namespace conversion_service

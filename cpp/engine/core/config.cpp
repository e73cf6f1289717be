#include "engine/core/config.hpp"

#include <array>
#include <utility>

namespace fusion {

namespace {

constexpr std::array<std::pair<const char*, ConfinementScaling>, 6> kScalingNames{{
    {"ipb98y2", ConfinementScaling::IPB98y2},
    {"iter89p", ConfinementScaling::ITER89P},
    {"kaye_goldston", ConfinementScaling::KayeGoldston},
    {"neo_alcator", ConfinementScaling::NeoAlcator},
    {"mirnov", ConfinementScaling::Mirnov},
    {"shimomura", ConfinementScaling::Shimomura},
}};

constexpr std::array<std::pair<const char*, BootstrapModel>, 2> kBootstrapNames{{
    {"proxy", BootstrapModel::Proxy},
    {"improved", BootstrapModel::Improved},
}};

}  // namespace

const char* to_string(ConfinementScaling s) noexcept {
  switch (s) {
    case ConfinementScaling::IPB98y2:      return "ipb98y2";
    case ConfinementScaling::ITER89P:      return "iter89p";
    case ConfinementScaling::KayeGoldston: return "kaye_goldston";
    case ConfinementScaling::NeoAlcator:   return "neo_alcator";
    case ConfinementScaling::Mirnov:       return "mirnov";
    case ConfinementScaling::Shimomura:    return "shimomura";
  }
  return "unknown";
}

const char* to_string(BootstrapModel m) noexcept {
  switch (m) {
    case BootstrapModel::Proxy:    return "proxy";
    case BootstrapModel::Improved: return "improved";
  }
  return "unknown";
}

ConfinementScaling parse_confinement_scaling(std::string_view s) {
  for (const auto& [name, value] : kScalingNames) {
    if (s == name) return value;
  }
  throw ConfigurationError("unknown confinement scaling: " + std::string(s));
}

BootstrapModel parse_bootstrap_model(std::string_view s) {
  for (const auto& [name, value] : kBootstrapNames) {
    if (s == name) return value;
  }
  throw ConfigurationError("unknown bootstrap model: " + std::string(s));
}

}  // namespace fusion

/* @file main.cpp
 * @brief pledge_sim entry point: pledge_sim <config.json> <script.json>
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>

// third-party headers
#include <nlohmann/json.hpp>

// pledge headers
#include "core/CampaignConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ScenarioRunner.hpp"

int main(int argc, char** argv) {
  if (argc != 3) {
    std::cerr << "usage: " << argv[0] << " <config.json> <script.json>\n";
    return 2;
  }

  try {
    const auto config =
        pledge::core::CampaignConfig::fromJson(pledge::core::ConfigLoader(argv[1]).load());
    const auto script = pledge::core::ConfigLoader(argv[2]).load();

    pledge::core::ScenarioRunner runner(config, std::cout);
    const int rejected = runner.run(script);
    std::cout << rejected << " step(s) rejected\n";
  } catch (const std::exception& e) {
    std::cerr << "[pledge_sim] " << e.what() << "\n";
    return 1;
  }
  return 0;
}

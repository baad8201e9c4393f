// Copyright 2024 The Armada Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "armada/common/armada_config.h"

#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

ArmadaConfig &ArmadaConfig::instance() {
  static ArmadaConfig config;
  return config;
}

void ArmadaConfig::initialize(const std::string &config_list) {
#define ARMADA_CONFIG(type, name, default_value) \
  name##_ = ReadEnv<type>("ARMADA_" #name, #type, default_value);

#include "armada/common/armada_config_def.h"
#undef ARMADA_CONFIG

  if (config_list.empty()) {
    return;
  }

  try {
    json config_map = json::parse(config_list);

/// -----------Include armada_config_def.h to set config items.----------------
/// A helper macro that helps to set a value to a config item.
#define ARMADA_CONFIG(type, name, default_value) \
  if (pair.key() == #name) {                     \
    name##_ = pair.value().get<type>();          \
    continue;                                    \
  }

    for (const auto &pair : config_map.items()) {
      // We use a big chain of if else statements because C++ doesn't allow
      // switch statements on strings.
#include "armada/common/armada_config_def.h"
      ARMADA_LOG(FATAL) << "Received unexpected config parameter " << pair.key();
    }

#undef ARMADA_CONFIG

    if (ARMADA_LOG_ENABLED(DEBUG)) {
      std::ostringstream oss;
      oss << "ArmadaConfig is initialized with: ";
      for (auto const &pair : config_map.items()) {
        oss << pair.key() << "=" << pair.value() << ",";
      }
      ARMADA_LOG(DEBUG) << oss.str();
    }
  } catch (json::exception &ex) {
    ARMADA_LOG(FATAL) << "Failed to initialize ArmadaConfig: " << ex.what()
                      << " The config string is: " << config_list;
  }
}

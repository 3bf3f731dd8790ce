/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#ifndef DFE_CORE_INCLUDE_CONFIGURATIONS_CONFIGURATIONOPTION_HPP_
#define DFE_CORE_INCLUDE_CONFIGURATIONS_CONFIGURATIONOPTION_HPP_

#include <string>

namespace DFE::Configurations {

const std::string LOG_LEVEL_CONFIG = "logLevel";
const std::string MAX_IN_MEMORY_STATE_ENTRIES_CONFIG = "maxInMemoryStateEntries";
const std::string SPILL_DIRECTORY_CONFIG = "spillDirectory";
const std::string BROADCAST_JOIN_THRESHOLD_CONFIG = "broadcastJoinThreshold";
const std::string ALLOWED_LATENESS_CONFIG = "allowedLateness";
const std::string WATERMARK_FREQUENCY_CONFIG = "watermarkFrequency";
const std::string MAX_DECOMPOSITION_DEPTH_CONFIG = "maxDecompositionDepth";
// only used on the command line, points to a YAML file that is applied before the other arguments
const std::string CONFIG_PATH = "configPath";

}// namespace DFE::Configurations

#endif// DFE_CORE_INCLUDE_CONFIGURATIONS_CONFIGURATIONOPTION_HPP_

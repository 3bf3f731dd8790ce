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

#ifndef DFE_CORE_INCLUDE_PLANS_UTILS_DAGJSONGENERATOR_HPP_
#define DFE_CORE_INCLUDE_PLANS_UTILS_DAGJSONGENERATOR_HPP_

#include <Plans/CanonicalDag.hpp>
#include <nlohmann/json.hpp>

namespace DFE {

/**
 * @brief This is a utility class to convert canonical DAGs into JSON
 */
class DagJsonGenerator {
  public:
    /**
     * @brief get the json representation of a canonical DAG
     * @param dag the lowered DAG
     * @return a JSON object with a "nodes" array (id, name, kind, rule, sink) and an "edges" array (source, target)
     */
    static nlohmann::json getDagAsJson(const CanonicalDagPtr& dag);
};

}// namespace DFE

#endif// DFE_CORE_INCLUDE_PLANS_UTILS_DAGJSONGENERATOR_HPP_

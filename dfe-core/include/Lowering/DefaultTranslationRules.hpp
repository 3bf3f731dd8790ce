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

#ifndef DFE_CORE_INCLUDE_LOWERING_DEFAULTTRANSLATIONRULES_HPP_
#define DFE_CORE_INCLUDE_LOWERING_DEFAULTTRANSLATIONRULES_HPP_

#include <Lowering/TranslationRuleTable.hpp>

namespace DFE::Lowering {

/**
 * @brief The reference rule set.
 *
 * INPUT, FLAT_MAP, UNION and REDUCE_STATE_BY_KEY are always accepted.
 * REDUCE_BY_KEY is accepted by the ReduceByKeyTranslator if the reducer is combinable and the windowing is not merging.
 * JOIN is accepted by the BroadcastHashJoinTranslator for non-windowed joins with a small side that fits the join type,
 * otherwise by the SortMergeJoinTranslator if a comparator for the key type is registered and the windowing is not merging.
 * All other operators are decomposed.
 */
class DefaultTranslationRules {
  public:
    static TranslationRuleTablePtr create();

    static bool acceptsReduceByKey(const LogicalOperator& logicalOperator, const AcceptorContext& context);

    static bool acceptsBroadcastHashJoin(const LogicalOperator& logicalOperator, const AcceptorContext& context);

    static bool acceptsSortMergeJoin(const LogicalOperator& logicalOperator, const AcceptorContext& context);
};

}// namespace DFE::Lowering

#endif// DFE_CORE_INCLUDE_LOWERING_DEFAULTTRANSLATIONRULES_HPP_

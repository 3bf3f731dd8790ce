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

#ifndef DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULETABLE_HPP_
#define DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULETABLE_HPP_

#include <Lowering/TranslationRule.hpp>
#include <map>
#include <memory>
#include <vector>

namespace DFE::Lowering {

class TranslationRuleTable;
using TranslationRuleTablePtr = std::shared_ptr<const TranslationRuleTable>;

/**
 * @brief Immutable table of translation rules indexed by operator kind.
 * The rules of a kind keep their registration order, lowering tries them in this order.
 */
class TranslationRuleTable {
  public:
    /**
     * @brief Collects rules and builds the table once.
     */
    class Builder {
      public:
        Builder& addRule(TranslationRulePtr rule);

        Builder& addRule(std::string name, OperatorKind kind, Execution::OperatorTranslatorPtr translator);

        Builder& addRule(std::string name,
                         OperatorKind kind,
                         AcceptancePredicate predicate,
                         Execution::OperatorTranslatorPtr translator);

        [[nodiscard]] TranslationRuleTablePtr build();

      private:
        std::map<OperatorKind, std::vector<TranslationRulePtr>> rules;
    };

    static Builder builder();

    /**
     * @brief Returns the rules of a kind in registration order, empty if the kind has no rules.
     */
    [[nodiscard]] const std::vector<TranslationRulePtr>& getRules(OperatorKind kind) const;

    [[nodiscard]] uint64_t getNumberOfRules() const;

    [[nodiscard]] std::string toString() const;

  private:
    explicit TranslationRuleTable(std::map<OperatorKind, std::vector<TranslationRulePtr>> rules);

    const std::map<OperatorKind, std::vector<TranslationRulePtr>> rules;
};

}// namespace DFE::Lowering

#endif// DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULETABLE_HPP_

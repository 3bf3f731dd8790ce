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

#ifndef DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULE_HPP_
#define DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULE_HPP_

#include <Lowering/AcceptorContext.hpp>
#include <Operators/LogicalOperator.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace DFE::Execution {
class OperatorTranslator;
using OperatorTranslatorPtr = std::shared_ptr<OperatorTranslator>;
}// namespace DFE::Execution

namespace DFE::Lowering {

/**
 * @brief Decides if a rule can lower a concrete operator instance.
 */
using AcceptancePredicate = std::function<bool(const LogicalOperator& logicalOperator, const AcceptorContext& context)>;

class TranslationRule;
using TranslationRulePtr = std::shared_ptr<const TranslationRule>;

/**
 * @brief Binds operators of one kind to the translator that executes them.
 * A rule without predicate accepts every operator of its kind.
 */
class TranslationRule {
  public:
    TranslationRule(std::string name,
                    OperatorKind kind,
                    std::optional<AcceptancePredicate> predicate,
                    Execution::OperatorTranslatorPtr translator);

    static TranslationRulePtr create(std::string name,
                                     OperatorKind kind,
                                     std::optional<AcceptancePredicate> predicate,
                                     Execution::OperatorTranslatorPtr translator);

    [[nodiscard]] const std::string& getName() const { return name; }

    [[nodiscard]] OperatorKind getKind() const { return kind; }

    [[nodiscard]] bool hasPredicate() const { return predicate.has_value(); }

    [[nodiscard]] const Execution::OperatorTranslatorPtr& getTranslator() const { return translator; }

    /**
     * @brief Checks if this rule lowers the operator.
     * @param logicalOperator an operator of the kind of this rule
     * @param context the acceptor context of the lowering
     * @return true if the rule has no predicate or the predicate holds
     */
    [[nodiscard]] bool accepts(const LogicalOperator& logicalOperator, const AcceptorContext& context) const;

  private:
    const std::string name;
    const OperatorKind kind;
    const std::optional<AcceptancePredicate> predicate;
    const Execution::OperatorTranslatorPtr translator;
};

}// namespace DFE::Lowering

#endif// DFE_CORE_INCLUDE_LOWERING_TRANSLATIONRULE_HPP_

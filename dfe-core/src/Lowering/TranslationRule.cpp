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

#include <Execution/OperatorTranslator.hpp>
#include <Lowering/TranslationRule.hpp>
#include <Util/Logger/Logger.hpp>

namespace DFE::Lowering {

TranslationRule::TranslationRule(std::string name,
                                 OperatorKind kind,
                                 std::optional<AcceptancePredicate> predicate,
                                 Execution::OperatorTranslatorPtr translator)
    : name(std::move(name)), kind(kind), predicate(std::move(predicate)), translator(std::move(translator)) {
    DFE_ASSERT(this->translator, "TranslationRule " << this->name << " requires a translator");
}

TranslationRulePtr TranslationRule::create(std::string name,
                                           OperatorKind kind,
                                           std::optional<AcceptancePredicate> predicate,
                                           Execution::OperatorTranslatorPtr translator) {
    return std::make_shared<TranslationRule>(std::move(name), kind, std::move(predicate), std::move(translator));
}

bool TranslationRule::accepts(const LogicalOperator& logicalOperator, const AcceptorContext& context) const {
    if (logicalOperator.getKind() != kind) {
        return false;
    }
    return !predicate || (*predicate)(logicalOperator, context);
}

}// namespace DFE::Lowering

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

#include <Lowering/TranslationRuleTable.hpp>
#include <Util/Logger/Logger.hpp>
#include <sstream>

namespace DFE::Lowering {

TranslationRuleTable::Builder& TranslationRuleTable::Builder::addRule(TranslationRulePtr rule) {
    DFE_ASSERT(rule, "TranslationRuleTable: rule must not be null");
    auto& rulesOfKind = rules[rule->getKind()];
    for (const auto& existing : rulesOfKind) {
        DFE_ASSERT(existing->getName() != rule->getName(),
                   "TranslationRuleTable: rule " << rule->getName() << " is registered twice");
    }
    rulesOfKind.emplace_back(std::move(rule));
    return *this;
}

TranslationRuleTable::Builder&
TranslationRuleTable::Builder::addRule(std::string name, OperatorKind kind, Execution::OperatorTranslatorPtr translator) {
    return addRule(TranslationRule::create(std::move(name), kind, std::nullopt, std::move(translator)));
}

TranslationRuleTable::Builder& TranslationRuleTable::Builder::addRule(std::string name,
                                                                      OperatorKind kind,
                                                                      AcceptancePredicate predicate,
                                                                      Execution::OperatorTranslatorPtr translator) {
    return addRule(TranslationRule::create(std::move(name), kind, std::move(predicate), std::move(translator)));
}

TranslationRuleTablePtr TranslationRuleTable::Builder::build() {
    auto table = std::shared_ptr<const TranslationRuleTable>(new TranslationRuleTable(std::move(rules)));
    rules.clear();
    DFE_DEBUG("TranslationRuleTable: built " << table->toString());
    return table;
}

TranslationRuleTable::Builder TranslationRuleTable::builder() { return {}; }

TranslationRuleTable::TranslationRuleTable(std::map<OperatorKind, std::vector<TranslationRulePtr>> rules)
    : rules(std::move(rules)) {}

const std::vector<TranslationRulePtr>& TranslationRuleTable::getRules(OperatorKind kind) const {
    static const std::vector<TranslationRulePtr> noRules;
    auto it = rules.find(kind);
    return it == rules.end() ? noRules : it->second;
}

uint64_t TranslationRuleTable::getNumberOfRules() const {
    uint64_t count = 0;
    for (const auto& [kind, rulesOfKind] : rules) {
        count += rulesOfKind.size();
    }
    return count;
}

std::string TranslationRuleTable::toString() const {
    std::stringstream ss;
    ss << "TranslationRuleTable(";
    for (const auto& [kind, rulesOfKind] : rules) {
        ss << DFE::toString(kind) << ": [";
        for (size_t i = 0; i < rulesOfKind.size(); ++i) {
            ss << (i == 0 ? "" : ", ") << rulesOfKind[i]->getName();
        }
        ss << "] ";
    }
    ss << ")";
    return ss.str();
}

}// namespace DFE::Lowering

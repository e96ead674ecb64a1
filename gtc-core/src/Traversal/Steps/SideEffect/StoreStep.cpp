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

#include <Traversal/Steps/SideEffect/StoreStep.hpp>
#include <Traversal/Traversal.hpp>
#include <Traversal/Traverser.hpp>

namespace GTC {

StoreStep::StoreStep(std::string sideEffectKey) : sideEffectKey(std::move(sideEffectKey)) {}

StoreStepPtr StoreStep::create(const std::string& sideEffectKey) { return std::make_shared<StoreStep>(sideEffectKey); }

const std::string& StoreStep::getSideEffectKey() const { return sideEffectKey; }

TraverserRequirements StoreStep::getRequirements() const { return {TraverserRequirement::SIDE_EFFECTS, TraverserRequirement::BULK}; }

void StoreStep::sideEffect(const TraverserPtr& traverser) {
    auto sideEffects = traverser->getSideEffects();
    if (!sideEffects) {
        GTC_THROW_RUNTIME_ERROR("StoreStep: the traverser " << traverser->toString() << " carries no side effects");
    }
    for (uint64_t i = 0; i < traverser->getBulk(); ++i) {
        sideEffects->add(sideEffectKey, traverser->get());
    }
}

StepPtr StoreStep::clone() const { return std::shared_ptr<StoreStep>(new StoreStep(*this)); }

std::string StoreStep::toString() const { return stepString("StoreStep", {sideEffectKey}); }

}// namespace GTC

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

#include <Traversal/Steps/Filter/IdentityStep.hpp>

namespace GTC {

IdentityStepPtr IdentityStep::create() { return std::make_shared<IdentityStep>(); }

bool IdentityStep::filter(const TraverserPtr&) { return true; }

StepPtr IdentityStep::clone() const { return std::shared_ptr<IdentityStep>(new IdentityStep(*this)); }

std::string IdentityStep::toString() const { return stepString("IdentityStep"); }

}// namespace GTC

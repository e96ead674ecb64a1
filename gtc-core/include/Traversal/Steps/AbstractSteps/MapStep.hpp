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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_MAPSTEP_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_MAPSTEP_HPP_

#include <Traversal/Steps/Step.hpp>

namespace GTC {

/**
 * @brief A step that maps every traverser to exactly one new value.
 */
class MapStep : public Step {
  public:
    [[nodiscard]] StepCapability getCapability() const override;

  protected:
    MapStep() = default;

    MapStep(const MapStep& other) = default;

    std::vector<TraverserPtr> process(std::vector<TraverserPtr> traversers) override;

    virtual Value map(const TraverserPtr& traverser) = 0;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_STEPS_ABSTRACTSTEPS_MAPSTEP_HPP_

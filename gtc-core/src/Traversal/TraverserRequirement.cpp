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

#include <Traversal/TraverserRequirement.hpp>
#include <magic_enum.hpp>
#include <sstream>

namespace GTC {

std::string toString(const TraverserRequirements& requirements) {
    std::stringstream ss;
    ss << "[";
    for (auto it = requirements.begin(); it != requirements.end(); ++it) {
        if (it != requirements.begin()) {
            ss << ", ";
        }
        ss << magic_enum::enum_name(*it);
    }
    ss << "]";
    return ss.str();
}

}// namespace GTC

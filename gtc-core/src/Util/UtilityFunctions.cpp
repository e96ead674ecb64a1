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

#include <Util/UtilityFunctions.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>

namespace GTC::Util {

StepId getNextStepId() {
    static std::atomic_uint64_t id = INVALID_STEP_ID;
    return ++id;
}

std::string trim(std::string str) {
    auto notSpace = [](unsigned char c) {
        return !std::isspace(c);
    };
    str.erase(str.begin(), std::find_if(str.begin(), str.end(), notSpace));
    str.erase(std::find_if(str.rbegin(), str.rend(), notSpace).base(), str.end());
    return str;
}

std::vector<std::string> splitWithStringDelimiter(const std::string& data, const std::string& delimiter) {
    std::vector<std::string> splitTokens;
    if (delimiter.empty()) {
        splitTokens.emplace_back(trim(data));
        return splitTokens;
    }
    size_t start = 0;
    while (start <= data.size()) {
        auto end = data.find(delimiter, start);
        if (end == std::string::npos) {
            end = data.size();
        }
        auto token = trim(data.substr(start, end - start));
        if (!token.empty()) {
            splitTokens.emplace_back(std::move(token));
        }
        start = end + delimiter.size();
    }
    return splitTokens;
}

}// namespace GTC::Util

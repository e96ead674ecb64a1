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

#ifndef GTC_CORE_INCLUDE_STRUCTURE_VALUE_HPP_
#define GTC_CORE_INCLUDE_STRUCTURE_VALUE_HPP_

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace GTC {

/**
 * @brief Reference to a vertex of the graph provided by the storage backend.
 */
struct Vertex {
    uint64_t id;

    bool operator==(const Vertex& other) const = default;
};

/**
 * @brief A value carried by a traverser. Equality and hashing follow the contract of the held alternative,
 * values of different alternatives are never equal (e.g., int64_t 1 != double 1.0).
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string, Vertex>;

/**
 * @brief Returns a human readable representation of a value, vertices are printed as v[id].
 */
std::string toString(const Value& value);

}// namespace GTC

template<>
struct std::hash<GTC::Vertex> {
    std::size_t operator()(const GTC::Vertex& vertex) const noexcept { return std::hash<uint64_t>{}(vertex.id); }
};

#endif// GTC_CORE_INCLUDE_STRUCTURE_VALUE_HPP_

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

#ifndef GTC_CORE_INCLUDE_STRUCTURE_GRAPH_HPP_
#define GTC_CORE_INCLUDE_STRUCTURE_GRAPH_HPP_

#include <Structure/Value.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace GTC {

/**
 * @brief Direction of an adjacency lookup relative to the current vertex.
 */
enum class Direction : uint8_t { OUT, IN, BOTH };

class Graph;
using GraphPtr = std::shared_ptr<Graph>;

/**
 * @brief Iteration primitives of the storage backend consumed by the leaf steps of a traversal.
 * Implementations have to be safe for concurrent reads.
 */
class Graph {
  public:
    virtual ~Graph() = default;

    /**
     * @brief Returns all vertices of the graph.
     */
    [[nodiscard]] virtual std::vector<Vertex> vertices() const = 0;

    /**
     * @brief Returns the vertices adjacent to the given vertex, one entry per traversed edge.
     * @param vertex the current vertex
     * @param direction OUT follows outgoing edges, IN incoming edges and BOTH both of them
     * @param edgeLabels restricts the traversed edges to these labels, an empty vector means all labels
     * @return the adjacent vertices
     */
    [[nodiscard]] virtual std::vector<Vertex>
    adjacent(const Vertex& vertex, Direction direction, const std::vector<std::string>& edgeLabels) const = 0;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_STRUCTURE_GRAPH_HPP_

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

#ifndef GTC_CORE_TESTS_INCLUDE_UTIL_TESTGRAPH_HPP_
#define GTC_CORE_TESTS_INCLUDE_UTIL_TESTGRAPH_HPP_

#include <Structure/Graph.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace GTC::Testing {

class TestGraph;
using TestGraphPtr = std::shared_ptr<TestGraph>;

/**
 * @brief In-memory graph backed by an edge list. Vertices are 1..n.
 */
class TestGraph : public Graph {
  public:
    struct Edge {
        uint64_t from;
        uint64_t to;
        std::string label;
    };

    explicit TestGraph(uint64_t numberOfVertices) : numberOfVertices(numberOfVertices) {}

    static TestGraphPtr create(uint64_t numberOfVertices) { return std::make_shared<TestGraph>(numberOfVertices); }

    TestGraph& addEdge(uint64_t from, uint64_t to, const std::string& label = "knows") {
        edges.push_back({from, to, label});
        return *this;
    }

    [[nodiscard]] std::vector<Vertex> vertices() const override {
        std::vector<Vertex> result;
        for (uint64_t id = 1; id <= numberOfVertices; ++id) {
            result.push_back(Vertex{id});
        }
        return result;
    }

    [[nodiscard]] std::vector<Vertex>
    adjacent(const Vertex& vertex, Direction direction, const std::vector<std::string>& edgeLabels) const override {
        std::vector<Vertex> result;
        for (const auto& edge : edges) {
            if (!edgeLabels.empty() && std::find(edgeLabels.begin(), edgeLabels.end(), edge.label) == edgeLabels.end()) {
                continue;
            }
            if (direction != Direction::IN && edge.from == vertex.id) {
                result.push_back(Vertex{edge.to});
            }
            if (direction != Direction::OUT && edge.to == vertex.id) {
                result.push_back(Vertex{edge.from});
            }
        }
        return result;
    }

    /**
     * @brief The "modern" toy graph: 1 knows 2 and 4, 1 created 3, 4 created 3 and 5, 6 created 3.
     */
    static TestGraphPtr createModern() {
        auto graph = create(6);
        graph->addEdge(1, 2, "knows").addEdge(1, 4, "knows").addEdge(1, 3, "created");
        graph->addEdge(4, 3, "created").addEdge(4, 5, "created").addEdge(6, 3, "created");
        return graph;
    }

  private:
    uint64_t numberOfVertices;
    std::vector<Edge> edges;
};

}// namespace GTC::Testing

#endif// GTC_CORE_TESTS_INCLUDE_UTIL_TESTGRAPH_HPP_

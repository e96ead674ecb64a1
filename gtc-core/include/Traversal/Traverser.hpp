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

#ifndef GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSER_HPP_
#define GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSER_HPP_

#include <Structure/Value.hpp>
#include <Traversal/Scope.hpp>
#include <Traversal/SideEffects.hpp>
#include <Traversal/TraversalForwardRefs.hpp>
#include <Traversal/TraverserRequirement.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace GTC {

/**
 * @brief The history of a traverser. Each entry is a value together with the labels of the steps that produced it.
 */
class Path {
  public:
    struct Entry {
        Value value;
        std::set<std::string> labels;
    };

    void extend(Value value, const std::set<std::string>& labels);

    /**
     * @brief Adds labels to the most recent entry.
     */
    void addLabels(const std::set<std::string>& labels);

    [[nodiscard]] bool hasLabel(const std::string& label) const;

    /**
     * @brief Returns the value bound to label, the first or the last binding depending on pop.
     */
    [[nodiscard]] std::optional<Value> get(Pop pop, const std::string& label) const;

    [[nodiscard]] const std::vector<Entry>& entries() const;

    [[nodiscard]] size_t size() const;

    [[nodiscard]] bool isEmpty() const;

    std::string toString() const;

  private:
    std::vector<Entry> pathEntries;
};

/**
 * @brief The execution token that flows through a compiled traversal.
 * Which fields are retained follows the requirements of the traversal the traverser was created for:
 * with PATH every step extends the path, with LABELED_PATH only labelled steps do, otherwise no history is kept.
 */
class Traverser {
  public:
    enum class PathRetention : uint8_t { NONE, LABELED, FULL };

    Traverser(Value value, PathRetention retention, SideEffectsPtr sideEffects, uint64_t bulk);

    /**
     * @brief Creates a traverser carrying exactly the fields demanded by the requirements.
     */
    static TraverserPtr create(Value value, const TraverserRequirements& requirements, SideEffectsPtr sideEffects, uint64_t bulk = 1);

    static PathRetention toPathRetention(const TraverserRequirements& requirements);

    [[nodiscard]] const Value& get() const;

    void set(Value newValue);

    [[nodiscard]] uint64_t getBulk() const;

    void setBulk(uint64_t newBulk);

    [[nodiscard]] const Path& getPath() const;

    [[nodiscard]] PathRetention getPathRetention() const;

    [[nodiscard]] const SideEffectsPtr& getSideEffects() const;

    /**
     * @brief Records the labels of the step the traverser just left.
     */
    void addLabels(const std::set<std::string>& labels);

    /**
     * @brief Derives a traverser with a new value, e.g., the output of a map step. The path is extended when it is retained.
     */
    [[nodiscard]] TraverserPtr split(Value newValue) const;

    /**
     * @brief Derives an identical traverser, e.g., to hand it to a child traversal.
     */
    [[nodiscard]] TraverserPtr split() const;

    std::string toString() const;

  private:
    Value value;
    PathRetention pathRetention;
    Path path;
    SideEffectsPtr sideEffects;
    uint64_t bulk;
};

}// namespace GTC

#endif// GTC_CORE_INCLUDE_TRAVERSAL_TRAVERSER_HPP_

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

#include <Traversal/Traverser.hpp>
#include <algorithm>
#include <sstream>

namespace GTC {

void Path::extend(Value value, const std::set<std::string>& labels) { pathEntries.push_back(Entry{std::move(value), labels}); }

void Path::addLabels(const std::set<std::string>& labels) {
    if (pathEntries.empty()) {
        return;
    }
    pathEntries.back().labels.insert(labels.begin(), labels.end());
}

bool Path::hasLabel(const std::string& label) const {
    return std::any_of(pathEntries.begin(), pathEntries.end(), [&label](const Entry& entry) {
        return entry.labels.contains(label);
    });
}

std::optional<Value> Path::get(Pop pop, const std::string& label) const {
    if (pop == Pop::FIRST) {
        for (const auto& entry : pathEntries) {
            if (entry.labels.contains(label)) {
                return entry.value;
            }
        }
    } else {
        for (auto it = pathEntries.rbegin(); it != pathEntries.rend(); ++it) {
            if (it->labels.contains(label)) {
                return it->value;
            }
        }
    }
    return std::nullopt;
}

const std::vector<Path::Entry>& Path::entries() const { return pathEntries; }

size_t Path::size() const { return pathEntries.size(); }

bool Path::isEmpty() const { return pathEntries.empty(); }

std::string Path::toString() const {
    std::stringstream ss;
    ss << "path[";
    for (size_t i = 0; i < pathEntries.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << GTC::toString(pathEntries[i].value);
    }
    ss << "]";
    return ss.str();
}

Traverser::Traverser(Value value, PathRetention retention, SideEffectsPtr sideEffects, uint64_t bulk)
    : value(std::move(value)), pathRetention(retention), sideEffects(std::move(sideEffects)), bulk(bulk) {
    if (pathRetention == PathRetention::FULL) {
        path.extend(this->value, {});
    }
}

Traverser::PathRetention Traverser::toPathRetention(const TraverserRequirements& requirements) {
    if (requirements.contains(TraverserRequirement::PATH)) {
        return PathRetention::FULL;
    }
    if (requirements.contains(TraverserRequirement::LABELED_PATH)) {
        return PathRetention::LABELED;
    }
    return PathRetention::NONE;
}

TraverserPtr
Traverser::create(Value value, const TraverserRequirements& requirements, SideEffectsPtr sideEffects, uint64_t bulk) {
    if (!requirements.contains(TraverserRequirement::SIDE_EFFECTS)) {
        sideEffects = nullptr;
    }
    if (!requirements.contains(TraverserRequirement::BULK)) {
        bulk = 1;
    }
    return std::make_shared<Traverser>(std::move(value), toPathRetention(requirements), std::move(sideEffects), bulk);
}

const Value& Traverser::get() const { return value; }

void Traverser::set(Value newValue) { value = std::move(newValue); }

uint64_t Traverser::getBulk() const { return bulk; }

void Traverser::setBulk(uint64_t newBulk) { bulk = newBulk; }

const Path& Traverser::getPath() const { return path; }

Traverser::PathRetention Traverser::getPathRetention() const { return pathRetention; }

const SideEffectsPtr& Traverser::getSideEffects() const { return sideEffects; }

void Traverser::addLabels(const std::set<std::string>& labels) {
    if (labels.empty()) {
        return;
    }
    switch (pathRetention) {
        case PathRetention::FULL: path.addLabels(labels); break;
        case PathRetention::LABELED: path.extend(value, labels); break;
        case PathRetention::NONE: break;
    }
}

TraverserPtr Traverser::split(Value newValue) const {
    auto child = std::make_shared<Traverser>(*this);
    child->value = std::move(newValue);
    if (pathRetention == PathRetention::FULL) {
        child->path.extend(child->value, {});
    }
    return child;
}

TraverserPtr Traverser::split() const { return std::make_shared<Traverser>(*this); }

std::string Traverser::toString() const {
    std::stringstream ss;
    ss << GTC::toString(value);
    if (bulk != 1) {
        ss << "x" << bulk;
    }
    return ss.str();
}

}// namespace GTC

#include <butterfly/network_graph.hpp>
#include <algorithm>
#include <queue>

namespace butterfly {

const std::vector<OrganismId> NetworkGraph::empty_neighbors_{};

OrganismId NetworkGraph::add_organism() {
    OrganismId id = next_id_++;
    organism_to_index_[id] = organisms_.size();
    organisms_.push_back(id);
    adjacency_[id] = {};
    return id;
}

bool NetworkGraph::connect(OrganismId x, OrganismId y) {
    if (x == y || !has_organism(x) || !has_organism(y) || connected(x, y)) {
        return false;
    }
    adjacency_[x].push_back(y);
    adjacency_[y].push_back(x);
    ++connection_count_;
    return true;
}

bool NetworkGraph::disconnect(OrganismId x, OrganismId y) {
    if (!connected(x, y)) {
        return false;
    }
    auto& lx = adjacency_[x];
    lx.erase(std::remove(lx.begin(), lx.end(), y), lx.end());
    auto& ly = adjacency_[y];
    ly.erase(std::remove(ly.begin(), ly.end(), x), ly.end());
    --connection_count_;
    return true;
}

bool NetworkGraph::has_organism(OrganismId id) const {
    return adjacency_.count(id) > 0;
}

bool NetworkGraph::connected(OrganismId x, OrganismId y) const {
    auto it = adjacency_.find(x);
    if (it == adjacency_.end()) return false;
    // Degrees are capped small, linear scan is fine
    return std::find(it->second.begin(), it->second.end(), y) != it->second.end();
}

const std::vector<OrganismId>& NetworkGraph::neighbors(OrganismId id) const {
    auto it = adjacency_.find(id);
    if (it != adjacency_.end()) {
        return it->second;
    }
    return empty_neighbors_;
}

size_t NetworkGraph::max_degree() const {
    size_t result = 0;
    for (const auto& [id, list] : adjacency_) {
        result = std::max(result, list.size());
    }
    return result;
}

std::vector<Connection> NetworkGraph::connections() const {
    std::vector<Connection> result;
    result.reserve(connection_count_);
    for (OrganismId id : organisms_) {
        for (OrganismId other : neighbors(id)) {
            if (id < other) {
                result.emplace_back(id, other);
            }
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t NetworkGraph::index_of(OrganismId id) const {
    auto it = organism_to_index_.find(id);
    return it != organism_to_index_.end() ? it->second : organisms_.size();
}

std::vector<int> NetworkGraph::distances_from(OrganismId source) const {
    std::vector<int> result(organisms_.size(), -1);
    if (!has_organism(source)) return result;

    std::queue<OrganismId> q;
    result[index_of(source)] = 0;
    q.push(source);

    while (!q.empty()) {
        OrganismId curr = q.front();
        q.pop();
        int next_dist = result[index_of(curr)] + 1;

        for (OrganismId next : neighbors(curr)) {
            size_t idx = index_of(next);
            if (result[idx] < 0) {
                result[idx] = next_dist;
                q.push(next);
            }
        }
    }

    return result;
}

std::vector<std::vector<OrganismId>> NetworkGraph::components() const {
    std::vector<std::vector<OrganismId>> result;
    std::vector<bool> visited(organisms_.size(), false);

    for (size_t start = 0; start < organisms_.size(); ++start) {
        if (visited[start]) continue;

        std::vector<OrganismId> component;
        std::queue<OrganismId> q;
        visited[start] = true;
        q.push(organisms_[start]);

        while (!q.empty()) {
            OrganismId curr = q.front();
            q.pop();
            component.push_back(curr);
            for (OrganismId next : neighbors(curr)) {
                size_t idx = index_of(next);
                if (!visited[idx]) {
                    visited[idx] = true;
                    q.push(next);
                }
            }
        }

        std::sort(component.begin(), component.end());
        result.push_back(std::move(component));
    }

    return result;
}

} // namespace butterfly

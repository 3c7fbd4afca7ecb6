#ifndef BUTTERFLY_NETWORK_GRAPH_HPP
#define BUTTERFLY_NETWORK_GRAPH_HPP

#include <butterfly/types.hpp>
#include <unordered_map>
#include <utility>
#include <vector>

namespace butterfly {

// Undirected connection, stored with a < b
struct Connection {
    OrganismId a;
    OrganismId b;

    Connection(OrganismId x, OrganismId y)
        : a(x < y ? x : y), b(x < y ? y : x) {}

    bool operator==(const Connection& o) const { return a == o.a && b == o.b; }
    bool operator<(const Connection& o) const {
        if (a != o.a) return a < o.a;
        return b < o.b;
    }
};

/**
 * Undirected simple graph of organisms.
 * No self loops, no parallel connections. Organism ids are handed out in
 * increasing order, so organisms() is always sorted, which keeps iteration
 * (and therefore seeded evolution) deterministic.
 */
class NetworkGraph {
public:
    NetworkGraph() = default;

    OrganismId add_organism();

    // False for self loops, unknown organisms, or an existing connection
    bool connect(OrganismId x, OrganismId y);
    bool disconnect(OrganismId x, OrganismId y);

    bool has_organism(OrganismId id) const;
    bool connected(OrganismId x, OrganismId y) const;

    const std::vector<OrganismId>& neighbors(OrganismId id) const;
    size_t degree(OrganismId id) const { return neighbors(id).size(); }
    size_t max_degree() const;

    const std::vector<OrganismId>& organisms() const { return organisms_; }
    size_t organism_count() const { return organisms_.size(); }
    size_t connection_count() const { return connection_count_; }

    // Sorted list of all connections
    std::vector<Connection> connections() const;

    // Position of an organism in organisms(), for dense per-organism arrays
    size_t index_of(OrganismId id) const;

    // BFS hop counts from source, indexed like organisms(); -1 = unreachable
    std::vector<int> distances_from(OrganismId source) const;

    // Connected components as lists of organism ids
    std::vector<std::vector<OrganismId>> components() const;

private:
    std::vector<OrganismId> organisms_;
    std::unordered_map<OrganismId, std::vector<OrganismId>> adjacency_;
    std::unordered_map<OrganismId, size_t> organism_to_index_;
    size_t connection_count_ = 0;
    OrganismId next_id_ = 0;
    static const std::vector<OrganismId> empty_neighbors_;
};

} // namespace butterfly

#endif // BUTTERFLY_NETWORK_GRAPH_HPP

//
// disjoint_sets.hpp
// Union-find used to merge similar pairs into groups
//

#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace simgroup {

// Union-find over dense indices; union by size, path halving on find.
class DisjointSets {
public:
    size_t add()
    {
        const size_t index = m_parent.size();
        m_parent.push_back(index);
        m_size.push_back(1);
        return index;
    }

    size_t find(size_t x)
    {
        while (m_parent[x] != x) {
            m_parent[x] = m_parent[m_parent[x]];
            x = m_parent[x];
        }
        return x;
    }

    // Returns false when both were already in the same set
    bool unite(size_t a, size_t b)
    {
        size_t ra = find(a);
        size_t rb = find(b);
        if (ra == rb) return false;

        if (m_size[ra] < m_size[rb]) std::swap(ra, rb);
        m_parent[rb] = ra;
        m_size[ra] += m_size[rb];
        return true;
    }

    size_t setSize(size_t x) { return m_size[find(x)]; }

    size_t size() const { return m_parent.size(); }

private:
    std::vector<size_t> m_parent;
    std::vector<size_t> m_size;
};

} // namespace simgroup

#include "ShapeGrouping.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <utility>

namespace pix {

DisjointSet::DisjointSet(std::size_t size) : m_parent(size), m_rank(size, 0) {
  std::iota(m_parent.begin(), m_parent.end(), 0);
}

std::size_t DisjointSet::find(std::size_t x) {
  // Path halving
  while (m_parent[x] != x) {
    m_parent[x] = m_parent[m_parent[x]];
    x = m_parent[x];
  }
  return x;
}

bool DisjointSet::merge(std::size_t x, std::size_t y) {
  std::size_t rootX = find(x);
  std::size_t rootY = find(y);
  if (rootX == rootY) {
    return false;
  }

  if (m_rank[rootX] < m_rank[rootY]) {
    std::swap(rootX, rootY);
  }
  m_parent[rootY] = rootX;
  if (m_rank[rootX] == m_rank[rootY]) {
    m_rank[rootX]++;
  }
  return true;
}

bool sameClip(const std::optional<BBox> &a, const std::optional<BBox> &b) {
  if (!a || !b) {
    return !a && !b;
  }
  return nearlyEqual(*a, *b);
}

std::vector<ShapeGroup> groupShapes(const std::vector<ShapeCandidate> &candidates,
                                    double margin) {
  std::vector<ShapeGroup> groups;
  const std::size_t n = candidates.size();
  if (n == 0) {
    return groups;
  }

  DisjointSet sets(n);
  for (std::size_t i = 0; i < n; i++) {
    for (std::size_t j = i + 1; j < n; j++) {
      const ShapeCandidate &a = candidates[i];
      const ShapeCandidate &b = candidates[j];
      if (a.kind == b.kind && sameClip(a.clip, b.clip) &&
          overlaps(a.bbox, b.bbox, margin)) {
        sets.merge(i, j);
      }
    }
  }

  std::map<std::size_t, std::vector<std::size_t>> components;
  for (std::size_t i = 0; i < n; i++) {
    components[sets.find(i)].push_back(i);
  }

  for (auto &entry : components) {
    std::vector<std::size_t> &indices = entry.second;
    std::sort(indices.begin(), indices.end(),
              [&candidates](std::size_t x, std::size_t y) {
                return candidates[x].opIndex < candidates[y].opIndex;
              });

    ShapeGroup group;
    group.kind = candidates[indices.front()].kind;
    group.clip = candidates[indices.front()].clip;
    group.bbox = candidates[indices.front()].bbox;
    for (std::size_t index : indices) {
      group.bbox = unite(group.bbox, candidates[index].bbox);
      group.members.push_back(candidates[index]);
    }
    groups.push_back(std::move(group));
  }

  // Discovery order: the paint op that first touched each group
  std::sort(groups.begin(), groups.end(),
            [](const ShapeGroup &a, const ShapeGroup &b) {
              return a.members.front().opIndex < b.members.front().opIndex;
            });
  return groups;
}

std::vector<ShapeGroup> filterGroups(std::vector<ShapeGroup> groups,
                                     double minDimension) {
  groups.erase(std::remove_if(groups.begin(), groups.end(),
                              [minDimension](const ShapeGroup &group) {
                                return group.bbox.width() < minDimension &&
                                       group.bbox.height() < minDimension;
                              }),
               groups.end());
  return groups;
}

} // namespace pix

#ifndef MBPI_GRAPH_KINEMATIC_GRAPH_H_
#define MBPI_GRAPH_KINEMATIC_GRAPH_H_

#include <utility>
#include <vector>

#include <boost/graph/adjacency_list.hpp>

namespace mbpi {
namespace graph {

/// Directed parent -> child graph over the links of one model.
class KinematicGraph
{
public:
  typedef std::pair<int, int> Edge;  // (parent, child)
  using G = boost::adjacency_list<boost::vecS, boost::vecS, boost::bidirectionalS>;
  using V = G::vertex_descriptor;

  KinematicGraph(int num_vertices, std::vector<Edge>&& edges);

  int numVertices() const;
  int inDegree(int v) const;

  std::vector<int> parents(int v) const;
  std::vector<int> children(int v) const;

  /// Vertices without a parent, in increasing index order.
  std::vector<int> roots() const;

  /// Parents before children. Returns false if the graph has a cycle.
  bool topologicalOrder(std::vector<int>& order) const;

private:
  std::vector<Edge> edges;
  G g;
};

}  // namespace graph
}  // namespace mbpi

#endif  // MBPI_GRAPH_KINEMATIC_GRAPH_H_

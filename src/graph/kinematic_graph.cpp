#include <mbpi/graph/kinematic_graph.h>

#include <algorithm>
#include <iterator>

#include <boost/graph/graph_traits.hpp>
#include <boost/graph/topological_sort.hpp>

namespace mbpi {
namespace graph {

KinematicGraph::KinematicGraph(int num_vertices, std::vector<Edge>&& edges) : edges(std::move(edges))
{
  g = G(this->edges.begin(), this->edges.end(), static_cast<G::vertices_size_type>(num_vertices));
}

int KinematicGraph::numVertices() const
{
  return static_cast<int>(boost::num_vertices(g));
}

int KinematicGraph::inDegree(int v) const
{
  return static_cast<int>(boost::in_degree(boost::vertex(v, g), g));
}

std::vector<int> KinematicGraph::parents(int v) const
{
  std::vector<int> out;
  boost::graph_traits<G>::in_edge_iterator ei, ei_end;
  for (boost::tie(ei, ei_end) = boost::in_edges(boost::vertex(v, g), g); ei != ei_end; ++ei)
    out.push_back(static_cast<int>(boost::source(*ei, g)));
  return out;
}

std::vector<int> KinematicGraph::children(int v) const
{
  std::vector<int> out;
  boost::graph_traits<G>::out_edge_iterator ei, ei_end;
  for (boost::tie(ei, ei_end) = boost::out_edges(boost::vertex(v, g), g); ei != ei_end; ++ei)
    out.push_back(static_cast<int>(boost::target(*ei, g)));
  return out;
}

std::vector<int> KinematicGraph::roots() const
{
  std::vector<int> out;
  boost::graph_traits<G>::vertex_iterator vi, vi_end;
  for (boost::tie(vi, vi_end) = boost::vertices(g); vi != vi_end; ++vi)
  {
    if (boost::in_degree(*vi, g) == 0)
      out.push_back(static_cast<int>(*vi));
  }
  return out;
}

bool KinematicGraph::topologicalOrder(std::vector<int>& order) const
{
  std::vector<V> reversed;
  try
  {
    boost::topological_sort(g, std::back_inserter(reversed));
  }
  catch (const boost::not_a_dag&)
  {
    return false;
  }

  // topological_sort emits children before parents.
  order.assign(reversed.rbegin(), reversed.rend());
  return true;
}

}  // namespace graph
}  // namespace mbpi

#include <mbpi/multibody/state_space.h>

#include <ostream>
#include <stdexcept>
#include <string>

namespace mbpi {
namespace multibody {

int numPositions(const FloatingBaseSpace& space)
{
  return space.n_joints + FLOATING_BASE_POSITIONS;
}

int numPositions(const FixedBaseSpace& space)
{
  return space.n_joints;
}

int numPositions(const ProductSpace& space)
{
  int nq = 0;
  for (const auto& factor : space.factors)
    nq += numPositions(factor);
  return nq;
}

int numPositions(const FactorSpace& space)
{
  return std::visit([](const auto& s) { return numPositions(s); }, space);
}

int numPositions(const StateSpace& space)
{
  return std::visit([](const auto& s) { return numPositions(s); }, space);
}

int numVelocities(const FloatingBaseSpace& space)
{
  return space.n_joints + FLOATING_BASE_VELOCITIES;
}

int numVelocities(const FixedBaseSpace& space)
{
  return space.n_joints;
}

int numVelocities(const ProductSpace& space)
{
  int nv = 0;
  for (const auto& factor : space.factors)
    nv += numVelocities(factor);
  return nv;
}

int numVelocities(const FactorSpace& space)
{
  return std::visit([](const auto& s) { return numVelocities(s); }, space);
}

int numVelocities(const StateSpace& space)
{
  return std::visit([](const auto& s) { return numVelocities(s); }, space);
}

int numStates(const StateSpace& space)
{
  return numPositions(space) + numVelocities(space);
}

std::vector<FactorOffset> factorOffsets(const ProductSpace& space)
{
  std::vector<FactorOffset> offsets;
  offsets.reserve(space.factors.size());

  int q_offset = 0;
  int v_offset = 0;
  for (const auto& factor : space.factors)
  {
    FactorOffset off;
    off.q_offset = q_offset;
    off.v_offset = v_offset;
    off.nq = numPositions(factor);
    off.nv = numVelocities(factor);
    offsets.push_back(off);

    q_offset += off.nq;
    v_offset += off.nv;
  }
  return offsets;
}

namespace {

void fillZeroPositions(const FactorSpace& factor, Eigen::Ref<Eigen::VectorXd> q)
{
  q.setZero();
  if (std::holds_alternative<FloatingBaseSpace>(factor))
    q(0) = 1.0;  // quaternion w
}

}  // namespace

Eigen::VectorXd zeroState(const StateSpace& space)
{
  Eigen::VectorXd x = Eigen::VectorXd::Zero(numStates(space));

  if (const auto* product = std::get_if<ProductSpace>(&space))
  {
    const auto offsets = factorOffsets(*product);
    for (std::size_t i = 0; i < offsets.size(); ++i)
      fillZeroPositions(product->factors[i], x.segment(offsets[i].q_offset, offsets[i].nq));
  }
  else if (const auto* floating = std::get_if<FloatingBaseSpace>(&space))
  {
    fillZeroPositions(*floating, x.head(numPositions(*floating)));
  }
  return x;
}

std::pair<Eigen::VectorXd, Eigen::VectorXd> splitState(const StateSpace& space, const Eigen::VectorXd& x)
{
  const int nq = numPositions(space);
  const int nv = numVelocities(space);
  if (x.size() != nq + nv)
    throw std::invalid_argument("State has size " + std::to_string(x.size()) + ", expected " +
                                std::to_string(nq + nv) + " (nq=" + std::to_string(nq) +
                                ", nv=" + std::to_string(nv) + ")");

  return { x.head(nq), x.tail(nv) };
}

Eigen::VectorXd joinState(const StateSpace& space, const Eigen::VectorXd& q, const Eigen::VectorXd& v)
{
  const int nq = numPositions(space);
  const int nv = numVelocities(space);
  if (q.size() != nq || v.size() != nv)
    throw std::invalid_argument("Positions/velocities have sizes " + std::to_string(q.size()) + "/" +
                                std::to_string(v.size()) + ", expected " + std::to_string(nq) + "/" +
                                std::to_string(nv));

  Eigen::VectorXd x(nq + nv);
  x << q, v;
  return x;
}

bool operator==(const FloatingBaseSpace& a, const FloatingBaseSpace& b)
{
  return a.n_joints == b.n_joints;
}

bool operator==(const FixedBaseSpace& a, const FixedBaseSpace& b)
{
  return a.n_joints == b.n_joints;
}

bool operator==(const ProductSpace& a, const ProductSpace& b)
{
  return a.factors == b.factors;
}

std::ostream& operator<<(std::ostream& os, const FloatingBaseSpace& space)
{
  return os << "FloatingBaseSpace(" << space.n_joints << ")";
}

std::ostream& operator<<(std::ostream& os, const FixedBaseSpace& space)
{
  return os << "FixedBaseSpace(" << space.n_joints << ")";
}

std::ostream& operator<<(std::ostream& os, const ProductSpace& space)
{
  os << "ProductSpace[";
  for (std::size_t i = 0; i < space.factors.size(); ++i)
  {
    if (i)
      os << ", ";
    std::visit([&os](const auto& s) { os << s; }, space.factors[i]);
  }
  return os << "]";
}

}  // namespace multibody
}  // namespace mbpi

#ifndef MBPI_MULTIBODY_STATE_SPACE_H_
#define MBPI_MULTIBODY_STATE_SPACE_H_

#include <iosfwd>
#include <utility>
#include <variant>
#include <vector>

#include <Eigen/Core>

namespace mbpi {
namespace multibody {

constexpr int FLOATING_BASE_POSITIONS = 7;   // quaternion (w, x, y, z) + translation
constexpr int FLOATING_BASE_VELOCITIES = 6;  // angular + linear

// clang-format off
/*
| Space             | q                              | v                             |
|-------------------|--------------------------------|-------------------------------|
| FloatingBaseSpace | [quat wxyz, p xyz, joints] n+7 | [omega xyz, v xyz, joints] n+6|
| FixedBaseSpace    | [joints] n                     | [joints] n                    |
| ProductSpace      | [q_0, q_1, ...]                | [v_0, v_1, ...]               |

The full state is always x = [q; v].
*/
// clang-format on

struct FloatingBaseSpace
{
  int n_joints = 0;
};

struct FixedBaseSpace
{
  int n_joints = 0;
};

using FactorSpace = std::variant<FloatingBaseSpace, FixedBaseSpace>;

// Concatenation of per-model-instance spaces. Factor order mirrors the order the
// simulator lays out its state vector, world pseudo-instance (zero DOF) first.
struct ProductSpace
{
  std::vector<FactorSpace> factors;
};

using StateSpace = std::variant<FloatingBaseSpace, FixedBaseSpace, ProductSpace>;

// Where a factor's positions and velocities start inside the product's q and v.
struct FactorOffset
{
  int q_offset = 0;
  int nq = 0;
  int v_offset = 0;
  int nv = 0;
};

int numPositions(const FloatingBaseSpace& space);
int numPositions(const FixedBaseSpace& space);
int numPositions(const ProductSpace& space);
int numPositions(const FactorSpace& space);
int numPositions(const StateSpace& space);

int numVelocities(const FloatingBaseSpace& space);
int numVelocities(const FixedBaseSpace& space);
int numVelocities(const ProductSpace& space);
int numVelocities(const FactorSpace& space);
int numVelocities(const StateSpace& space);

int numStates(const StateSpace& space);

std::vector<FactorOffset> factorOffsets(const ProductSpace& space);

// Identity quaternion for floating bases, zeros everywhere else.
Eigen::VectorXd zeroState(const StateSpace& space);

// Splits x into (q, v). Throws std::invalid_argument on size mismatch.
std::pair<Eigen::VectorXd, Eigen::VectorXd> splitState(const StateSpace& space, const Eigen::VectorXd& x);

// Inverse of splitState().
Eigen::VectorXd joinState(const StateSpace& space, const Eigen::VectorXd& q, const Eigen::VectorXd& v);

bool operator==(const FloatingBaseSpace& a, const FloatingBaseSpace& b);
bool operator==(const FixedBaseSpace& a, const FixedBaseSpace& b);
bool operator==(const ProductSpace& a, const ProductSpace& b);

std::ostream& operator<<(std::ostream& os, const FloatingBaseSpace& space);
std::ostream& operator<<(std::ostream& os, const FixedBaseSpace& space);
std::ostream& operator<<(std::ostream& os, const ProductSpace& space);

}  // namespace multibody
}  // namespace mbpi

#endif  // MBPI_MULTIBODY_STATE_SPACE_H_

#ifndef MBPI_GEOMETRY_INERTIA_H_
#define MBPI_GEOMETRY_INERTIA_H_

#include <Eigen/Core>

namespace mbpi {
namespace geometry {

constexpr int PI_SIZE = 10;

// pi = [m, m*px, m*py, m*pz, Ixx, Iyy, Izz, Ixy, Ixz, Iyz]
//
// p is the center of mass expressed in the body frame B, I is the rotational
// inertia about the body origin Bo, expressed in B.
using PiVector = Eigen::Matrix<double, PI_SIZE, 1>;

// Six independent entries of a symmetric inertia tensor, ordered
// [Ixx, Iyy, Izz, Ixy, Ixz, Iyz].
using InertiaEntries = Eigen::Matrix<double, 6, 1>;

// Inertial properties the way a URDF <inertial> element stores them: the
// inertia is taken about the center of mass.
struct UrdfInertial
{
  double mass = 0.0;
  Eigen::Vector3d center_of_mass = Eigen::Vector3d::Zero();
  InertiaEntries inertia = InertiaEntries::Zero();
};

Eigen::Matrix3d inertiaMatrix(const InertiaEntries& entries);
InertiaEntries inertiaEntries(const Eigen::Matrix3d& inertia);

/**
 * Converts a pi row to URDF inertial properties.
 *
 * The rotational inertia is shifted from the body origin to the center of mass
 * with the parallel axis theorem.
 *
 * @throws std::invalid_argument if the mass is zero or not finite.
 */
UrdfInertial piToUrdf(const PiVector& pi);

/// Inverse of piToUrdf().
PiVector urdfToPi(const UrdfInertial& inertial);

}  // namespace geometry
}  // namespace mbpi

#endif  // MBPI_GEOMETRY_INERTIA_H_

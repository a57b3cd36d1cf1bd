#include <mbpi/geometry/inertia.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include <mbpi/conversion.h>

namespace mbpi {
namespace geometry {

namespace {

// m * (|p|^2 * Id - p * p^T)
Eigen::Matrix3d parallelAxisTerm(double mass, const Eigen::Vector3d& p)
{
  return mass * (p.squaredNorm() * Eigen::Matrix3d::Identity() - p * p.transpose());
}

}  // namespace

Eigen::Matrix3d inertiaMatrix(const InertiaEntries& entries)
{
  Eigen::Matrix3d I;
  // clang-format off
  I << entries(0), entries(3), entries(4),
       entries(3), entries(1), entries(5),
       entries(4), entries(5), entries(2);
  // clang-format on
  return I;
}

InertiaEntries inertiaEntries(const Eigen::Matrix3d& inertia)
{
  InertiaEntries entries;
  entries << inertia(0, 0), inertia(1, 1), inertia(2, 2), inertia(0, 1), inertia(0, 2), inertia(1, 2);
  return entries;
}

UrdfInertial piToUrdf(const PiVector& pi)
{
  const double mass = pi(0);
  if (mass == 0.0 || !std::isfinite(mass))
    throw std::invalid_argument("pi parameterization has non-invertible mass: " + formatDouble(mass));

  UrdfInertial inertial;
  inertial.mass = mass;
  inertial.center_of_mass = pi.segment<3>(1) / mass;

  const Eigen::Matrix3d I_BBo_B = inertiaMatrix(pi.tail<6>());
  const Eigen::Matrix3d I_BBcm_B = I_BBo_B - parallelAxisTerm(mass, inertial.center_of_mass);
  inertial.inertia = inertiaEntries(I_BBcm_B);
  return inertial;
}

PiVector urdfToPi(const UrdfInertial& inertial)
{
  const Eigen::Matrix3d I_BBcm_B = inertiaMatrix(inertial.inertia);
  const Eigen::Matrix3d I_BBo_B = I_BBcm_B + parallelAxisTerm(inertial.mass, inertial.center_of_mass);

  PiVector pi;
  pi(0) = inertial.mass;
  pi.segment<3>(1) = inertial.mass * inertial.center_of_mass;
  pi.tail<6>() = inertiaEntries(I_BBo_B);
  return pi;
}

}  // namespace geometry
}  // namespace mbpi

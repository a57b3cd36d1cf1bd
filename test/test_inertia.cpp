#include <mbpi/geometry/inertia.h>

#include <stdexcept>

#include <gtest/gtest.h>

using namespace mbpi::geometry;

TEST(Inertia, MatrixEntriesOrder)
{
  InertiaEntries e;
  e << 1, 2, 3, 4, 5, 6;  // ixx iyy izz ixy ixz iyz

  Eigen::Matrix3d I = inertiaMatrix(e);
  EXPECT_EQ(1, I(0, 0));
  EXPECT_EQ(2, I(1, 1));
  EXPECT_EQ(3, I(2, 2));
  EXPECT_EQ(4, I(0, 1));
  EXPECT_EQ(4, I(1, 0));
  EXPECT_EQ(5, I(0, 2));
  EXPECT_EQ(6, I(2, 1));

  EXPECT_TRUE(inertiaEntries(I).isApprox(e));
}

TEST(Inertia, CenteredBodyPassesThrough)
{
  PiVector pi;
  pi << 2.0, 0, 0, 0, 0.1, 0.2, 0.3, 0, 0, 0;

  UrdfInertial urdf = piToUrdf(pi);
  EXPECT_DOUBLE_EQ(2.0, urdf.mass);
  EXPECT_TRUE(urdf.center_of_mass.isZero());
  EXPECT_NEAR(0.1, urdf.inertia(0), 1e-15);
  EXPECT_NEAR(0.2, urdf.inertia(1), 1e-15);
  EXPECT_NEAR(0.3, urdf.inertia(2), 1e-15);
}

TEST(Inertia, ParallelAxisShift)
{
  // Point mass 2 kg at (1, 0, 0): inertia about the origin is diag(0, 2, 2).
  PiVector pi;
  pi << 2.0, 2.0, 0, 0, 0, 2.0, 2.0, 0, 0, 0;

  UrdfInertial urdf = piToUrdf(pi);
  EXPECT_DOUBLE_EQ(1.0, urdf.center_of_mass.x());
  EXPECT_NEAR(0.0, urdf.inertia.norm(), 1e-12);
}

TEST(Inertia, RoundTrip)
{
  UrdfInertial in;
  in.mass = 1.7;
  in.center_of_mass = Eigen::Vector3d(0.1, -0.2, 0.05);
  in.inertia << 0.01, 0.02, 0.015, 0.001, -0.002, 0.0005;

  UrdfInertial out = piToUrdf(urdfToPi(in));
  EXPECT_NEAR(in.mass, out.mass, 1e-12);
  EXPECT_TRUE(in.center_of_mass.isApprox(out.center_of_mass, 1e-12));
  EXPECT_NEAR(0.0, (in.inertia - out.inertia).norm(), 1e-12);
}

TEST(Inertia, ZeroMassThrows)
{
  PiVector pi = PiVector::Zero();
  try
  {
    piToUrdf(pi);
    FAIL() << "expected std::invalid_argument";
  }
  catch (const std::invalid_argument& e)
  {
    EXPECT_NE(std::string::npos, std::string(e.what()).find("mass: 0.0"));
  }
}

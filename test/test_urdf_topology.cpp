#include <mbpi/multibody/urdf_topology.h>

#include <gtest/gtest.h>

#include <mbpi/errors.h>
#include <mbpi/multibody/body_registry.h>
#include <mbpi/multibody/state_space_builder.h>

using namespace mbpi;
using namespace mbpi::multibody;
using mbpi::xml::UrdfSource;
using mbpi::xml::UrdfTemplates;

static const char* CUBE_URDF = R"(<?xml version="1.0"?>
<robot name="cube">
  <link name="body"/>
</robot>)";

static const char* ARM_URDF = R"(<?xml version="1.0"?>
<robot name="arm">
  <link name="world"/>
  <link name="base"/>
  <link name="link1"/>
  <link name="link2"/>
  <joint name="weld" type="fixed"><parent link="world"/><child link="base"/></joint>
  <joint name="shoulder" type="revolute"><parent link="base"/><child link="link1"/></joint>
  <joint name="elbow" type="continuous"><parent link="link1"/><child link="link2"/></joint>
</robot>)";

TEST(UrdfTopology, InstancesAndBodies)
{
  UrdfMultibodyTopology topology({ { "cube", UrdfSource::fromText(CUBE_URDF) },
                                   { "arm", UrdfSource::fromText(ARM_URDF) } });

  auto instances = topology.modelInstances();
  ASSERT_EQ(3u, instances.size());
  EXPECT_EQ(WORLD_MODEL_INSTANCE_NAME, topology.modelInstanceName(WORLD_MODEL_INSTANCE));
  EXPECT_EQ(1, topology.modelInstanceByName("cube"));
  EXPECT_EQ(2, topology.modelInstanceByName("arm"));

  EXPECT_EQ(5, topology.numBodies());
  EXPECT_EQ(WORLD_BODY_NAME, topology.bodyName(WORLD_BODY));

  auto arm_bodies = topology.bodies(2);
  ASSERT_EQ(3u, arm_bodies.size());
  EXPECT_EQ("base", topology.bodyName(arm_bodies[0]));
  EXPECT_EQ("link2", topology.bodyName(arm_bodies[2]));
  EXPECT_EQ(2, topology.bodyModelInstance(arm_bodies[1]));

  EXPECT_TRUE(topology.hasUniqueFreeBaseBody(1));
  EXPECT_EQ("body", topology.bodyName(topology.uniqueFreeBaseBody(1)));
  EXPECT_FALSE(topology.hasUniqueFreeBaseBody(2));
  EXPECT_THROW(topology.uniqueFreeBaseBody(2), ConfigurationError);

  EXPECT_EQ(7, topology.numPositions(1));
  EXPECT_EQ(6, topology.numVelocities(1));
  EXPECT_EQ(2, topology.numPositions(2));
  EXPECT_EQ(9, topology.totalPositions());
  EXPECT_EQ(8, topology.totalVelocities());
}

TEST(UrdfTopology, StateSpaceAndIdentifiers)
{
  UrdfMultibodyTopology topology({ { "cube", UrdfSource::fromText(CUBE_URDF) },
                                   { "arm", UrdfSource::fromText(ARM_URDF) } });

  ProductSpace space = buildStateSpace(topology);
  ASSERT_EQ(3u, space.factors.size());
  EXPECT_TRUE(FactorSpace(FixedBaseSpace{ 0 }) == space.factors[0]);
  EXPECT_TRUE(FactorSpace(FloatingBaseSpace{ 0 }) == space.factors[1]);
  EXPECT_TRUE(FactorSpace(FixedBaseSpace{ 2 }) == space.factors[2]);
  EXPECT_EQ(topology.totalPositions(), numPositions(space));

  BodyIdentifierList ids(enumerateInertialBodies(topology));
  EXPECT_EQ(std::vector<std::string>({ "cube_body", "arm_base", "arm_link1", "arm_link2" }), ids.ids());
}

TEST(UrdfTopology, FloatingJointToWorld)
{
  const char* urdf = R"(
  <robot name="drone">
    <link name="frame"/>
    <link name="rotor"/>
    <joint name="free" type="floating"><parent link="world"/><child link="frame"/></joint>
    <joint name="spin" type="continuous"><parent link="frame"/><child link="rotor"/></joint>
  </robot>)";
  UrdfMultibodyTopology topology({ { "drone", UrdfSource::fromText(urdf) } });

  EXPECT_EQ(8, topology.numPositions(1));
  EXPECT_EQ(7, topology.numVelocities(1));
  EXPECT_TRUE(FactorSpace(FloatingBaseSpace{ 1 }) == buildFactorSpace(topology, 1));
}

TEST(UrdfTopology, DuplicateModelName)
{
  EXPECT_THROW(UrdfMultibodyTopology({ { "cube", UrdfSource::fromText(CUBE_URDF) },
                                       { "cube", UrdfSource::fromText(CUBE_URDF) } }),
               ConfigurationError);
}

TEST(UrdfTopology, MalformedKinematics)
{
  const char* unknown_link = R"(
  <robot name="r">
    <link name="a"/>
    <joint name="j" type="revolute"><parent link="a"/><child link="ghost"/></joint>
  </robot>)";
  EXPECT_THROW(UrdfMultibodyTopology({ { "r", UrdfSource::fromText(unknown_link) } }), LookupError);

  const char* two_parents = R"(
  <robot name="r">
    <link name="a"/><link name="b"/><link name="c"/>
    <joint name="j1" type="fixed"><parent link="a"/><child link="c"/></joint>
    <joint name="j2" type="fixed"><parent link="b"/><child link="c"/></joint>
  </robot>)";
  EXPECT_THROW(UrdfMultibodyTopology({ { "r", UrdfSource::fromText(two_parents) } }), ConfigurationError);

  const char* bad_type = R"(
  <robot name="r">
    <link name="a"/><link name="b"/>
    <joint name="j" type="spherical"><parent link="a"/><child link="b"/></joint>
  </robot>)";
  EXPECT_THROW(UrdfMultibodyTopology({ { "r", UrdfSource::fromText(bad_type) } }), ConfigurationError);

  EXPECT_THROW(UrdfMultibodyTopology({ { "r", UrdfSource::fromText("<model/>") } }), std::runtime_error);
}

TEST(UrdfTopology, IndexOutOfRange)
{
  UrdfMultibodyTopology topology({ { "cube", UrdfSource::fromText(CUBE_URDF) } });
  EXPECT_THROW(topology.modelInstanceName(5), LookupError);
  EXPECT_THROW(topology.bodyName(-1), LookupError);
  EXPECT_THROW(topology.modelInstanceByName("sphere"), LookupError);
}

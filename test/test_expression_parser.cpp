#include <mbpi/xml/expression_parser.h>

#include <cmath>

#include <gtest/gtest.h>

using namespace mbpi::xml;

TEST(ExpressionParser, BareMath)
{
  EXPECT_NEAR(evalBareMath("1 + 2 * 3"), 7.0, 1e-12);
  EXPECT_NEAR(evalBareMath("pi / 2"), M_PI / 2, 1e-12);
  EXPECT_NEAR(evalBareMath("0.5e-3"), 0.0005, 1e-15);
  EXPECT_TRUE(std::isinf(evalBareMath("inf")));
  EXPECT_THROW((void)evalBareMath("1 +"), std::runtime_error);
}

TEST(ExpressionParser, NumberAttributes)
{
  const char* xml = R"(
  <robot name="r">
    <link name="l">
      <inertial>
        <mass value="2 * 0.75"/>
        <inertia ixx="1/12" iyy="bogus +"/>
      </inertial>
    </link>
  </robot>)";
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(xml), tinyxml2::XML_SUCCESS);
  auto* inertial = doc.RootElement()->FirstChildElement("link")->FirstChildElement("inertial");
  auto* mass = inertial->FirstChildElement("mass");
  auto* inertia = inertial->FirstChildElement("inertia");

  EXPECT_NEAR(evalNumberAttributeRequired(mass, "value"), 1.5, 1e-12);
  EXPECT_NEAR(evalNumberAttribute(inertia, "ixx", 0.0), 1.0 / 12.0, 1e-12);
  EXPECT_EQ(evalNumberAttribute(inertia, "izz", -1.0), -1.0);
  EXPECT_EQ(evalNumberAttribute(nullptr, "izz", 3.0), 3.0);

  EXPECT_THROW((void)evalNumberAttributeRequired(inertia, "izz"), std::runtime_error);
  EXPECT_THROW((void)evalNumberAttribute(inertia, "iyy", 0.0), std::runtime_error);
}

TEST(ExpressionParser, Vector3Attributes)
{
  const char* xml = R"(<link><origin xyz="0.1 -2 pi" rpy="0 0"/></link>)";
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(xml), tinyxml2::XML_SUCCESS);
  auto* origin = doc.RootElement()->FirstChildElement("origin");

  Eigen::Vector3d xyz = evalVector3Attribute(origin, "xyz", Eigen::Vector3d::Zero());
  EXPECT_NEAR(xyz.x(), 0.1, 1e-12);
  EXPECT_NEAR(xyz.y(), -2.0, 1e-12);
  EXPECT_NEAR(xyz.z(), M_PI, 1e-12);

  EXPECT_THROW((void)evalVector3Attribute(origin, "rpy", Eigen::Vector3d::Zero()), std::runtime_error);
  EXPECT_TRUE(evalVector3Attribute(origin, "abc", Eigen::Vector3d::Ones()).isOnes());
}

TEST(ExpressionParser, TextAttributes)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(R"(<joint name="j1"/>)"), tinyxml2::XML_SUCCESS);
  EXPECT_EQ("j1", evalTextAttributeRequired(doc.RootElement(), "name"));
  EXPECT_THROW((void)evalTextAttributeRequired(doc.RootElement(), "type"), std::runtime_error);
}

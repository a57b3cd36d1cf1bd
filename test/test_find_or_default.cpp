#include <mbpi/xml/find_or_default.h>

#include <stdexcept>

#include <gtest/gtest.h>

#include <mbpi/xml/utils.h>

using namespace mbpi::xml;

static std::vector<std::string> childTags(const tinyxml2::XMLElement* elem)
{
  std::vector<std::string> tags;
  for (const auto* kid = elem->FirstChildElement(); kid; kid = kid->NextSiblingElement())
    tags.emplace_back(kid->Name());
  return tags;
}

TEST(FindOrDefault, ReturnsExistingChild)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(R"(<link name="l"><inertial><mass value="3"/></inertial></link>)"), tinyxml2::XML_SUCCESS);
  auto* link = doc.RootElement();

  ResolvedElement inertial = findOrDefault(link, UrdfElementType::Inertial);
  EXPECT_FALSE(inertial.synthesized);
  EXPECT_EQ(link->FirstChildElement("inertial"), inertial.element);

  // Existing elements are not completed with missing children.
  EXPECT_EQ(std::vector<std::string>{ "mass" }, childTags(inertial.element));
  EXPECT_STREQ("3", findOrDefault(inertial.element, UrdfElementType::Mass).element->Attribute("value"));
}

TEST(FindOrDefault, SynthesizesDefaultSubtree)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(R"(<link name="l"/>)"), tinyxml2::XML_SUCCESS);
  auto* link = doc.RootElement();

  ResolvedElement inertial = findOrDefault(link, UrdfElementType::Inertial);
  ASSERT_TRUE(inertial.synthesized);
  EXPECT_EQ(std::vector<std::string>({ "origin", "mass", "inertia" }), childTags(inertial.element));

  auto* origin = inertial.element->FirstChildElement("origin");
  EXPECT_STREQ("0. 0. 0.", origin->Attribute("xyz"));
  EXPECT_STREQ("0. 0. 0.", origin->Attribute("rpy"));
  EXPECT_STREQ("0.", inertial.element->FirstChildElement("mass")->Attribute("value"));

  auto* inertia = inertial.element->FirstChildElement("inertia");
  for (const char* name : INERTIA_ATTRIBUTES)
    EXPECT_STREQ("0.", inertia->Attribute(name)) << name;

  ResolvedElement collision = findOrDefault(link, UrdfElementType::Collision);
  ASSERT_TRUE(collision.synthesized);
  EXPECT_EQ(std::vector<std::string>({ "geometry", "origin" }), childTags(collision.element));
  EXPECT_EQ(nullptr, collision.element->FirstChildElement("geometry")->FirstChildElement());
}

TEST(FindOrDefault, Idempotent)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(R"(<link name="l"/>)"), tinyxml2::XML_SUCCESS);
  auto* link = doc.RootElement();

  ResolvedElement first = findOrDefault(link, UrdfElementType::Collision);
  const std::string after_first = printElement(link);
  ResolvedElement second = findOrDefault(link, UrdfElementType::Collision);

  EXPECT_EQ(first.element, second.element);
  EXPECT_FALSE(second.synthesized);
  EXPECT_EQ(after_first, printElement(link));
  EXPECT_EQ(1, countChildren(link, UrdfElementType::Collision));
}

TEST(FindOrDefault, FirstOfSeveral)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(R"(<link><collision name="a"/><collision name="b"/></link>)"), tinyxml2::XML_SUCCESS);

  ResolvedElement found = findOrDefault(doc.RootElement(), UrdfElementType::Collision);
  EXPECT_STREQ("a", found.element->Attribute("name"));
  EXPECT_EQ(2, countChildren(doc.RootElement(), UrdfElementType::Collision));
}

TEST(FindOrDefault, ShapeDefaults)
{
  tinyxml2::XMLDocument doc;
  auto* cylinder = generateDefaultElement(doc, UrdfElementType::Cylinder);
  EXPECT_STREQ("cylinder", cylinder->Name());
  EXPECT_STREQ("0.", cylinder->Attribute("radius"));
  EXPECT_STREQ("0.", cylinder->Attribute("length"));
  doc.InsertEndChild(cylinder);
}

TEST(UrdfSchema, TagNamesRoundTrip)
{
  for (UrdfElementType type : { UrdfElementType::Origin, UrdfElementType::Mass, UrdfElementType::Inertia,
                                UrdfElementType::Inertial, UrdfElementType::Geometry, UrdfElementType::Collision,
                                UrdfElementType::Box, UrdfElementType::Sphere, UrdfElementType::Cylinder })
  {
    auto parsed = elementTypeFromTag(tagName(type));
    ASSERT_TRUE(parsed.has_value()) << tagName(type);
    EXPECT_EQ(type, *parsed);
  }

  EXPECT_FALSE(elementTypeFromTag("mesh").has_value());
  EXPECT_FALSE(elementTypeFromTag("Inertial").has_value());
  EXPECT_FALSE(elementTypeFromTag("").has_value());
}

TEST(FindOrDefault, NullParentThrows)
{
  EXPECT_THROW(findOrDefault(nullptr, UrdfElementType::Mass), std::invalid_argument);
}

#include <mbpi/xml/urdf_serializer.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>

#include <mbpi/errors.h>
#include <mbpi/geometry/inertia.h>
#include <mbpi/xml/link_parameterizer.h>
#include <mbpi/xml/urdf_schema.h>
#include <mbpi/xml/utils.h>

namespace mbpi {
namespace xml {

namespace {

bool envFlag(const char* name)
{
  const char* raw = std::getenv(name);
  if (!raw)
    return false;
  std::string v(raw);
  std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
  return v == "1" || v == "true" || v == "on" || v == "yes";
}

void checkParameterShape(const MultibodyParameterization& params)
{
  if (params.pi.rows() != static_cast<Eigen::Index>(params.body_ids.size()) || params.pi.cols() != geometry::PI_SIZE)
    throw ConfigurationError("Parameter matrix is " + std::to_string(params.pi.rows()) + "x" +
                             std::to_string(params.pi.cols()) + ", expected " +
                             std::to_string(params.body_ids.size()) + "x" + std::to_string(geometry::PI_SIZE));
}

std::vector<const geometry::CollisionGeometry*> bodyGeometries(const MultibodyParameterization& params,
                                                               const std::string& body_id)
{
  std::vector<const geometry::CollisionGeometry*> out;

  auto it = params.geometry_body_assignment.find(body_id);
  if (it == params.geometry_body_assignment.end())
    return out;

  for (std::size_t index : it->second)
  {
    if (index >= params.geometries.size())
      throw LookupError("Body '" + body_id + "' is assigned geometry " + std::to_string(index) + ", but only " +
                        std::to_string(params.geometries.size()) + " geometries exist");
    out.push_back(&params.geometries[index]);
  }
  return out;
}

}  // namespace

SerializerOptions SerializerOptions::fromEnvironment()
{
  SerializerOptions options;
  options.verify_link_bijection = envFlag("MBPI_VERIFY_LINK_NAMES");
  return options;
}

void verifyLinkBijection(const tinyxml2::XMLElement* robot, multibody::ModelInstanceIndex instance,
                         const multibody::MultibodyTopology& topology)
{
  const std::string& instance_name = topology.modelInstanceName(instance);

  std::map<std::string, int> body_matches;
  for (multibody::BodyIndex body : topology.bodies(instance))
    body_matches.emplace(topology.bodyName(body), 0);

  std::vector<const tinyxml2::XMLElement*> links;
  collectElements(robot, tags::LINK, links);
  for (const auto* link : links)
  {
    const char* name = link->Attribute(attrs::NAME);
    if (!name)
      throw ConfigurationError("Model '" + instance_name + "' has a <link> without a name (line " +
                               std::to_string(link->GetLineNum()) + ")");
    if (std::string(name) == multibody::WORLD_BODY_NAME)
      continue;

    auto it = body_matches.find(name);
    if (it == body_matches.end())
      throw ConfigurationError("Link '" + std::string(name) + "' does not name a body of model instance '" +
                               instance_name + "'");
    if (++it->second > 1)
      throw ConfigurationError("Link '" + std::string(name) + "' appears more than once in model '" + instance_name +
                               "'");
  }

  for (const auto& [body_name, count] : body_matches)
    if (count == 0)
      throw ConfigurationError("Body '" + body_name + "' of model instance '" + instance_name + "' has no <link>");
}

std::string representModelAsUrdf(const std::string& model_name, const UrdfSource& source,
                                 const MultibodyParameterization& params,
                                 const multibody::MultibodyTopology& topology, const SerializerOptions& options)
{
  checkParameterShape(params);

  // Assumes the template name mirrors the model instance name.
  const multibody::ModelInstanceIndex instance = topology.modelInstanceByName(model_name);
  const std::string& instance_name = topology.modelInstanceName(instance);

  auto doc = loadUrdfDocument(source, options.model_path.empty() ? nullptr : options.model_path.c_str());
  tinyxml2::XMLElement* robot = doc->RootElement();

  if (options.verify_link_bijection)
    verifyLinkBijection(robot, instance, topology);

  std::vector<tinyxml2::XMLElement*> links;
  collectElements(robot, tags::LINK, links);
  for (tinyxml2::XMLElement* link : links)
  {
    const char* link_name = link->Attribute(attrs::NAME);
    if (!link_name)
      continue;

    const std::string body_id = multibody::uniqueBodyIdentifier(instance_name, link_name);
    const auto row = params.body_ids.indexOf(body_id);
    if (!row)
      continue;  // no inertial parameters, e.g. the world body

    const geometry::PiVector pi = params.pi.row(static_cast<Eigen::Index>(*row)).transpose();
    fillLinkWithParameterization(link, pi, bodyGeometries(params, body_id));
  }

  return std::string(URDF_DECLARATION) + "\n" + printElement(robot);
}

UrdfDocuments representMultibodyAsUrdfs(const UrdfTemplates& urdfs, const MultibodyParameterization& params,
                                        const multibody::MultibodyTopology& topology,
                                        const SerializerOptions& options)
{
  UrdfDocuments out;
  out.reserve(urdfs.size());
  for (const auto& [model_name, source] : urdfs)
    out.emplace_back(model_name, representModelAsUrdf(model_name, source, params, topology, options));
  return out;
}

void writeUrdfs(const UrdfDocuments& urdfs, const std::string& directory)
{
  std::filesystem::create_directories(directory);
  for (const auto& [model_name, urdf] : urdfs)
  {
    const std::filesystem::path path = std::filesystem::path(directory) / (model_name + ".urdf");
    std::ofstream out(path);
    if (!out)
      throw std::runtime_error("Failed to open " + path.string() + " for writing");
    out << urdf;
    if (!out)
      throw std::runtime_error("Failed to write " + path.string());
  }
}

}  // namespace xml
}  // namespace mbpi

#include <mbpi/xml/expression_parser.h>

#include <limits>
#include <stdexcept>
#include <string>

#include <mbpi/conversion.h>

#include "muParser.h"

namespace mbpi {
namespace xml {

namespace {

constexpr long double kPiL = 3.141592653589793238462643383279502884L;

void register_math_symbols(mu::Parser& parser)
{
  using Real = mu::value_type;

  parser.DefineConst("pi", static_cast<Real>(kPiL));
  parser.DefineConst("inf", std::numeric_limits<Real>::infinity());
  parser.DefineConst("nan", std::numeric_limits<Real>::quiet_NaN());
}

mu::Parser& get_math_parser()
{
  // One parser per thread, initialized once
  thread_local mu::Parser parser = [] {
    mu::Parser p;
    register_math_symbols(p);
    return p;
  }();
  return parser;
}

std::string where(const tinyxml2::XMLElement* elem)
{
  return std::string("<") + (elem ? elem->Name() : "?") + "> at line " +
         std::to_string(elem ? elem->GetLineNum() : 0);
}

}  // namespace

double evalBareMath(const char* expr)
{
  if (!expr)
    throw std::runtime_error("Expression string is null.");

  try
  {
    mu::Parser& parser = get_math_parser();  // reuse per-thread instance
    parser.SetExpr(expr);
    return parser.Eval();
  }
  catch (mu::Parser::exception_type& e)
  {
    throw std::runtime_error(std::string("Error parsing expression '") + expr + "': " + e.GetMsg());
  }
}

double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' on " + where(elem));
  return evalBareMath(expr);
}

double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback)
{
  const char* expr = elem ? elem->Attribute(attr) : nullptr;
  if (!expr)
    return fallback;
  return evalBareMath(expr);
}

Eigen::Vector3d evalVector3Attribute(const tinyxml2::XMLElement* elem, const char* attr,
                                     const Eigen::Vector3d& fallback)
{
  const char* raw = elem ? elem->Attribute(attr) : nullptr;
  if (!raw)
    return fallback;

  const auto tokens = splitWhitespace(raw);
  if (tokens.size() != 3)
    throw std::runtime_error(std::string("Attribute '") + attr + "' on " + where(elem) + " must hold 3 values, got '" +
                             raw + "'");

  Eigen::Vector3d v;
  for (int i = 0; i < 3; ++i)
    v(i) = evalBareMath(tokens[i].c_str());
  return v;
}

std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr)
{
  const char* text = elem ? elem->Attribute(attr) : nullptr;
  if (!text)
    throw std::runtime_error(std::string("Missing required attribute '") + attr + "' on " + where(elem));
  return text;
}

}  // namespace xml
}  // namespace mbpi

#ifndef MBPI_XML_EXPRESSION_PARSER_H_
#define MBPI_XML_EXPRESSION_PARSER_H_

#include <string>

#include <tinyxml2.h>
#include <Eigen/Core>

namespace mbpi {
namespace xml {

/// Evaluates a bare math expression ("0.5", "1/12*0.1", "pi/2").
double evalBareMath(const char* expr);

/// Numbers
double evalNumberAttribute(const tinyxml2::XMLElement* elem, const char* attr, double fallback);
double evalNumberAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);

/// Whitespace-separated triplets ("0 0.1 -2"), each entry an expression.
Eigen::Vector3d evalVector3Attribute(const tinyxml2::XMLElement* elem, const char* attr,
                                     const Eigen::Vector3d& fallback);

/// Text
std::string evalTextAttributeRequired(const tinyxml2::XMLElement* elem, const char* attr);

}  // namespace xml
}  // namespace mbpi

#endif  // MBPI_XML_EXPRESSION_PARSER_H_

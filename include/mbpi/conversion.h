#ifndef MBPI_CONVERSION_H_
#define MBPI_CONVERSION_H_

#include <string>
#include <vector>

#include <Eigen/Core>

namespace mbpi {

/*
Decimal form of a double, as written into URDF attributes.

    2.0      -> "2.0"
    5.1      -> "5.1"
    0.1+0.2  -> "0.30000000000000004"
    1e-5     -> "1e-05"
    1e16     -> "1e+16"

The mantissa is the shortest digit string that parses back to the same double.
Integral values keep a trailing ".0". Scientific notation is used only when the
decimal exponent is < -4 or >= 16.
*/
std::string formatDouble(double value);

// Space-joined formatDouble() of each entry, in order.
std::string joinDoubles(const std::vector<double>& values);
std::string joinDoubles(const Eigen::Ref<const Eigen::VectorXd>& values);

std::vector<std::string> splitWhitespace(const std::string& text);

}  // namespace mbpi

#endif  // MBPI_CONVERSION_H_

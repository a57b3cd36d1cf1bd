#include <mbpi/conversion.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace mbpi {

namespace {

constexpr int MAX_DOUBLE_DIGITS = 17;

// Shortest "%e" rendering of value that round-trips, split into its significant
// digits (no dot, no trailing zeros) and its decimal exponent.
void shortestDigits(double value, std::string& digits, int& exponent)
{
  char buf[40];
  for (int precision = 1; precision <= MAX_DOUBLE_DIGITS; ++precision)
  {
    std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
    if (std::strtod(buf, nullptr) == value)
      break;
  }

  const std::string s(buf);
  const std::size_t epos = s.find('e');
  exponent = std::atoi(s.c_str() + epos + 1);

  digits.clear();
  for (std::size_t i = 0; i < epos; ++i)
    if (std::isdigit(static_cast<unsigned char>(s[i])))
      digits.push_back(s[i]);

  while (digits.size() > 1 && digits.back() == '0')
    digits.pop_back();
}

}  // namespace

std::string formatDouble(double value)
{
  if (std::isnan(value))
    return "nan";
  if (std::isinf(value))
    return value < 0 ? "-inf" : "inf";
  if (value == 0.0)
    return std::signbit(value) ? "-0.0" : "0.0";

  const bool negative = value < 0;
  std::string digits;
  int exponent = 0;
  shortestDigits(std::fabs(value), digits, exponent);

  std::string out;
  if (exponent < -4 || exponent >= 16)
  {
    out = digits.substr(0, 1);
    if (digits.size() > 1)
      out += "." + digits.substr(1);

    char ebuf[8];
    std::snprintf(ebuf, sizeof(ebuf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    out += ebuf;
  }
  else if (exponent < 0)
  {
    out = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
  }
  else
  {
    const std::size_t int_len = static_cast<std::size_t>(exponent) + 1;
    if (digits.size() <= int_len)
      out = digits + std::string(int_len - digits.size(), '0') + ".0";
    else
      out = digits.substr(0, int_len) + "." + digits.substr(int_len);
  }

  return negative ? "-" + out : out;
}

std::string joinDoubles(const std::vector<double>& values)
{
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i)
  {
    if (i)
      out += ' ';
    out += formatDouble(values[i]);
  }
  return out;
}

std::string joinDoubles(const Eigen::Ref<const Eigen::VectorXd>& values)
{
  return joinDoubles(std::vector<double>(values.data(), values.data() + values.size()));
}

std::vector<std::string> splitWhitespace(const std::string& text)
{
  std::vector<std::string> tokens;
  std::istringstream iss(text);
  std::string token;
  while (iss >> token)
    tokens.push_back(token);
  return tokens;
}

}  // namespace mbpi

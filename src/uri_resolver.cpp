#include <mbpi/uri_resolver.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#define MBPI_PATH_SEP ';'
#else
#define MBPI_PATH_SEP ':'
#endif

namespace {

constexpr const char* MODEL_SCHEME = "model://";
constexpr const char* FILE_SCHEME = "file://";

// ---------- small helpers (internal) ----------

std::vector<std::string> split_roots(const std::string& roots)
{
  std::vector<std::string> out;
  std::string cur;
  for (char c : roots)
  {
    if (c == MBPI_PATH_SEP)
    {
      if (!cur.empty())
        out.push_back(cur), cur.clear();
    }
    else
      cur.push_back(c);
  }
  if (!cur.empty())
    out.push_back(cur);
  return out;
}

bool starts_with(const std::string& s, const char* prefix)
{
  return s.rfind(prefix, 0) == 0;
}

bool has_scheme(const std::string& u)
{
  auto p = u.find("://");
  return p != std::string::npos && p > 0;
}

// prevent path traversal; keep generic separators
std::string sanitize_relpath(const std::string& rel)
{
  std::filesystem::path p = rel;
  std::filesystem::path clean;
  for (auto& part : p)
  {
    if (part == ".." || part == "." || part == "/")
      continue;
    clean /= part;
  }
  return clean.generic_string();
}

std::string strip_file_uri(const std::string& u)
{
  const std::string rest = u.substr(std::string(FILE_SCHEME).size());
  return (!rest.empty() && rest[0] == '/') ? rest : ("/" + rest);
}

}  // anonymous namespace

// ---------- public API ----------
namespace mbpi {

Resolved resolve_model_uri(const std::string& uri, const std::string& current_dir, const char* env_roots)
{
  if (uri.empty())
    throw std::runtime_error("Empty model URI");

  if (starts_with(uri, FILE_SCHEME))
    return { std::filesystem::weakly_canonical(strip_file_uri(uri)).string(), "" };

  if (!starts_with(uri, MODEL_SCHEME))
  {
    if (has_scheme(uri))
      throw std::runtime_error("Unsupported URI scheme: " + uri);

    // Plain path (absolute or relative to current_dir)
    std::filesystem::path p(uri);
    if (p.is_relative() && !current_dir.empty())
      p = std::filesystem::path(current_dir) / p;
    return { std::filesystem::weakly_canonical(p).string(), "" };
  }

  // model://... → search roots
  const char* roots_c = env_roots ? env_roots : std::getenv("MBPI_MODEL_PATH");
  if (!roots_c || std::string(roots_c).empty())
    throw std::runtime_error("MBPI_MODEL_PATH not set (use ':' or ';' to separate multiple roots).");

  std::string rel = sanitize_relpath(uri.substr(std::string(MODEL_SCHEME).size()));
  for (const auto& root : split_roots(roots_c))
  {
    std::filesystem::path candidate = std::filesystem::path(root) / rel;
    if (std::filesystem::exists(candidate))
      return { std::filesystem::weakly_canonical(candidate).string(), root };
  }

  throw std::runtime_error("model:// resource not found in any root: " + uri);
}

}  // namespace mbpi

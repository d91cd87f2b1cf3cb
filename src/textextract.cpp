#include "textextract.h"
#include "cutils.h"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace {
  constexpr std::array<std::string_view, 16> kPlainTextExtensions = {
    "txt", "md", "rs", "ts", "tsx", "js", "py", "toml", "yaml", "yml", "json", "sh", "css", "html", "csv", "rtf"
  };
}

bool PlainTextExtractor::isPlainTextExtension(const std::string &ext)
{
  return std::find(kPlainTextExtensions.begin(), kPlainTextExtensions.end(), ext) != kPlainTextExtensions.end();
}

std::string PlainTextExtractor::extractText(const std::string &path, size_t maxChars) const
{
  std::string ext = std::filesystem::path(path).extension().string();
  if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
  ext = utils::toLower(ext);

  if (!isPlainTextExtension(ext)) {
    throw std::runtime_error("Unsupported format: " + ext);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open file: " + path);
  }
  // A UTF-8 character is at most 4 bytes.
  std::string content;
  content.resize(maxChars * 4);
  file.read(content.data(), static_cast<std::streamsize>(content.size()));
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path);
  }
  content.resize(static_cast<size_t>(file.gcount()));
  return utils::utf8Prefix(content, maxChars);
}

#ifndef _TEXTEXTRACT_H_
#define _TEXTEXTRACT_H_

#include <string>

// File -> plain text, bounded to `maxChars` characters. Throws on failure.
class TextExtractor {
public:
  virtual ~TextExtractor() = default;
  virtual std::string extractText(const std::string &path, size_t maxChars) const = 0;
};

// Handles text-based formats directly. Binary document formats need an
// external decoder and are reported as unsupported.
class PlainTextExtractor : public TextExtractor {
public:
  std::string extractText(const std::string &path, size_t maxChars) const override;

  static bool isPlainTextExtension(const std::string &ext);
};

#endif // _TEXTEXTRACT_H_
